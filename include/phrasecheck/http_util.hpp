#pragma once

#include <string>

#include "types.hpp"

namespace httplib {
    struct Request;
    struct Response;
}

namespace phrasecheck {

void enable_cors(httplib::Response& res);

void send_json(httplib::Response& res, const json& body, int status = 200);

void send_error(httplib::Response& res, int status, const std::string& error,
                const std::string& details = "");

} // namespace phrasecheck
