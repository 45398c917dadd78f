#include "phrasecheck/http_util.hpp"

#include <httplib.h>

namespace phrasecheck {

void enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void send_json(httplib::Response& res, const json& body, int status) {
    res.status = status;
    res.set_content(body.dump(2), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& error,
                const std::string& details) {
    json err;
    err["error"] = error;
    if (!details.empty()) err["details"] = details;
    send_json(res, err, status);
}

} // namespace phrasecheck
