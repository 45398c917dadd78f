#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <httplib.h>

#include "phrasecheck/config.hpp"
#include "phrasecheck/correction_applier.hpp"
#include "phrasecheck/engine.hpp"
#include "phrasecheck/env_loader.hpp"
#include "phrasecheck/event_channel.hpp"
#include "phrasecheck/http_util.hpp"
#include "phrasecheck/input_assembler.hpp"
#include "phrasecheck/key_listener.hpp"
#include "phrasecheck/keyword_source.hpp"
#include "phrasecheck/timeout_scheduler.hpp"

using phrasecheck::json;

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: phrasecheck_server [CONFIG_JSON]\n"
                  << "Example: phrasecheck_server ./config.json\n";
        return 1;
    }

    std::filesystem::path config_path = argc >= 2 ? argv[1] : "config.json";
    phrasecheck::Config cfg = phrasecheck::load_config(config_path);

    // .env overrides (PHRASECHECK_KEYWORDS, PHRASECHECK_PORT, PHRASECHECK_MIN_SIMILARITY)
    auto env_vars = phrasecheck::load_env_file(".env");
    phrasecheck::apply_env_overrides(cfg, env_vars);

    phrasecheck::Engine engine(cfg);
    phrasecheck::FileKeywordSource keywords(cfg.keywords_path);
    if (!engine.reload(keywords)) {
        std::cerr << "[warning] no keywords loaded from " << cfg.keywords_path
                  << "; suggestions stay empty until POST /api/reload succeeds\n";
    }

    phrasecheck::EventChannel<phrasecheck::SuggestionReady> suggestions;
    phrasecheck::EventChannel<phrasecheck::ApplyCorrection> corrections;
    phrasecheck::QueuedCorrectionApplier applier(corrections);

    // timeouts.stop() runs before the assembler goes out of scope
    phrasecheck::TimeoutScheduler timeouts;
    phrasecheck::InputAssembler assembler(engine, cfg, suggestions, applier, &timeouts);
    phrasecheck::KeyListener listener(assembler);
    if (!listener.start()) {
        timeouts.stop();
        return 1;
    }

    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
        }
        res.status = 500;
        res.set_content(R"({"error":"internal server error"})", "application/json");
    });

    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::cerr << "[error] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    // CORS preflight handler (OPTIONS) for all routes
    svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        res.status = 204;
    });

    svr.Get("/api/health", [&](const httplib::Request&, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        json j = engine.stats();
        j["ok"] = true;
        j["state"] = phrasecheck::state_name(assembler.state());
        j["listener"] = listener.running();
        phrasecheck::send_json(res, j);
    });

    svr.Get("/api/config", [&](const httplib::Request&, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        phrasecheck::send_json(res, engine.config().to_json());
    });

    // Key events from the OS keyboard hook
    svr.Post("/api/keys", [&](const httplib::Request& req, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        try {
            json body = json::parse(req.body);
            if (!body.contains("keys") || !body["keys"].is_array()) {
                phrasecheck::send_error(res, 400, "missing or invalid 'keys' array");
                return;
            }

            int accepted = 0;
            for (const auto& k : body["keys"]) {
                if (!k.is_string()) continue;
                if (listener.post(phrasecheck::KeyEvent{k.get<std::string>()})) accepted++;
            }

            json out;
            out["accepted"] = accepted;
            phrasecheck::send_json(res, out);
        } catch (const json::parse_error& e) {
            phrasecheck::send_error(res, 400, "invalid JSON in request body", e.what());
        }
    });

    // Suggestions for the popup process and correction requests for the injector
    svr.Get("/api/events", [&](const httplib::Request& req, httplib::Response& res) {
        phrasecheck::enable_cors(res);

        int wait_ms = 0;
        if (req.has_param("wait_ms")) {
            try {
                wait_ms = std::max(0, std::min(std::stoi(req.get_param_value("wait_ms")), 30000));
            } catch (const std::exception&) {
                phrasecheck::send_error(res, 400, "wait_ms must be an integer");
                return;
            }
        }

        json out;
        out["events"] = json::array();

        if (wait_ms > 0 && suggestions.size() == 0 && corrections.size() == 0) {
            auto first = suggestions.pop_for(std::chrono::milliseconds(wait_ms));
            if (first) out["events"].push_back(phrasecheck::to_json(*first));
        }
        for (const auto& ev : suggestions.drain()) out["events"].push_back(phrasecheck::to_json(ev));
        for (const auto& ev : corrections.drain()) out["events"].push_back(phrasecheck::to_json(ev));

        phrasecheck::send_json(res, out);
    });

    svr.Post("/api/resolve", [&](const httplib::Request& req, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        try {
            json body = json::parse(req.body);
            if (!body.contains("id") || !body["id"].is_number_unsigned()) {
                phrasecheck::send_error(res, 400, "missing or invalid 'id' field");
                return;
            }
            std::string action = body.value("action", std::string());
            uint64_t id = body["id"].get<uint64_t>();

            bool resolved = false;
            if (action == "accept") {
                if (!body.contains("correction") || !body["correction"].is_string()) {
                    phrasecheck::send_error(res, 400, "accept requires a 'correction' string");
                    return;
                }
                resolved = assembler.accept(id, body["correction"].get<std::string>());
            } else if (action == "ignore") {
                resolved = assembler.ignore(id);
            } else if (action == "timeout") {
                resolved = assembler.expire(id);
            } else {
                phrasecheck::send_error(res, 400, "action must be 'accept', 'ignore' or 'timeout'");
                return;
            }

            json out;
            out["resolved"] = resolved;
            out["id"] = id;
            phrasecheck::send_json(res, out, resolved ? 200 : 409);
        } catch (const json::exception& e) {
            phrasecheck::send_error(res, 400, "invalid JSON in request body", e.what());
        }
    });

    svr.Post("/api/force_resubmit", [&](const httplib::Request&, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        // Keys already posted belong to the window being resubmitted
        listener.wait_idle();
        json out;
        out["emitted"] = assembler.force_resubmit();
        phrasecheck::send_json(res, out);
    });

    // Outcome reported by the injector; logged only, never retried
    svr.Post("/api/apply_result", [&](const httplib::Request& req, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        try {
            json body = json::parse(req.body);
            uint64_t id = body.value("id", (uint64_t)0);
            bool ok = body.value("ok", false);
            if (ok) {
                std::cout << "[apply] correction #" << id << " applied\n";
            } else {
                std::cerr << "[apply] correction #" << id << " failed: "
                          << body.value("error", std::string("unknown error")) << "\n";
            }
            json out;
            out["logged"] = true;
            phrasecheck::send_json(res, out);
        } catch (const json::exception& e) {
            phrasecheck::send_error(res, 400, "invalid JSON in request body", e.what());
        }
    });

    svr.Get("/api/check", [&](const httplib::Request& req, httplib::Response& res) {
        phrasecheck::enable_cors(res);

        using clock = std::chrono::steady_clock;
        auto t0 = clock::now();

        if (!req.has_param("q")) {
            phrasecheck::send_error(res, 400, "missing q param");
            return;
        }
        std::string q = req.get_param_value("q");

        double min_sim = engine.config().min_similarity;
        bool partial = engine.config().enable_partial_matching;
        try {
            if (req.has_param("min_similarity")) min_sim = std::stod(req.get_param_value("min_similarity"));
        } catch (const std::exception&) {
            phrasecheck::send_error(res, 400, "min_similarity must be a number");
            return;
        }
        if (req.has_param("partial")) {
            std::string p = req.get_param_value("partial");
            partial = !(p == "0" || p == "false" || p == "no");
        }
        min_sim = std::max(0.0, std::min(1.0, min_sim));

        json j = engine.check(q, min_sim, partial);
        double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        j["time_ms"] = ms;

        std::cerr << "[check] q=\"" << q << "\" min_similarity=" << min_sim << " time=" << ms << "ms\n";
        phrasecheck::send_json(res, j);
    });

    svr.Post("/api/reload", [&](const httplib::Request&, httplib::Response& res) {
        phrasecheck::enable_cors(res);
        bool ok = engine.reload(keywords);
        json j = engine.stats();
        j["reloaded"] = ok;
        phrasecheck::send_json(res, j);
    });

    std::cout << "phrasecheck running on http://" << cfg.host << ":" << cfg.port << "\n";
    std::cout << "Try: /api/check?q=theyre+acount\n";
    bool ok = svr.listen(cfg.host, cfg.port);
    if (!ok) std::cerr << "[http] failed to listen on " << cfg.host << ":" << cfg.port << "\n";

    listener.stop();
    timeouts.stop();
    suggestions.close();
    corrections.close();
    return ok ? 0 : 1;
}
