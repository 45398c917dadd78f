#include "phrasecheck/config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace phrasecheck {

void Config::sanitize() {
    max_phrase_length = std::max(1, max_phrase_length);
    min_phrase_length = std::max(0, min_phrase_length);
    min_similarity = std::max(0.0, std::min(1.0, min_similarity));
    recent_phrases_size = std::max(0, recent_phrases_size);
    if (suggestion_timeout.count() < 0) suggestion_timeout = std::chrono::milliseconds(0);
    max_suggestions = std::max(1, max_suggestions);
    min_suggestions = std::max(0, std::min(min_suggestions, max_suggestions));
    if (port <= 0 || port > 65535) port = 8765;
}

json Config::to_json() const {
    json j;
    j["max_phrase_length"] = max_phrase_length;
    j["min_phrase_length"] = min_phrase_length;
    j["min_similarity"] = min_similarity;
    j["enable_partial_matching"] = enable_partial_matching;
    j["recent_phrases_size"] = recent_phrases_size;
    j["suggestion_timeout"] = (int64_t)suggestion_timeout.count();
    j["max_suggestions"] = max_suggestions;
    j["min_suggestions"] = min_suggestions;
    j["keywords_path"] = keywords_path.string();
    j["host"] = host;
    j["port"] = port;
    return j;
}

// Reads j[key] into out when present; type mismatches keep the default.
template <typename T>
static void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[config] ignoring '" << key << "': " << e.what() << "\n";
    }
}

Config config_from_json(const json& j) {
    Config cfg;
    if (!j.is_object()) {
        std::cerr << "[config] config root is not an object, using defaults\n";
        return cfg;
    }

    static const char* const known[] = {
        "max_phrase_length", "min_phrase_length", "min_similarity",
        "enable_partial_matching", "recent_phrases_size", "suggestion_timeout", "suggestion_timeout_ms",
        "max_suggestions", "min_suggestions", "keywords_path", "host", "port"
    };
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) { found = true; break; }
        }
        if (!found) std::cout << "[config] ignoring unknown key '" << it.key() << "'\n";
    }

    read_key(j, "max_phrase_length", cfg.max_phrase_length);
    read_key(j, "min_phrase_length", cfg.min_phrase_length);
    read_key(j, "min_similarity", cfg.min_similarity);
    read_key(j, "enable_partial_matching", cfg.enable_partial_matching);
    read_key(j, "recent_phrases_size", cfg.recent_phrases_size);
    read_key(j, "max_suggestions", cfg.max_suggestions);
    read_key(j, "min_suggestions", cfg.min_suggestions);
    read_key(j, "host", cfg.host);
    read_key(j, "port", cfg.port);

    // suggestion_timeout is in milliseconds; suggestion_timeout_ms is an alias
    int64_t timeout_ms = cfg.suggestion_timeout.count();
    read_key(j, "suggestion_timeout_ms", timeout_ms);
    read_key(j, "suggestion_timeout", timeout_ms);
    cfg.suggestion_timeout = std::chrono::milliseconds(timeout_ms);

    std::string keywords = cfg.keywords_path.string();
    read_key(j, "keywords_path", keywords);
    cfg.keywords_path = keywords;

    cfg.sanitize();
    return cfg;
}

Config load_config(const fs::path& path) {
    if (!fs::exists(path)) {
        std::cout << "[config] no config file at " << path << ", using defaults\n";
        return Config{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[config] failed to open " << path << ", using defaults\n";
        return Config{};
    }

    try {
        json j = json::parse(in);
        Config cfg = config_from_json(j);

        // Relative keyword paths are resolved against the config file
        if (cfg.keywords_path.is_relative() && !path.parent_path().empty()) {
            cfg.keywords_path = path.parent_path() / cfg.keywords_path;
        }
        std::cout << "[config] loaded " << path << "\n";
        return cfg;
    } catch (const json::parse_error& e) {
        std::cerr << "[config] invalid JSON in " << path << ": " << e.what() << ", using defaults\n";
        return Config{};
    }
}

void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env) {
    auto get = [&](const char* key) -> std::string {
        auto it = env.find(key);
        return it == env.end() ? std::string() : it->second;
    };

    std::string v = get("PHRASECHECK_KEYWORDS");
    if (!v.empty()) cfg.keywords_path = v;

    v = get("PHRASECHECK_PORT");
    if (!v.empty()) {
        try {
            cfg.port = std::stoi(v);
        } catch (const std::exception&) {
            std::cerr << "[config] PHRASECHECK_PORT is not a number: " << v << "\n";
        }
    }

    v = get("PHRASECHECK_MIN_SIMILARITY");
    if (!v.empty()) {
        try {
            cfg.min_similarity = std::stod(v);
        } catch (const std::exception&) {
            std::cerr << "[config] PHRASECHECK_MIN_SIMILARITY is not a number: " << v << "\n";
        }
    }

    cfg.sanitize();
}

} // namespace phrasecheck
