#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace phrasecheck {

// Effective engine + daemon settings. Defaults match a freshly installed
// keywords.txt next to the binary.
struct Config {
    int max_phrase_length = 10;     // phrase window capacity (words)
    int min_phrase_length = 3;      // min characters of a submitted n-gram
    double min_similarity = 0.5;
    bool enable_partial_matching = true;
    int recent_phrases_size = 50;
    std::chrono::milliseconds suggestion_timeout{8000};

    int max_suggestions = 10;
    int min_suggestions = 3;

    fs::path keywords_path = "keywords.txt";
    std::string host = "127.0.0.1";
    int port = 8765;

    // Clamps every field into its valid range.
    void sanitize();

    json to_json() const;
};

// Reads a JSON config file. Missing file -> defaults. Malformed JSON or
// mistyped values are logged and fall back to defaults. Unknown keys are ignored.
Config load_config(const fs::path& path);

// Same, from an already parsed document.
Config config_from_json(const json& j);

// Applies PHRASECHECK_* overrides from a key/value map (see load_env_file).
void apply_env_overrides(Config& cfg, const std::unordered_map<std::string, std::string>& env);

} // namespace phrasecheck
