#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>

#include "phrasecheck/config.hpp"
#include "phrasecheck/env_loader.hpp"

using namespace phrasecheck;

namespace {

fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path dir = fs::temp_directory_path() / "phrasecheck_config_test";
    fs::create_directories(dir);
    fs::path p = dir / name;
    std::ofstream out(p);
    out << content;
    return p;
}

} // namespace

TEST(Config, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.max_phrase_length, 10);
    EXPECT_EQ(cfg.min_phrase_length, 3);
    EXPECT_DOUBLE_EQ(cfg.min_similarity, 0.5);
    EXPECT_TRUE(cfg.enable_partial_matching);
    EXPECT_EQ(cfg.recent_phrases_size, 50);
    EXPECT_EQ(cfg.suggestion_timeout.count(), 8000);
    EXPECT_EQ(cfg.max_suggestions, 10);
    EXPECT_EQ(cfg.min_suggestions, 3);
}

TEST(Config, ReadsKnownKeysAndIgnoresUnknown) {
    json j = {
        {"max_phrase_length", 6},
        {"min_similarity", 0.7},
        {"enable_partial_matching", false},
        {"suggestion_timeout_ms", 2500},
        {"theme", "dark"}
    };
    Config cfg = config_from_json(j);
    EXPECT_EQ(cfg.max_phrase_length, 6);
    EXPECT_DOUBLE_EQ(cfg.min_similarity, 0.7);
    EXPECT_FALSE(cfg.enable_partial_matching);
    EXPECT_EQ(cfg.suggestion_timeout.count(), 2500);
    EXPECT_FALSE(cfg.to_json().contains("theme"));
}

TEST(Config, SuggestionTimeoutIsMilliseconds) {
    Config cfg = config_from_json(json{{"suggestion_timeout", 1200}});
    EXPECT_EQ(cfg.suggestion_timeout.count(), 1200);
    EXPECT_EQ(cfg.to_json()["suggestion_timeout"], 1200);

    // the plain name wins over the _ms alias
    Config both = config_from_json(json{{"suggestion_timeout", 300}, {"suggestion_timeout_ms", 900}});
    EXPECT_EQ(both.suggestion_timeout.count(), 300);

    Config disabled = config_from_json(json{{"suggestion_timeout", 0}});
    EXPECT_EQ(disabled.suggestion_timeout.count(), 0);
}

TEST(Config, MistypedValuesKeepDefaults) {
    json j = {{"enable_partial_matching", "yes"}, {"recent_phrases_size", "many"}};
    Config cfg = config_from_json(j);
    EXPECT_TRUE(cfg.enable_partial_matching);
    EXPECT_EQ(cfg.recent_phrases_size, 50);
}

TEST(Config, OutOfRangeValuesAreClamped) {
    json j = {
        {"min_similarity", 3.0},
        {"max_phrase_length", 0},
        {"max_suggestions", 4},
        {"min_suggestions", 9},
        {"suggestion_timeout_ms", -5}
    };
    Config cfg = config_from_json(j);
    EXPECT_DOUBLE_EQ(cfg.min_similarity, 1.0);
    EXPECT_EQ(cfg.max_phrase_length, 1);
    EXPECT_EQ(cfg.min_suggestions, 4);
    EXPECT_EQ(cfg.suggestion_timeout.count(), 0);
}

TEST(Config, LoadFileResolvesKeywordsNextToConfig) {
    fs::path p = write_temp("config.json", R"({"keywords_path": "kw.txt", "port": 9001})");
    Config cfg = load_config(p);
    EXPECT_EQ(cfg.port, 9001);
    EXPECT_EQ(cfg.keywords_path, p.parent_path() / "kw.txt");
}

TEST(Config, MissingOrBrokenFileGivesDefaults) {
    Config missing = load_config(fs::temp_directory_path() / "phrasecheck_no_such_config.json");
    EXPECT_EQ(missing.port, 8765);

    fs::path p = write_temp("broken.json", "{ not json");
    Config broken = load_config(p);
    EXPECT_DOUBLE_EQ(broken.min_similarity, 0.5);
}

TEST(Config, EnvOverrides) {
    fs::path p = write_temp(".env",
                            "# local overrides\n"
                            "PHRASECHECK_PORT=9100\n"
                            "PHRASECHECK_KEYWORDS=\"/srv/keywords.txt\"\n"
                            "PHRASECHECK_MIN_SIMILARITY = 0.65\n");
    auto env = load_env_file(p);
    EXPECT_EQ(env["PHRASECHECK_KEYWORDS"], "/srv/keywords.txt");

    Config cfg;
    apply_env_overrides(cfg, env);
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.keywords_path, fs::path("/srv/keywords.txt"));
    EXPECT_DOUBLE_EQ(cfg.min_similarity, 0.65);

    std::unordered_map<std::string, std::string> bad = {{"PHRASECHECK_PORT", "http"}};
    apply_env_overrides(cfg, bad);
    EXPECT_EQ(cfg.port, 9100);
}
