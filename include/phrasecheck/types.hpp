#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace phrasecheck {

namespace fs = std::filesystem;
using json = nlohmann::json;

// One authored keyword and its normalized form.
struct KeywordEntry {
    std::string original;
    std::string normalized;
};

enum class Strategy {
    Prefix,
    Partial,
    Similarity,
    Padding
};

const char* strategy_name(Strategy s);

// A scored phrase from the index (phrase_id refers to PhraseIndex::phrases()).
struct Candidate {
    uint32_t phrase_id = 0;
    double score = 0.0;
    Strategy strategy = Strategy::Similarity;
};

// A single key press, named the way keyboard hooks report it:
// "a", "A", "7", ".", "space", "enter", "tab", "backspace", "shift", ...
struct KeyEvent {
    std::string name;
};

// Emitted when a phrase completion produced a non-empty suggestion list.
struct SuggestionReady {
    uint64_t id = 0;
    std::string phrase;
    std::vector<std::string> ranked;
    std::string context;
};

// Handed to the correction applier after the user accepts a suggestion.
struct ApplyCorrection {
    uint64_t id = 0;
    std::string original;
    std::string correction;
    std::string context;
};

// Keyword source could not be read or parsed.
struct LoadError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Correction applier failed to replace the text in the target application.
struct ApplicationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

json to_json(const SuggestionReady& ev);
json to_json(const ApplyCorrection& ev);

} // namespace phrasecheck
