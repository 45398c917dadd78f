#include "phrasecheck/types.hpp"

namespace phrasecheck {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Prefix:     return "prefix";
        case Strategy::Partial:    return "partial";
        case Strategy::Similarity: return "similarity";
        case Strategy::Padding:    return "padding";
    }
    return "unknown";
}

json to_json(const SuggestionReady& ev) {
    json j;
    j["type"] = "suggestion_ready";
    j["id"] = ev.id;
    j["phrase"] = ev.phrase;
    j["suggestions"] = ev.ranked;
    j["context"] = ev.context;
    return j;
}

json to_json(const ApplyCorrection& ev) {
    json j;
    j["type"] = "apply_correction";
    j["id"] = ev.id;
    j["original"] = ev.original;
    j["correction"] = ev.correction;
    j["context"] = ev.context;
    return j;
}

} // namespace phrasecheck
