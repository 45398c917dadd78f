#include "phrasecheck/engine.hpp"

#include <iostream>

#include "phrasecheck/match_scorer.hpp"
#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

Engine::Engine(const Config& cfg)
    : cfg_(cfg), index_(std::make_shared<PhraseIndex>()) {
    cfg_.sanitize();
}

void Engine::install(std::shared_ptr<const PhraseIndex> idx) {
    std::lock_guard<std::mutex> lock(mtx_);
    index_ = std::move(idx);
    reloads_++;
}

std::shared_ptr<const PhraseIndex> Engine::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return index_;
}

// Build off to the side, then swap the whole index in one step
void Engine::load(const std::vector<std::string>& keywords) {
    auto idx = std::make_shared<PhraseIndex>();
    idx->build(keywords);

    std::cout << "[reload] indexed " << idx->size() << " phrases ("
              << keywords.size() << " keywords, " << idx->word_count() << " words)\n";
    if (idx->size() < keywords.size()) {
        std::cerr << "[reload] " << (keywords.size() - idx->size())
                  << " keywords were empty after normalization or collided with an earlier one"
                  << " (later original text kept)\n";
    }
    install(std::move(idx));
}

bool Engine::reload(KeywordSource& source) {
    std::vector<std::string> keywords;
    try {
        keywords = source.load();
    } catch (const LoadError& e) {
        std::cerr << "[reload] failed to load keywords from " << source.describe()
                  << ": " << e.what() << " (continuing with empty index)\n";
        install(std::make_shared<PhraseIndex>());
        return false;
    }

    if (keywords.empty()) {
        std::cerr << "[reload] no keywords in " << source.describe()
                  << " (continuing with empty index)\n";
        install(std::make_shared<PhraseIndex>());
        return false;
    }

    load(keywords);
    return true;
}

std::vector<std::string> Engine::score(const std::string& query,
                                       double min_similarity,
                                       bool enable_partial) const {
    auto idx = snapshot();
    MatchScorer scorer(*idx, (size_t)cfg_.max_suggestions, (size_t)cfg_.min_suggestions);
    return scorer.score(query, min_similarity, enable_partial);
}

std::vector<std::string> Engine::suggest(const std::string& phrase) const {
    return score(phrase, cfg_.min_similarity, cfg_.enable_partial_matching);
}

json Engine::check(const std::string& query, double min_similarity, bool enable_partial) const {
    auto idx = snapshot();
    MatchScorer scorer(*idx, (size_t)cfg_.max_suggestions, (size_t)cfg_.min_suggestions);

    json out;
    out["query"] = query;
    out["normalized"] = normalize_text(query);
    out["min_similarity"] = min_similarity;
    out["partial"] = enable_partial;
    out["suggestions"] = json::array();

    for (const auto& c : scorer.rank(query, min_similarity, enable_partial)) {
        json r;
        r["phrase"] = idx->original_of(c.phrase_id);
        r["normalized"] = idx->phrase(c.phrase_id);
        r["score"] = c.score;
        r["strategy"] = strategy_name(c.strategy);
        out["suggestions"].push_back(r);
    }
    return out;
}

json Engine::stats() const {
    auto idx = snapshot();
    uint64_t reloads = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        reloads = reloads_;
    }

    json j;
    j["phrases"] = idx->size();
    j["keywords"] = idx->entries().size();
    j["words"] = idx->word_count();
    j["reloads"] = reloads;
    return j;
}

} // namespace phrasecheck
