#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "keyword_source.hpp"
#include "phrase_index.hpp"
#include "types.hpp"

namespace phrasecheck {

// Holds the current PhraseIndex snapshot and scores phrases against it.
//
// reload() builds a fresh index without holding the lock and then swaps the
// shared pointer, so concurrent scoring calls always see one whole index.
class Engine {
public:
    explicit Engine(const Config& cfg);

    // Loads keywords from the source. On LoadError (or an empty list) the
    // engine continues with an empty index and returns false.
    bool reload(KeywordSource& source);

    // Replaces the index with one built from the given keywords.
    void load(const std::vector<std::string>& keywords);

    std::shared_ptr<const PhraseIndex> snapshot() const;

    // Ranked originals for a phrase using the configured options.
    std::vector<std::string> suggest(const std::string& phrase) const;

    std::vector<std::string> score(const std::string& query,
                                   double min_similarity,
                                   bool enable_partial) const;

    // Scoring report: query, normalized form and the ranked candidates with
    // score and strategy.
    json check(const std::string& query, double min_similarity, bool enable_partial) const;

    json stats() const;

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    mutable std::mutex mtx_;
    std::shared_ptr<const PhraseIndex> index_;
    uint64_t reloads_ = 0;

    void install(std::shared_ptr<const PhraseIndex> idx);
};

} // namespace phrasecheck
