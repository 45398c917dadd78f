#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "phrase_index.hpp"
#include "types.hpp"

namespace phrasecheck {

// Ratcliff/Obershelp similarity: 2*M / (|a|+|b|) where M is the number of
// characters in the recursively found longest common blocks.
// Two empty strings score 1.0, one empty string scores 0.0.
double similarity_ratio(const std::string& a, const std::string& b);

// Scores a query against one PhraseIndex snapshot.
//
// Three strategies are merged (max score per phrase):
// - prefix:     indexed phrase starts with the query            -> 1.0
// - partial:    shared words / query words, scaled by 0.9
// - similarity: similarity_ratio(query, phrase)
// Ranking is score desc, then shorter phrase, then index order.
// The query itself is never returned. Results are cut to max_results, then
// padded with other indexed phrases (index order) up to min_results.
class MatchScorer {
public:
    static constexpr double PARTIAL_WEIGHT = 0.9;

    MatchScorer(const PhraseIndex& index, size_t max_results = 10, size_t min_results = 3);

    std::vector<Candidate> rank(const std::string& query,
                                double min_similarity,
                                bool enable_partial) const;

    // Same ranking, mapped back to the authored keyword text.
    std::vector<std::string> score(const std::string& query,
                                   double min_similarity,
                                   bool enable_partial) const;

private:
    const PhraseIndex& index_;
    size_t max_results_;
    size_t min_results_;

    void prefix_matches(const std::string& norm, int64_t self_id, std::vector<Candidate>& best) const;
    void partial_matches(const std::string& norm, int64_t self_id, std::vector<Candidate>& best) const;
    void similarity_matches(const std::string& norm, int64_t self_id, std::vector<Candidate>& best) const;
};

} // namespace phrasecheck
