#include "phrasecheck/match_scorer.hpp"

#include <algorithm>
#include <unordered_set>

#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

namespace {

struct Block {
    size_t i = 0;
    size_t j = 0;
    size_t size = 0;
};

// Longest common substring of a[alo,ahi) and b[blo,bhi). Among equally long
// blocks the one that ends first in a wins, then the first in b.
Block find_longest_match(const std::string& a, size_t alo, size_t ahi,
                         const std::string& b, size_t blo, size_t bhi,
                         std::vector<size_t>& prev, std::vector<size_t>& cur) {
    Block best{alo, blo, 0};
    size_t width = bhi - blo;
    prev.assign(width + 1, 0);
    cur.assign(width + 1, 0);

    for (size_t i = alo; i < ahi; i++) {
        for (size_t j = blo; j < bhi; j++) {
            size_t col = j - blo + 1;
            if (a[i] != b[j]) {
                cur[col] = 0;
                continue;
            }
            size_t k = prev[col - 1] + 1;
            cur[col] = k;
            if (k > best.size) {
                best.i = i + 1 - k;
                best.j = j + 1 - k;
                best.size = k;
            }
        }
        prev.swap(cur);
    }
    return best;
}

size_t matching_chars(const std::string& a, const std::string& b) {
    struct Range { size_t alo, ahi, blo, bhi; };

    std::vector<size_t> prev, cur;
    std::vector<Range> todo;
    todo.push_back(Range{0, a.size(), 0, b.size()});

    size_t matched = 0;
    while (!todo.empty()) {
        Range r = todo.back();
        todo.pop_back();
        if (r.alo >= r.ahi || r.blo >= r.bhi) continue;

        Block m = find_longest_match(a, r.alo, r.ahi, b, r.blo, r.bhi, prev, cur);
        if (m.size == 0) continue;

        matched += m.size;
        todo.push_back(Range{r.alo, m.i, r.blo, m.j});
        todo.push_back(Range{m.i + m.size, r.ahi, m.j + m.size, r.bhi});
    }
    return matched;
}

} // namespace

double similarity_ratio(const std::string& a, const std::string& b) {
    size_t total = a.size() + b.size();
    if (total == 0) return 1.0;
    return 2.0 * (double)matching_chars(a, b) / (double)total;
}

MatchScorer::MatchScorer(const PhraseIndex& index, size_t max_results, size_t min_results)
    : index_(index),
      max_results_(std::max<size_t>(1, max_results)),
      min_results_(std::min(min_results, std::max<size_t>(1, max_results))) {}

// Keeps the highest score per phrase; on equal scores the earlier strategy stays.
static void offer(std::vector<Candidate>& best, uint32_t id, double score, Strategy s) {
    if (score > best[id].score) {
        best[id].score = score;
        best[id].strategy = s;
    }
}

void MatchScorer::prefix_matches(const std::string& norm, int64_t self_id,
                                 std::vector<Candidate>& best) const {
    if (norm.empty()) return;

    const auto& phrases = index_.phrases();
    for (uint32_t id = 0; id < (uint32_t)phrases.size(); id++) {
        if ((int64_t)id == self_id) continue;
        const std::string& p = phrases[id];
        if (p.size() > norm.size() && p.compare(0, norm.size(), norm) == 0) {
            offer(best, id, 1.0, Strategy::Prefix);
        }
    }
}

void MatchScorer::partial_matches(const std::string& norm, int64_t self_id,
                                  std::vector<Candidate>& best) const {
    std::vector<std::string> qwords = split_words(norm);
    std::unordered_set<std::string> unique(qwords.begin(), qwords.end());
    if (unique.empty()) return;

    // Each bucket lists a phrase once, so this counts distinct shared words
    std::vector<uint32_t> shared(index_.size(), 0);
    std::vector<uint32_t> touched;
    for (const auto& w : unique) {
        for (uint32_t id : index_.postings(w)) {
            if (shared[id]++ == 0) touched.push_back(id);
        }
    }

    for (uint32_t id : touched) {
        if ((int64_t)id == self_id) continue;
        double s = (double)shared[id] / (double)unique.size() * PARTIAL_WEIGHT;
        offer(best, id, s, Strategy::Partial);
    }
}

void MatchScorer::similarity_matches(const std::string& norm, int64_t self_id,
                                     std::vector<Candidate>& best) const {
    const auto& phrases = index_.phrases();
    for (uint32_t id = 0; id < (uint32_t)phrases.size(); id++) {
        if ((int64_t)id == self_id) continue;
        offer(best, id, similarity_ratio(norm, phrases[id]), Strategy::Similarity);
    }
}

std::vector<Candidate> MatchScorer::rank(const std::string& query,
                                         double min_similarity,
                                         bool enable_partial) const {
    std::vector<Candidate> out;
    if (index_.empty()) return out;

    const std::string norm = normalize_text(query);
    const int64_t self_id = index_.find(norm);

    // Score -1 marks "not reached by any strategy"
    std::vector<Candidate> best(index_.size());
    for (uint32_t id = 0; id < (uint32_t)best.size(); id++) {
        best[id].phrase_id = id;
        best[id].score = -1.0;
    }

    prefix_matches(norm, self_id, best);
    if (enable_partial) partial_matches(norm, self_id, best);
    similarity_matches(norm, self_id, best);

    for (const auto& c : best) {
        if ((int64_t)c.phrase_id == self_id) continue;
        if (c.score >= 0.0 && c.score >= min_similarity) out.push_back(c);
    }

    std::stable_sort(out.begin(), out.end(), [&](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score > b.score;
        return index_.phrase(a.phrase_id).size() < index_.phrase(b.phrase_id).size();
    });

    if (out.size() > max_results_) out.resize(max_results_);

    // Pad with the remaining phrases in index order
    if (out.size() < min_results_) {
        std::vector<bool> used(index_.size(), false);
        for (const auto& c : out) used[c.phrase_id] = true;

        for (uint32_t id = 0; id < (uint32_t)index_.size() && out.size() < min_results_; id++) {
            if (used[id] || (int64_t)id == self_id) continue;
            out.push_back(Candidate{id, std::max(0.0, best[id].score), Strategy::Padding});
        }
    }
    return out;
}

std::vector<std::string> MatchScorer::score(const std::string& query,
                                            double min_similarity,
                                            bool enable_partial) const {
    std::vector<std::string> out;
    for (const auto& c : rank(query, min_similarity, enable_partial)) {
        out.push_back(index_.original_of(c.phrase_id));
    }
    return out;
}

} // namespace phrasecheck
