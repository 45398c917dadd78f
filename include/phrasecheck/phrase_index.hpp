#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace phrasecheck {

// Searchable form of the keyword list.
//
// Notes:
// - Phrases are stored once per normalized form, in first-seen order.
// - When two keywords normalize identically the later one's original text
//   wins (last-write-wins); the phrase keeps its first position.
// - Each word bucket lists a phrase at most once, in phrase order.
// - Read-only after build(); the Engine swaps whole instances on reload.
class PhraseIndex {
public:
    void clear();
    bool empty() const;
    size_t size() const;
    size_t word_count() const;

    void build(const std::vector<std::string>& keywords);

    // Normalized phrases containing the normalized word (empty if none).
    std::vector<std::string> lookup_by_word(const std::string& word) const;

    // Phrase ids for the word; the returned reference stays valid while the index lives.
    const std::vector<uint32_t>& postings(const std::string& word) const;

    // Original text for a phrase taken from this index.
    // Throws std::logic_error if the phrase is not indexed.
    const std::string& original_of(const std::string& phrase) const;
    const std::string& original_of(uint32_t phrase_id) const { return originals_[phrase_id]; }

    const std::string& phrase(uint32_t phrase_id) const { return phrases_[phrase_id]; }
    const std::vector<std::string>& phrases() const { return phrases_; }

    // Id of a normalized phrase, or -1 when absent.
    int64_t find(const std::string& phrase) const;

    const std::vector<KeywordEntry>& entries() const { return entries_; }

private:
    std::vector<KeywordEntry> entries_;
    std::vector<std::string> phrases_;
    std::vector<std::string> originals_;
    std::vector<std::vector<std::string>> words_;
    std::unordered_map<std::string, uint32_t> phrase_to_id_;
    std::unordered_map<std::string, std::vector<uint32_t>> inverted_;
};

} // namespace phrasecheck
