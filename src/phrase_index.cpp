#include "phrasecheck/phrase_index.hpp"

#include <stdexcept>

#include "phrasecheck/textutil.hpp"

namespace phrasecheck {

void PhraseIndex::clear() {
    entries_.clear();
    phrases_.clear();
    originals_.clear();
    words_.clear();
    phrase_to_id_.clear();
    inverted_.clear();
}

bool PhraseIndex::empty() const {
    return phrases_.empty();
}

size_t PhraseIndex::size() const {
    return phrases_.size();
}

size_t PhraseIndex::word_count() const {
    return inverted_.size();
}

void PhraseIndex::build(const std::vector<std::string>& keywords) {
    clear();

    entries_.reserve(keywords.size());
    phrases_.reserve(keywords.size());
    originals_.reserve(keywords.size());
    phrase_to_id_.reserve(keywords.size() * 2 + 1);

    for (const auto& kw : keywords) {
        std::string norm = normalize_text(kw);
        entries_.push_back(KeywordEntry{kw, norm});

        // Keywords that are pure punctuation have nothing to match on
        if (norm.empty()) continue;

        auto it = phrase_to_id_.find(norm);
        if (it != phrase_to_id_.end()) {
            // last write wins for the original text
            originals_[it->second] = kw;
            continue;
        }

        uint32_t id = (uint32_t)phrases_.size();
        phrase_to_id_.emplace(norm, id);
        phrases_.push_back(norm);
        originals_.push_back(kw);
        words_.push_back(split_words(norm));
    }

    // Word -> phrase ids. Ids are appended in increasing order, so checking
    // the last element is enough to keep each bucket a set.
    for (uint32_t id = 0; id < (uint32_t)phrases_.size(); id++) {
        for (const auto& w : words_[id]) {
            auto& bucket = inverted_[w];
            if (bucket.empty() || bucket.back() != id) bucket.push_back(id);
        }
    }
}

const std::vector<uint32_t>& PhraseIndex::postings(const std::string& word) const {
    static const std::vector<uint32_t> none;
    auto it = inverted_.find(word);
    if (it == inverted_.end()) return none;
    return it->second;
}

std::vector<std::string> PhraseIndex::lookup_by_word(const std::string& word) const {
    std::vector<std::string> out;
    const auto& ids = postings(word);
    out.reserve(ids.size());
    for (uint32_t id : ids) out.push_back(phrases_[id]);
    return out;
}

int64_t PhraseIndex::find(const std::string& phrase) const {
    auto it = phrase_to_id_.find(phrase);
    if (it == phrase_to_id_.end()) return -1;
    return (int64_t)it->second;
}

const std::string& PhraseIndex::original_of(const std::string& phrase) const {
    auto it = phrase_to_id_.find(phrase);
    if (it == phrase_to_id_.end()) {
        throw std::logic_error("original_of: phrase not in index: '" + phrase + "'");
    }
    return originals_[it->second];
}

} // namespace phrasecheck
