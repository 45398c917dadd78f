#include "phrasecheck/phrase_window.hpp"

#include <algorithm>

namespace phrasecheck {

PhraseWindow::PhraseWindow(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

void PhraseWindow::push(std::string word) {
    words_.push_back(std::move(word));
    while (words_.size() > capacity_) words_.pop_front();
}

bool PhraseWindow::remove_first(const std::string& word) {
    auto it = std::find(words_.begin(), words_.end(), word);
    if (it == words_.end()) return false;
    words_.erase(it);
    return true;
}

std::string PhraseWindow::tail(size_t n) const {
    n = std::min(n, words_.size());
    std::string out;
    for (size_t i = words_.size() - n; i < words_.size(); i++) {
        if (!out.empty()) out.push_back(' ');
        out += words_[i];
    }
    return out;
}

void RecentPhrases::add(const std::string& normalized) {
    if (capacity_ == 0) return;
    seen_.push_back(normalized);
    while (seen_.size() > capacity_) seen_.pop_front();
}

bool RecentPhrases::contains(const std::string& normalized) const {
    return std::find(seen_.begin(), seen_.end(), normalized) != seen_.end();
}

} // namespace phrasecheck
