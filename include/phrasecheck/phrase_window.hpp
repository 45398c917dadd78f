#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace phrasecheck {

// Most recently completed words, oldest first. Pushing past capacity evicts
// the oldest word.
class PhraseWindow {
public:
    explicit PhraseWindow(size_t capacity = 10);

    void push(std::string word);
    void clear() { words_.clear(); }

    // Removes the first occurrence of word; false if absent.
    bool remove_first(const std::string& word);

    // Last n words joined by single spaces (n is clamped to size()).
    std::string tail(size_t n) const;

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }
    size_t capacity() const { return capacity_; }
    std::vector<std::string> words() const { return {words_.begin(), words_.end()}; }

private:
    size_t capacity_;
    std::deque<std::string> words_;
};

// Normalized phrases already offered. FIFO with a fixed capacity; a capacity
// of 0 remembers nothing.
class RecentPhrases {
public:
    explicit RecentPhrases(size_t capacity = 50) : capacity_(capacity) {}

    void add(const std::string& normalized);
    bool contains(const std::string& normalized) const;

    size_t size() const { return seen_.size(); }
    void clear() { seen_.clear(); }

private:
    size_t capacity_;
    std::deque<std::string> seen_;
};

} // namespace phrasecheck
