#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace phrasecheck {

// Supplies the operator's list of correct phrases.
class KeywordSource {
public:
    virtual ~KeywordSource() = default;

    // Throws LoadError when the source cannot be read.
    virtual std::vector<std::string> load() = 0;

    virtual std::string describe() const = 0;
};

// One phrase per line; blank lines are skipped, whitespace trimmed.
class FileKeywordSource : public KeywordSource {
public:
    explicit FileKeywordSource(fs::path path) : path_(std::move(path)) {}

    std::vector<std::string> load() override;
    std::string describe() const override { return path_.string(); }

private:
    fs::path path_;
};

class StaticKeywordSource : public KeywordSource {
public:
    explicit StaticKeywordSource(std::vector<std::string> keywords) : keywords_(std::move(keywords)) {}

    std::vector<std::string> load() override { return keywords_; }
    std::string describe() const override { return "<static>"; }

private:
    std::vector<std::string> keywords_;
};

} // namespace phrasecheck
