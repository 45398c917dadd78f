#pragma once

#include <string>
#include <vector>

namespace phrasecheck {

// Canonical comparison form, computed over UTF-8 code points:
// lowercase (ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic),
// '-' '_' '\'' U+2018 U+2019 and Unicode spaces become spaces, ASCII and
// common Unicode punctuation dropped, whitespace runs collapsed to one space,
// ends trimmed. Other letters pass through unchanged. Idempotent.
std::string normalize_text(const std::string& text);

// Splits on single spaces (input is expected to be normalized).
std::vector<std::string> split_words(const std::string& normalized);

// Trims ASCII whitespace on both ends.
std::string trim(const std::string& s);

} // namespace phrasecheck
