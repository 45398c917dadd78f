#include "phrasecheck/textutil.hpp"

#include <cctype>
#include <cstdint>

namespace phrasecheck {

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Decodes one UTF-8 code point at s[i] and advances i past it.
// Malformed or truncated sequences yield 0xFFFD and consume one byte.
static uint32_t decode_utf8(const std::string& s, size_t& i) {
    unsigned char c = (unsigned char)s[i];
    int len = 0;
    uint32_t cp = 0;
    if (c < 0x80) { i++; return c; }
    if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else { i++; return 0xFFFD; }

    if (i + len > s.size()) { i++; return 0xFFFD; }
    for (int k = 1; k < len; k++) {
        unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) { i++; return 0xFFFD; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    i += len;
    return cp;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

// Non-ASCII whitespace, plus the typographic apostrophes U+2018 / U+2019.
static bool is_unicode_separator(uint32_t cp) {
    return cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000 || cp == 0x2018 || cp == 0x2019;
}

static bool is_unicode_punct(uint32_t cp) {
    if (cp >= 0x0080 && cp <= 0x00BF) {
        // ª ² ³ µ ¹ º ¼ ½ ¾ count as word characters
        switch (cp) {
            case 0xAA: case 0xB2: case 0xB3: case 0xB5:
            case 0xB9: case 0xBA: case 0xBC: case 0xBD: case 0xBE:
                return false;
            default:
                return true;
        }
    }
    return cp == 0x00D7 || cp == 0x00F7 ||
           (cp >= 0x2000 && cp <= 0x206F) ||   // general punctuation
           (cp >= 0x20A0 && cp <= 0x20CF) ||   // currency symbols
           (cp >= 0x2190 && cp <= 0x2BFF) ||   // arrows, math operators, box drawing, dingbats
           (cp >= 0x2E00 && cp <= 0x2E7F) ||   // supplemental punctuation
           (cp >= 0x3001 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x3020) ||
           (cp >= 0xFE10 && cp <= 0xFE6F) ||   // vertical / small form variants
           (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0xD800 && cp <= 0xDFFF) || cp == 0xFEFF || cp == 0xFFFD ||
           (cp >= 0x1F000 && cp <= 0x1FAFF);   // emoji and pictographs
}

// Latin-1, Latin Extended-A, Greek and Cyrillic upper case.
static uint32_t lower_code_point(uint32_t cp) {
    if (cp < 0x80) return (uint32_t)std::tolower((int)cp);
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;
    if (cp == 0x0130) return 'i';
    if (cp == 0x0178) return 0x00FF;
    if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
        (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp;
}

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    // pending_space collapses whitespace runs and drops leading/trailing ones
    bool pending_space = false;
    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = decode_utf8(text, i);

        bool space = false;
        if (cp < 0x80) {
            space = is_space((unsigned char)cp) || cp == '-' || cp == '_' || cp == '\'';
        } else {
            space = is_unicode_separator(cp);
        }

        if (space) {
            if (!out.empty()) pending_space = true;
            continue;
        }

        if (cp < 0x80 ? !std::isalnum((int)cp) : is_unicode_punct(cp)) continue;

        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        append_utf8(out, lower_code_point(cp));
    }
    return out;
}

std::vector<std::string> split_words(const std::string& normalized) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space((unsigned char)s[b])) b++;
    while (e > b && is_space((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

} // namespace phrasecheck
