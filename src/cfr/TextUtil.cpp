#include "cfr/TextUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace cfr::textutil {

// code point at pos; len receives its byte length. Ill-formed bytes give a negative value.
static UChar32 decode_at(const std::string& s, size_t pos, size_t& len) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data()) + pos;
    const int32_t n = (int32_t)std::min<size_t>(s.size() - pos, 4);
    int32_t i = 0;
    UChar32 c = 0;
    U8_NEXT(p, i, n, c);
    len = (size_t)i;
    return c;
}

// start of the code point that ends right before pos
static size_t prev_start(const std::string& s, size_t pos) {
    size_t i = pos - 1;
    for (int back = 0; i > 0 && back < 3 && ((unsigned char)s[i] & 0xC0) == 0x80; ++back) --i;
    return i;
}

static bool is_space_cp(UChar32 c) {
    return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20) ||
           c == 0x85 || c == 0xA0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) ||
           c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

static bool is_word_cp(UChar32 c) {
    if (c < 0) return false;
    if (c < 0x80) return std::isalnum(c) || c == '_';
    return (U_GET_GC_MASK(c) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

size_t space_len(const std::string& s, size_t pos) {
    if (pos >= s.size()) return 0;
    size_t len = 0;
    const UChar32 c = decode_at(s, pos, len);
    return is_space_cp(c) ? len : 0;
}

size_t skip_space(const std::string& s, size_t pos) {
    for (size_t n = space_len(s, pos); n != 0; n = space_len(s, pos)) pos += n;
    return pos;
}

std::string trim(const std::string& s) {
    const size_t i = skip_space(s, 0);
    size_t j = s.size();
    while (j > i) {
        const size_t st = prev_start(s, j);
        if (st < i || space_len(s, st) != j - st) break;
        j = st;
    }
    return s.substr(i, j - i);
}

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    for (char& c : out) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return out;
}

bool at_word_start(const std::string& s, size_t pos) {
    if (pos == 0) return true;
    const size_t st = prev_start(s, pos);
    size_t len = 0;
    const UChar32 c = decode_at(s, st, len);
    if (st + len != pos) return true;
    return !is_word_cp(c);
}

bool at_word_end(const std::string& s, size_t pos) {
    if (pos >= s.size()) return true;
    size_t len = 0;
    return !is_word_cp(decode_at(s, pos, len));
}

bool match_ci(const std::string& s, size_t pos, const char* lit) {
    const size_t n = std::strlen(lit);
    if (pos + n > s.size()) return false;
    for (size_t k = 0; k < n; ++k) {
        if (std::tolower((unsigned char)s[pos + k]) != (unsigned char)lit[k]) return false;
    }
    return true;
}

std::string fold_dashes(const std::string& s) {
    // U+2013 = E2 80 93, U+2014 = E2 80 94
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if ((unsigned char)s[i] == 0xE2 && i + 2 < s.size() &&
            (unsigned char)s[i + 1] == 0x80 &&
            ((unsigned char)s[i + 2] == 0x93 || (unsigned char)s[i + 2] == 0x94)) {
            out.push_back('-');
            i += 2;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string utf8_prefix(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // continuation bytes belong to the code point already counted
        if (((unsigned char)s[i] & 0xC0) == 0x80) continue;
        if (seen == n) return s.substr(0, i);
        ++seen;
    }
    return s;
}

// literal word (lowercase) at pos, followed by a word boundary; returns end or npos
static size_t match_word_ci(const std::string& s, size_t pos, const char* word) {
    if (!match_ci(s, pos, word)) return std::string::npos;
    const size_t end = pos + std::strlen(word);
    return at_word_end(s, end) ? end : std::string::npos;
}

size_t find_part_keyword(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (!match_ci(s, i, "part") || !at_word_start(s, i)) continue;
        if (match_word_ci(s, i, "part") != std::string::npos ||
            match_word_ci(s, i, "parts") != std::string::npos) {
            return i;
        }
    }
    return std::string::npos;
}

// "part of" / "parts of", any run of whitespace between the words
static bool match_parts_of(const std::string& s, size_t pos) {
    if (!match_ci(s, pos, "part")) return false;
    size_t i = pos + 4;
    if (i < s.size() && std::tolower((unsigned char)s[i]) == 's') ++i;
    const size_t after = skip_space(s, i);
    if (after == i) return false;
    return match_word_ci(s, after, "of") != std::string::npos;
}

// "usc", "u.s.c", "u.s.c." and every mix of the optional dots
static bool match_usc(const std::string& s, size_t pos) {
    size_t i = pos;
    if (!match_ci(s, i, "u")) return false;
    ++i;
    if (i < s.size() && s[i] == '.') ++i;
    if (!match_ci(s, i, "s")) return false;
    ++i;
    if (i < s.size() && s[i] == '.') ++i;
    if (!match_ci(s, i, "c")) return false;
    ++i;
    // a trailing '.' is itself a word boundary
    return at_word_end(s, i);
}

static bool match_fr_doc(const std::string& s, size_t pos) {
    if (!match_ci(s, pos, "fr")) return false;
    const size_t after = skip_space(s, pos + 2);
    if (after == pos + 2) return false;
    return match_word_ci(s, after, "doc") != std::string::npos;
}

size_t find_stop_phrase(const std::string& s) {
    static const char* const words[] = {"subchapter", "chapter", "section", "rin", "rins"};

    for (size_t i = 0; i < s.size(); ++i) {
        if (!std::isalpha((unsigned char)s[i]) || !at_word_start(s, i)) continue;

        for (const char* w : words) {
            if (match_word_ci(s, i, w) != std::string::npos) return i;
        }
        if (match_parts_of(s, i) || match_usc(s, i) || match_fr_doc(s, i)) return i;
    }
    return std::string::npos;
}

}  // namespace cfr::textutil
