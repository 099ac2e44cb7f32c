#pragma once
#include <string>

namespace cfr::textutil {

// Whitespace and word characters are judged per UTF-8 code point:
//   space: \t\n\v\f\r, U+001C-001F, U+0020, U+0085, U+00A0, U+1680, U+2000-200A,
//          U+2028, U+2029, U+202F, U+205F, U+3000
//   word:  '_' and any letter or number (general category L* / N*)

// strip whitespace from both ends
std::string trim(const std::string& s);

std::string to_lower_ascii(const std::string& s);

inline bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }

// byte length of the whitespace code point at pos, 0 if there is none
size_t space_len(const std::string& s, size_t pos);

// first offset at or after pos that does not start a whitespace code point
size_t skip_space(const std::string& s, size_t pos);

// true when a word may start at pos (previous code point is not a word char)
bool at_word_start(const std::string& s, size_t pos);

// true when a word may end at pos (code point at pos is not a word char, or end of text)
bool at_word_end(const std::string& s, size_t pos);

// case-insensitive literal match of `lit` (lowercase) at pos
bool match_ci(const std::string& s, size_t pos, const char* lit);

// en dash / em dash -> '-'
std::string fold_dashes(const std::string& s);

// first n code points of a UTF-8 string
std::string utf8_prefix(const std::string& s, size_t n);

// first whole-word "part" / "parts" (any case), npos if absent
size_t find_part_keyword(const std::string& s);

// first phrase that closes a part list ("subchapter", "section", "u.s.c.", "fr doc", "rin", ...)
size_t find_stop_phrase(const std::string& s);

}  // namespace cfr::textutil
