#include "cfr/Numerals.hpp"
#include "cfr/TextUtil.hpp"
#include <stdexcept>
#include <utility>

namespace cfr {

using textutil::is_digit;
using textutil::skip_space;

std::string canonical_number(const std::string& raw) {
    std::string s = textutil::trim(raw);
    if (s.empty()) return s;

    if (s.find('.') != std::string::npos) {
        // keep the fraction, drop its trailing zeros and a dangling point
        s.erase(s.find_last_not_of('0') + 1);
        s.erase(s.find_last_not_of('.') + 1);
        return s;
    }

    size_t i = 0;
    bool negative = false;
    if (s[0] == '+' || s[0] == '-') {
        negative = (s[0] == '-');
        i = 1;
    }
    if (i == s.size()) return s;

    // digits, with single '_' separators allowed between them ("1_000")
    std::string digits;
    for (size_t k = i; k < s.size(); ++k) {
        const unsigned char c = (unsigned char)s[k];
        if (is_digit(c)) {
            digits += (char)c;
            continue;
        }
        const bool between = c == '_' && k > i && k + 1 < s.size() &&
                             is_digit((unsigned char)s[k - 1]) && is_digit((unsigned char)s[k + 1]);
        if (!between) return s;
    }

    size_t z = 0;
    while (z + 1 < digits.size() && digits[z] == '0') ++z;
    digits.erase(0, z);
    if (digits == "0") return digits;
    return negative ? "-" + digits : digits;
}

// numeral starting at pos; returns its end or npos
static size_t match_numeral(const std::string& s, size_t pos) {
    size_t j = pos;
    while (j < s.size() && is_digit((unsigned char)s[j])) ++j;

    const size_t len = j - pos;
    if (len == 0 || len > 4) return std::string::npos;

    if (j + 1 < s.size() && s[j] == '.' && is_digit((unsigned char)s[j + 1])) {
        ++j;
        while (j < s.size() && is_digit((unsigned char)s[j])) ++j;
    }
    return j;
}

static bool numeral_may_start(const std::string& s, size_t pos) {
    return is_digit((unsigned char)s[pos]) && (pos == 0 || !is_digit((unsigned char)s[pos - 1]));
}

static bool match_range(const std::string& s, size_t pos, NumeralRange& out) {
    const size_t first_end = match_numeral(s, pos);
    if (first_end == std::string::npos) return false;

    static const char* const separators[] = {"-", "to", "through", "thru"};

    const size_t sep = skip_space(s, first_end);
    for (const char* word : separators) {
        if (!textutil::match_ci(s, sep, word)) continue;

        const size_t second = skip_space(s, sep + std::char_traits<char>::length(word));
        const size_t second_end = match_numeral(s, second);
        if (second_end == std::string::npos) continue;

        out.begin = pos;
        out.end = second_end;
        out.first = s.substr(pos, first_end - pos);
        out.second = s.substr(second, second_end - second);
        return true;
    }
    return false;
}

std::vector<NumeralRange> find_ranges(const std::string& s) {
    std::vector<NumeralRange> out;
    size_t i = 0;
    while (i < s.size()) {
        NumeralRange r;
        if (numeral_may_start(s, i) && match_range(s, i, r)) {
            i = r.end;
            out.push_back(std::move(r));
            continue;
        }
        ++i;
    }
    return out;
}

std::vector<std::string> find_numerals(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        if (numeral_may_start(s, i)) {
            const size_t end = match_numeral(s, i);
            if (end != std::string::npos) {
                out.push_back(s.substr(i, end - i));
                i = end;
                continue;
            }
        }
        ++i;
    }
    return out;
}

static bool parse_long(const std::string& s, long& out) {
    try {
        size_t used = 0;
        out = std::stol(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> expand_range(const std::string& first, const std::string& second, long max_span) {
    if (first.find('.') != std::string::npos || second.find('.') != std::string::npos) {
        return {canonical_number(first), canonical_number(second)};
    }

    long a = 0, b = 0;
    if (!parse_long(first, a) || !parse_long(second, b)) {
        return {canonical_number(first), canonical_number(second)};
    }

    if (a > b) std::swap(a, b);
    if (b - a > max_span) {
        return {std::to_string(a), std::to_string(b)};
    }

    std::vector<std::string> out;
    out.reserve((size_t)(b - a + 1));
    for (long v = a; v <= b; ++v) out.push_back(std::to_string(v));
    return out;
}

}  // namespace cfr
