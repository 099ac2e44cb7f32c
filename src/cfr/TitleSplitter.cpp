#include "cfr/TitleSplitter.hpp"
#include "cfr/Numerals.hpp"
#include "cfr/TextUtil.hpp"
#include <utility>

namespace cfr {

using textutil::is_digit;

bool TitleSplitter::match_marker(const std::string& s, size_t pos, size_t& digits_end, size_t& marker_end) {
    size_t i = pos;
    while (i < s.size() && is_digit((unsigned char)s[i])) ++i;
    if (i == pos) return false;
    digits_end = i;

    i = textutil::skip_space(s, i);
    if (!textutil::match_ci(s, i, "cfr")) return false;
    i += 3;

    // "CFRs", "CFR412" are not markers
    if (!textutil::at_word_end(s, i)) return false;
    marker_end = i;
    return true;
}

size_t TitleSplitter::find_body_end(const std::string& s, size_t from) {
    size_t digits_end = 0, marker_end = 0;
    for (size_t i = from; i < s.size(); ++i) {
        if (!is_digit((unsigned char)s[i]) || !textutil::at_word_start(s, i)) continue;
        if (match_marker(s, i, digits_end, marker_end)) return i;
    }
    return s.size();
}

std::vector<TitleSegment> TitleSplitter::split(const std::string& text) const {
    std::vector<TitleSegment> out;

    size_t pos = 0;
    while (pos < text.size()) {
        // The first marker may start anywhere (even right after a letter).
        // Later ones are found by find_body_end, which requires a word boundary.
        size_t start = std::string::npos;
        size_t digits_end = 0, marker_end = 0;
        for (size_t i = pos; i < text.size(); ++i) {
            if (!is_digit((unsigned char)text[i])) continue;
            if (match_marker(text, i, digits_end, marker_end)) {
                start = i;
                break;
            }
            // the rest of this digit run shares the same tail, so it cannot match either
            while (i + 1 < text.size() && is_digit((unsigned char)text[i + 1])) ++i;
        }
        if (start == std::string::npos) break;

        const size_t body_end = find_body_end(text, marker_end);

        TitleSegment seg;
        seg.title = canonical_number(text.substr(start, digits_end - start));
        seg.body = text.substr(marker_end, body_end - marker_end);
        out.push_back(std::move(seg));

        pos = body_end;
    }

    return out;
}

}  // namespace cfr
