#pragma once
#include <string>
#include <vector>

namespace cfr {

struct TitleSegment {
    std::string title;  // canonical title numeral
    std::string body;   // text after "CFR" up to the next title marker
};

// Splits "42 CFR Part 412; 45 CFR Part 155" into one segment per "<n> CFR" marker.
class TitleSplitter {
public:
    std::vector<TitleSegment> split(const std::string& text) const;

private:
    // "<digits> ws* CFR" ending on a word boundary; fills the digit span and the offset after "CFR"
    static bool match_marker(const std::string& s, size_t pos, size_t& digits_end, size_t& marker_end);

    // start of the next marker that begins on a word boundary, or s.size()
    static size_t find_body_end(const std::string& s, size_t from);
};

}  // namespace cfr
