#pragma once
#include <string>
#include <vector>

namespace cfr {

// "0405" -> "405", "412.50" -> "412.5", "412.00" -> "412".
// Text that is not an integer comes back trimmed but otherwise unchanged.
std::string canonical_number(const std::string& raw);

// A numeral is 1-4 digits with an optional ".<digits>" fraction. A longer
// digit run is never a numeral, and no part of it is either.
struct NumeralRange {
    size_t begin = 0;      // offset of the first numeral
    size_t end = 0;        // one past the second numeral
    std::string first;
    std::string second;
};

// "410-412", "410 to 412", "410 through 412", "410 thru 412" (any case), left to right, non-overlapping
std::vector<NumeralRange> find_ranges(const std::string& s);

// every standalone numeral, left to right
std::vector<std::string> find_numerals(const std::string& s);

// Integer ranges expand to every value (ends swapped if reversed) unless
// end - start > max_span, in which case only the two ends are returned.
// Ranges with a fractional end are never expanded.
std::vector<std::string> expand_range(const std::string& first, const std::string& second, long max_span);

}  // namespace cfr
