#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cfr {

enum class Status {
    Empty,         // no input or blank input
    Parsed,        // at least one reference with a known title
    MissingTitle,  // parts found with a Part/Parts cue, but no "<n> CFR" marker
    Unparsed,      // a "<n> CFR" marker was found, but no parts in its body
    NoCfr          // neither
};

struct Reference {
    std::string title;   // canonical numeral, "" when unknown
    std::string part;    // canonical numeral, may keep a fraction ("412.5")

    bool operator==(const Reference& o) const { return title == o.title && part == o.part; }
    bool operator!=(const Reference& o) const { return !(*this == o); }
};

struct NormalizationResult {
    std::optional<std::string> raw;     // trimmed input; nullopt when no input was given
    Status status = Status::Empty;
    std::vector<Reference> references;  // first-seen order, no duplicates
};

// tunables for the two guards in the part extractor
struct NormalizerConfig {
    // code points scanned when a body carries no "Part"/"Parts" keyword
    size_t fallback_window = 120;

    // a range whose (end - start) exceeds this emits only its two endpoints
    long max_range_span = 300;
};

const char* status_str(Status s);
std::optional<Status> parse_status(const std::string& s);

}  // namespace cfr
