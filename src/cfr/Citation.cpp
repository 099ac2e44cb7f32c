#include "cfr/Citation.hpp"

namespace cfr {

const char* status_str(Status s) {
    switch (s) {
        case Status::Empty: return "empty";
        case Status::Parsed: return "parsed";
        case Status::MissingTitle: return "missing_title";
        case Status::Unparsed: return "unparsed";
        case Status::NoCfr: return "no_cfr";
    }
    return "unknown";
}

std::optional<Status> parse_status(const std::string& s) {
    if (s == "empty") return Status::Empty;
    if (s == "parsed") return Status::Parsed;
    if (s == "missing_title") return Status::MissingTitle;
    if (s == "unparsed") return Status::Unparsed;
    if (s == "no_cfr") return Status::NoCfr;
    return std::nullopt;
}

}  // namespace cfr
