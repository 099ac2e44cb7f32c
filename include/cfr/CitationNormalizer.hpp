#pragma once
#include "cfr/Citation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cfr {

// Parse a raw CFR citation ("42 CFR Parts 405, 412, and 489", "42 CFR Part 412; 45 CFR Part 155", ...)
// into {title, part} references plus a status. Never throws; odd input ends up unparsed / no_cfr.
//
//   nullopt             -> empty, raw stays nullopt
//   blank               -> empty, raw == ""
//   refs found          -> parsed
//   "<n> CFR", no parts -> unparsed
//   parts + "Part" cue  -> missing_title (title == "")
//   otherwise           -> no_cfr
NormalizationResult normalize(const std::optional<std::string>& raw, const NormalizerConfig& cfg = {});

// normalize() rendered as compact, key-sorted, ASCII-only JSON (one text column per citation)
std::string normalize_to_compact_text(const std::optional<std::string>& raw, const NormalizerConfig& cfg = {});

// parts cited under one title, in first-seen order
std::vector<std::string> extract_parts_for_title(const std::optional<std::string>& raw,
                                                 const std::string& title,
                                                 const NormalizerConfig& cfg = {});
std::vector<std::string> extract_parts_for_title(const std::optional<std::string>& raw,
                                                 long long title,
                                                 const NormalizerConfig& cfg = {});

}  // namespace cfr
