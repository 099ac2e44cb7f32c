#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "cfr/Citation.hpp"

namespace cfr {

// {"raw": <string|null>, "references": [{"part": .., "title": ..}], "status": ".."}
nlohmann::json result_to_json(const NormalizationResult& r);

// compact separators, sorted keys, non-ASCII escaped as \uXXXX
std::string to_compact_text(const NormalizationResult& r);

}  // namespace cfr
