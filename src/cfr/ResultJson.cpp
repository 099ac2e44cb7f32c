#include "cfr/ResultJson.hpp"

namespace cfr {

static nlohmann::json reference_to_json(const Reference& ref) {
    nlohmann::json j;
    j["title"] = ref.title;
    j["part"] = ref.part;
    return j;
}

nlohmann::json result_to_json(const NormalizationResult& r) {
    nlohmann::json j;
    if (r.raw) j["raw"] = *r.raw;
    else j["raw"] = nullptr;

    j["status"] = status_str(r.status);

    nlohmann::json refs = nlohmann::json::array();
    for (const auto& ref : r.references) {
        refs.push_back(reference_to_json(ref));
    }
    j["references"] = refs;

    return j;
}

std::string to_compact_text(const NormalizationResult& r) {
    // nlohmann::json objects are std::map-backed, so keys come out sorted.
    // replace: raw text with broken UTF-8 must not make serialization throw
    return result_to_json(r).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

}  // namespace cfr
