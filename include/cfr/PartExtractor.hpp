#pragma once
#include "cfr/Citation.hpp"
#include <string>
#include <vector>

namespace cfr {

class PartExtractor {
public:
    explicit PartExtractor(const NormalizerConfig& cfg = {}) : m_cfg(cfg) {}

    // canonical part numerals cited in one title body, ranges first, no duplicates
    std::vector<std::string> extract(const std::string& body) const;

    // whole-word "Part"/"Parts" anywhere in text
    static bool has_part_keyword(const std::string& text);

private:
    // text from the "Part" keyword (or the first fallback_window code points), cut at the first stop phrase
    std::string working_window(const std::string& text) const;

    static std::string blank_out_ranges(const std::string& window);

    NormalizerConfig m_cfg;
};

}  // namespace cfr
