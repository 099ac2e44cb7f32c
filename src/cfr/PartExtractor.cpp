#include "cfr/PartExtractor.hpp"
#include "cfr/Numerals.hpp"
#include "cfr/TextUtil.hpp"
#include <unordered_set>

namespace cfr {

static void add_unique(std::vector<std::string>& out, std::unordered_set<std::string>& seen, const std::string& item) {
    if (item.empty()) return;
    if (seen.insert(item).second) out.push_back(item);
}

bool PartExtractor::has_part_keyword(const std::string& text) {
    return textutil::find_part_keyword(text) != std::string::npos;
}

std::string PartExtractor::working_window(const std::string& text) const {
    const size_t kw = textutil::find_part_keyword(text);

    // no keyword: only look near the title so trailing prose can't contribute stray numbers
    std::string window = (kw != std::string::npos)
        ? text.substr(kw)
        : textutil::utf8_prefix(text, m_cfg.fallback_window);

    const size_t stop = textutil::find_stop_phrase(window);
    if (stop != std::string::npos) window.resize(stop);
    return window;
}

std::string PartExtractor::blank_out_ranges(const std::string& window) {
    std::string out;
    out.reserve(window.size());

    size_t pos = 0;
    for (const auto& r : find_ranges(window)) {
        out.append(window, pos, r.begin - pos);
        out.push_back(' ');
        pos = r.end;
    }
    out.append(window, pos, std::string::npos);
    return out;
}

std::vector<std::string> PartExtractor::extract(const std::string& body) const {
    const std::string text = textutil::trim(textutil::fold_dashes(body));
    if (text.empty()) return {};

    const std::string window = working_window(text);

    std::vector<std::string> parts;
    std::unordered_set<std::string> seen;

    for (const auto& r : find_ranges(window)) {
        for (const auto& v : expand_range(r.first, r.second, m_cfg.max_range_span)) {
            add_unique(parts, seen, canonical_number(v));
        }
    }

    for (const auto& tok : find_numerals(blank_out_ranges(window))) {
        add_unique(parts, seen, canonical_number(tok));
    }

    return parts;
}

}  // namespace cfr
