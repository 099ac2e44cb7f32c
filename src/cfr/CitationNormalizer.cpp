#include "cfr/CitationNormalizer.hpp"
#include "cfr/Numerals.hpp"
#include "cfr/PartExtractor.hpp"
#include "cfr/ResultJson.hpp"
#include "cfr/TextUtil.hpp"
#include "cfr/TitleSplitter.hpp"

#include <unordered_set>

namespace cfr {

NormalizationResult normalize(const std::optional<std::string>& raw, const NormalizerConfig& cfg) {
    NormalizationResult res;
    if (!raw) return res;

    res.raw = textutil::trim(*raw);
    const std::string& text = *res.raw;
    if (text.empty()) return res;

    const TitleSplitter splitter{};
    const PartExtractor extractor(cfg);

    // title + '\n' + part; neither side can contain a newline
    std::unordered_set<std::string> seen;

    const auto segments = splitter.split(text);
    for (const auto& seg : segments) {
        for (const auto& part : extractor.extract(seg.body)) {
            if (!seen.insert(seg.title + "\n" + part).second) continue;
            res.references.push_back({seg.title, part});
        }
    }

    if (!res.references.empty()) {
        res.status = Status::Parsed;
        return res;
    }

    if (!segments.empty()) {
        res.status = Status::Unparsed;
        return res;
    }

    // No title marker. Numbers alone are not enough ("RIN 0938-AV01"); require a Part/Parts cue.
    const auto inferred = extractor.extract(text);
    if (!inferred.empty() && PartExtractor::has_part_keyword(text)) {
        res.status = Status::MissingTitle;
        for (const auto& part : inferred) {
            res.references.push_back({"", part});
        }
        return res;
    }

    res.status = Status::NoCfr;
    return res;
}

std::string normalize_to_compact_text(const std::optional<std::string>& raw, const NormalizerConfig& cfg) {
    return to_compact_text(normalize(raw, cfg));
}

std::vector<std::string> extract_parts_for_title(const std::optional<std::string>& raw,
                                                 const std::string& title,
                                                 const NormalizerConfig& cfg) {
    const std::string want = canonical_number(title);
    const NormalizationResult res = normalize(raw, cfg);

    std::vector<std::string> parts;
    std::unordered_set<std::string> seen;
    for (const auto& ref : res.references) {
        if (ref.title != want || ref.part.empty()) continue;
        if (seen.insert(ref.part).second) parts.push_back(ref.part);
    }
    return parts;
}

std::vector<std::string> extract_parts_for_title(const std::optional<std::string>& raw,
                                                 long long title,
                                                 const NormalizerConfig& cfg) {
    return extract_parts_for_title(raw, std::to_string(title), cfg);
}

}  // namespace cfr
