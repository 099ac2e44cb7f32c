#include <catch2/catch_test_macros.hpp>
#include "cfr/CitationNormalizer.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

using cfr::Reference;
using cfr::Status;
using Refs = std::vector<Reference>;

TEST_CASE("single part with and without the Part keyword", "[normalize]")
{
    auto r = cfr::normalize("42 CFR Part 412");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "412"}});

    r = cfr::normalize("42 CFR 412");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "412"}});
}

TEST_CASE("multi-part list keeps citation order", "[normalize]")
{
    const auto r = cfr::normalize("42 CFR Parts 405, 417, 422, and 460");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "405"}, {"42", "417"}, {"42", "422"}, {"42", "460"}});
}

TEST_CASE("part range is expanded", "[normalize]")
{
    const auto r = cfr::normalize("42 CFR Parts 410-412");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "410"}, {"42", "411"}, {"42", "412"}});
}

TEST_CASE("multiple titles", "[normalize]")
{
    const auto r = cfr::normalize("42 CFR Part 412; 45 CFR Part 155");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "412"}, {"45", "155"}});
}

TEST_CASE("adjacent title markers don't bleed into each other", "[normalize]")
{
    const auto r = cfr::normalize("42 CFR 45 CFR 155");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"45", "155"}});
}

TEST_CASE("repeated title/part pairs are dropped across segments", "[normalize]")
{
    const auto r = cfr::normalize("42 CFR Part 412; 42 CFR Parts 411-413");
    REQUIRE(r.references == Refs{{"42", "412"}, {"42", "411"}, {"42", "413"}});
}

TEST_CASE("oversized range emits only its endpoints", "[normalize]")
{
    auto r = cfr::normalize("42 CFR Parts 1-500");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "1"}, {"42", "500"}});

    cfr::NormalizerConfig cfg;
    cfg.max_range_span = 1000;
    r = cfr::normalize("42 CFR Parts 1-500", cfg);
    REQUIRE(r.references.size() == 500);
    REQUIRE(r.references.front() == Reference{"42", "1"});
    REQUIRE(r.references.back() == Reference{"42", "500"});
}

TEST_CASE("missing title with a Part cue", "[normalize]")
{
    auto r = cfr::normalize("Part 412");
    REQUIRE(r.status == Status::MissingTitle);
    REQUIRE(r.references == Refs{{"", "412"}});

    r = cfr::normalize("Parts 405 and 410-412");
    REQUIRE(r.status == Status::MissingTitle);
    REQUIRE(r.references == Refs{{"", "410"}, {"", "411"}, {"", "412"}, {"", "405"}});
}

TEST_CASE("numbers without a title or Part cue are no_cfr", "[normalize]")
{
    auto r = cfr::normalize("RIN 0938-AV01");
    REQUIRE(r.status == Status::NoCfr);
    REQUIRE(r.references.empty());

    r = cfr::normalize("See 412 for details");
    REQUIRE(r.status == Status::NoCfr);
    REQUIRE(r.references.empty());

    r = cfr::normalize("Medicare program; hospital inpatient rates");
    REQUIRE(r.status == Status::NoCfr);
}

TEST_CASE("title marker without parts is unparsed", "[normalize]")
{
    auto r = cfr::normalize("42 CFR");
    REQUIRE(r.status == Status::Unparsed);
    REQUIRE(r.references.empty());

    r = cfr::normalize("42 CFR Chapter IV");
    REQUIRE(r.status == Status::Unparsed);
    REQUIRE(r.references.empty());
}

TEST_CASE("absent and blank input are empty", "[normalize]")
{
    auto r = cfr::normalize(std::nullopt);
    REQUIRE(r.status == Status::Empty);
    REQUIRE(r.references.empty());
    REQUIRE_FALSE(r.raw.has_value());

    r = cfr::normalize("");
    REQUIRE(r.status == Status::Empty);
    REQUIRE(r.raw == std::optional<std::string>(""));

    r = cfr::normalize(" \t\n ");
    REQUIRE(r.status == Status::Empty);
    REQUIRE(r.raw == std::optional<std::string>(""));
}

TEST_CASE("raw is stored trimmed", "[normalize]")
{
    const auto r = cfr::normalize("  42 CFR Part 412 \n");
    REQUIRE(r.raw == std::optional<std::string>("42 CFR Part 412"));
}

TEST_CASE("normalize is deterministic and never repeats a reference", "[normalize]")
{
    const std::vector<std::string> inputs = {
        "42 CFR Parts 405, 412, and 489",
        "42 CFR Parts 410-415; 42 CFR Part 412; 45 CFR 412",
        "42 CFR Part 412, 412.5, 412.50, 0412",
        "Parts 1, 1, 1-3",
        "42 CFR 400 to 405 and 402 through 404",
        "21 CFR Parts 1-2000",
    };

    for (const auto& in : inputs) {
        const auto a = cfr::normalize(in);
        const auto b = cfr::normalize(in);
        REQUIRE(a.status == b.status);
        REQUIRE(a.references == b.references);

        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& ref : a.references) {
            REQUIRE(seen.insert({ref.title, ref.part}).second);
        }
    }
}

TEST_CASE("extract_parts_for_title filters one title", "[normalize]")
{
    const std::string raw = "42 CFR Part 412; 45 CFR Part 155; 42 CFR 489";
    REQUIRE(cfr::extract_parts_for_title(raw, 42) == std::vector<std::string>{"412", "489"});
    REQUIRE(cfr::extract_parts_for_title(raw, "042") == std::vector<std::string>{"412", "489"});
    REQUIRE(cfr::extract_parts_for_title(raw, 45) == std::vector<std::string>{"155"});
    REQUIRE(cfr::extract_parts_for_title(raw, 21).empty());
    REQUIRE(cfr::extract_parts_for_title(std::nullopt, 42).empty());
}

TEST_CASE("status names round-trip", "[normalize]")
{
    for (Status s : {Status::Empty, Status::Parsed, Status::MissingTitle, Status::Unparsed, Status::NoCfr}) {
        REQUIRE(cfr::parse_status(cfr::status_str(s)) == s);
    }
    REQUIRE(std::string(cfr::status_str(Status::MissingTitle)) == "missing_title");
    REQUIRE(std::string(cfr::status_str(Status::NoCfr)) == "no_cfr");
    REQUIRE_FALSE(cfr::parse_status("PARSED").has_value());
    REQUIRE_FALSE(cfr::parse_status("").has_value());
}

TEST_CASE("non-breaking and other Unicode spaces separate tokens", "[normalize]")
{
    auto r = cfr::normalize("42\u00a0CFR Part 412");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "412"}});

    r = cfr::normalize("42 CFR\u00a0Part\u00a0412; 45\u00a0CFR 155");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.references == Refs{{"42", "412"}, {"45", "155"}});

    r = cfr::normalize("\u3000" "42\u2002CFR\u2002412\u3000");
    REQUIRE(r.status == Status::Parsed);
    REQUIRE(r.raw == std::optional<std::string>("42\u2002CFR\u2002412"));
    REQUIRE(r.references == Refs{{"42", "412"}});
}

TEST_CASE("input of Unicode whitespace only is empty", "[normalize]")
{
    auto r = cfr::normalize("\u00a0");
    REQUIRE(r.status == Status::Empty);
    REQUIRE(r.raw == std::optional<std::string>(""));
    REQUIRE(r.references.empty());

    r = cfr::normalize(" \u3000\u2028 ");
    REQUIRE(r.status == Status::Empty);
}

TEST_CASE("a letter glued to Part is not a Part cue", "[normalize]")
{
    const auto r = cfr::normalize("\u00e9Part 412");
    REQUIRE(r.status == Status::NoCfr);
    REQUIRE(r.references.empty());
}

TEST_CASE("extract_parts_for_title accepts an underscore-grouped title", "[normalize]")
{
    const std::string raw = "42 CFR Part 412; 45 CFR Part 155";
    REQUIRE(cfr::extract_parts_for_title(raw, "4_2") == std::vector<std::string>{"412"});
    REQUIRE(cfr::extract_parts_for_title(raw, "_42").empty());
}
