#include "commands/normalize.hpp"
#include "commands/args.hpp"

#include "cfr/CitationNormalizer.hpp"
#include "cfr/ResultJson.hpp"
#include "io/CitationInput.hpp"
#include "io/Printer.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

static int normalize_usage() {
    std::cerr
        << "usage:\n"
        << "  cfrnorm normalize [--text <str> | --in <path>] [options]\n"
        << "\n"
        << "input:\n"
        << "  --text <str>                 normalize one citation\n"
        << "  --in <path>                  one citation per line; default: - (stdin)\n"
        << "  --null <token>               lines equal to <token> count as missing input\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 optional: mirror results to a file\n"
        << "  --status <s>                 only print results with this status\n"
        << "                               (empty|parsed|missing_title|unparsed|no_cfr)\n"
        << "\n"
        << "parsing:\n"
        << "  --window <n>                 default: 120\n"
        << "  --max_span <n>               default: 300\n";
    return 2;
}

std::map<std::string, size_t> write_normalized(const std::vector<std::optional<std::string>>& inputs,
                                               const cfr::NormalizerConfig& cfg,
                                               const std::optional<cfr::Status>& only,
                                               Printer& pr) {
    std::map<std::string, size_t> tally;
    for (const auto& raw : inputs) {
        const cfr::NormalizationResult res = cfr::normalize(raw, cfg);
        tally[cfr::status_str(res.status)] += 1;

        if (only && res.status != *only) continue;
        pr << cfr::to_compact_text(res) << "\n";
    }
    return tally;
}

void print_tally(std::ostream& os, size_t total, const std::map<std::string, size_t>& tally) {
    os << "normalized " << total;
    for (const auto& [status, n] : tally) {
        os << " " << status << "=" << n;
    }
    os << "\n";
}

int cmd_normalize(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        normalize_usage();
        return 0;
    }

    const std::string text       = get_arg(argc, argv, "--text", "");
    const std::string in_path    = get_arg(argc, argv, "--in", "-");
    const std::string out_path   = get_arg(argc, argv, "--out", "");
    const std::string status_s   = get_arg(argc, argv, "--status", "");
    const std::string null_token = get_arg(argc, argv, "--null", "");

    cfr::NormalizerConfig cfg;
    if (!parse_normalizer_config(argc, argv, cfg)) return normalize_usage();

    std::optional<cfr::Status> only;
    if (!status_s.empty()) {
        only = cfr::parse_status(status_s);
        if (!only) {
            std::cerr << "error: unknown --status: " << status_s << "\n";
            return normalize_usage();
        }
    }

    std::vector<std::optional<std::string>> inputs;
    if (has_flag(argc, argv, "--text")) {
        inputs.emplace_back(text);
    } else {
        try {
            inputs = loadCitationLines(in_path, null_token);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    std::ofstream out;
    bool write_out = false;
    if (!out_path.empty()) {
        write_out = open_out(out, out_path);
        if (!write_out) {
            std::cerr << "error: failed to open --out path: " << out_path << "\n";
            return 1;
        }
    }

    Printer pr;
    pr.a = &std::cout;
    pr.b = write_out ? (std::ostream*)&out : nullptr;

    const auto tally = write_normalized(inputs, cfg, only, pr);
    print_tally(std::cerr, inputs.size(), tally);

    if (write_out && !out) {
        std::cerr << "error: failed writing --out path: " << out_path << "\n";
        return 1;
    }
    return 0;
}
