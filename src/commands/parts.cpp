#include "commands/parts.hpp"
#include "commands/args.hpp"

#include "cfr/CitationNormalizer.hpp"
#include "io/CitationInput.hpp"
#include "io/Printer.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

static int parts_usage() {
    std::cerr
        << "usage:\n"
        << "  cfrnorm parts --title <n> [--text <str> | --in <path>] [options]\n"
        << "\n"
        << "  --title <n>                  (required) CFR title, e.g. 42\n"
        << "  --text <str>                 one citation\n"
        << "  --in <path>                  one citation per line; default: - (stdin)\n"
        << "  --null <token>               lines equal to <token> count as missing input\n"
        << "  --out <path>                 optional: mirror output to a file\n"
        << "  --window <n>                 default: 120\n"
        << "  --max_span <n>               default: 300\n";
    return 2;
}

void write_parts(const std::vector<std::optional<std::string>>& inputs,
                 const std::string& title,
                 const cfr::NormalizerConfig& cfg,
                 Printer& pr) {
    for (const auto& raw : inputs) {
        const auto parts = cfr::extract_parts_for_title(raw, title, cfg);
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) pr << ",";
            pr << parts[i];
        }
        pr << "\n";
    }
}

int cmd_parts(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) {
        parts_usage();
        return 0;
    }

    const std::string title      = get_arg(argc, argv, "--title", "");
    const std::string text       = get_arg(argc, argv, "--text", "");
    const std::string in_path    = get_arg(argc, argv, "--in", "-");
    const std::string out_path   = get_arg(argc, argv, "--out", "");
    const std::string null_token = get_arg(argc, argv, "--null", "");

    if (title.empty()) {
        std::cerr << "error: missing --title\n";
        return parts_usage();
    }

    cfr::NormalizerConfig cfg;
    if (!parse_normalizer_config(argc, argv, cfg)) return parts_usage();

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

    write_parts(inputs, title, cfg, pr);

    if (write_out && !out) {
        std::cerr << "error: failed writing --out path: " << out_path << "\n";
        return 1;
    }
    return 0;
}
