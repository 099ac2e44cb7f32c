#include "commands/args.hpp"

#include <iostream>
#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

bool parse_normalizer_config(int argc, char** argv, cfr::NormalizerConfig& cfg) {
    const std::string window_s = get_arg(argc, argv, "--window", "");
    const std::string span_s   = get_arg(argc, argv, "--max_span", "");

    if (!window_s.empty()) {
        try { cfg.fallback_window = (size_t)std::stoul(window_s); }
        catch (const std::exception&) {
            std::cerr << "error: invalid --window\n";
            return false;
        }
    }

    if (!span_s.empty()) {
        try { cfg.max_range_span = std::stol(span_s); }
        catch (const std::exception&) {
            std::cerr << "error: invalid --max_span\n";
            return false;
        }
        if (cfg.max_range_span < 0) {
            std::cerr << "error: --max_span must be >= 0\n";
            return false;
        }
    }

    return true;
}
