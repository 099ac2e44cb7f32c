#pragma once
#include "cfr/Citation.hpp"
#include "io/Printer.hpp"

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

// one compact JSON line per input; inputs whose status differs from `only` are
// counted but not printed. Returns the per-status counts of all inputs.
std::map<std::string, size_t> write_normalized(const std::vector<std::optional<std::string>>& inputs,
                                               const cfr::NormalizerConfig& cfg,
                                               const std::optional<cfr::Status>& only,
                                               Printer& pr);

// "normalized <total> <status>=<n> ..."
void print_tally(std::ostream& os, size_t total, const std::map<std::string, size_t>& tally);

// cfrnorm normalize: one compact JSON result per citation
int cmd_normalize(int argc, char** argv);
