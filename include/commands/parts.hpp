#pragma once
#include "cfr/Citation.hpp"
#include "io/Printer.hpp"

#include <optional>
#include <string>
#include <vector>

// comma-joined parts of `title`, one line per input (blank line when none)
void write_parts(const std::vector<std::optional<std::string>>& inputs,
                 const std::string& title,
                 const cfr::NormalizerConfig& cfg,
                 Printer& pr);

// cfrnorm parts: parts cited under one title, one line per citation
int cmd_parts(int argc, char** argv);
