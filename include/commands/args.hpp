#pragma once
#include "cfr/Citation.hpp"
#include <string>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// --window / --max_span; prints "error: ..." and returns false on a bad value
bool parse_normalizer_config(int argc, char** argv, cfr::NormalizerConfig& cfg);
