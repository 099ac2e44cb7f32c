#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

// One raw citation per line. A line equal to null_token (when non-empty) stands for "no value".
std::vector<std::optional<std::string>> readCitationLines(std::istream& in, const std::string& null_token = "");

// path "-" reads stdin; throws std::runtime_error when the file can't be opened
std::vector<std::optional<std::string>> loadCitationLines(const std::string& path, const std::string& null_token = "");
