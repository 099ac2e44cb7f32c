#include "io/CitationInput.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

std::vector<std::optional<std::string>> readCitationLines(std::istream& in, const std::string& null_token) {
    std::vector<std::optional<std::string>> lines;
    std::string cur;

    while (std::getline(in, cur)) {
        if (!cur.empty() && cur.back() == '\r') cur.pop_back();
        if (!null_token.empty() && cur == null_token) lines.emplace_back(std::nullopt);
        else lines.emplace_back(cur);
    }

    if (in.bad()) throw std::runtime_error("failed to read citation input");
    return lines;
}

std::vector<std::optional<std::string>> loadCitationLines(const std::string& path, const std::string& null_token) {
    if (path == "-") return readCitationLines(std::cin, null_token);

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open citation file: " + path);
    }
    return readCitationLines(in, null_token);
}
