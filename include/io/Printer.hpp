#pragma once
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>

// tee for the commands: `a` is stdout, `b` the optional --out file that mirrors it
struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

// opens (truncating) out_path, creating parent dirs; false if that fails
inline bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        std::filesystem::path p(out_path);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc);
        return (bool)out;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}
