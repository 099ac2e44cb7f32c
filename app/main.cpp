#include "commands/normalize.hpp"
#include "commands/parts.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  cfrnorm normalize [args]\n"
        << "  cfrnorm parts --title <n> [args]\n"
        << "  cfrnorm help\n"
        << "\n"
        << "run 'cfrnorm <command> --help' for command options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "normalize") return cmd_normalize(argc - 1, argv + 1);
    if (cmd == "parts")     return cmd_parts(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
