#include "miniparse/commands/config.hpp"
#include "miniparse/commands/parse.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  miniparse parse [args]\n"
        << "  miniparse config [args]\n"
        << "  miniparse help\n"
        << "\n"
        << "run 'miniparse <command> --help' for command options\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "parse")  return miniparse::cmd_parse(argc - 1, argv + 1);
    if (cmd == "config") return miniparse::cmd_config(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
