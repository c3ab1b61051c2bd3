#include "miniparse/commands/config.hpp"

#include "miniparse/config/ConfigLoader.hpp"
#include "miniparse/io/JsonIO.hpp"

#include <iostream>
#include <string>

namespace miniparse {

static int config_usage() {
    std::cerr
        << "usage:\n"
        << "  miniparse config [--config <path>]\n";
    return 1;
}

int cmd_config(int argc, char** argv) {
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--help") return config_usage();

        if (a == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "error: --config requires a value\n";
                return 1;
            }
            config_path = argv[++i];
            continue;
        }

        std::cerr << "error: unknown arg: " << a << "\n";
        return config_usage();
    }

    const Settings settings = ConfigLoader::load(config_path);
    std::cout << to_json(settings).dump(2) << "\n";
    return 0;
}

} // namespace miniparse
