#include "miniparse/commands/parse.hpp"

#include "miniparse/config/ConfigLoader.hpp"
#include "miniparse/core/Pipeline.hpp"
#include "miniparse/io/JsonIO.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace miniparse {

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  miniparse parse [options]\n"
        << "\n"
        << "input (stdin when neither is given):\n"
        << "  --text <str>                 text to process\n"
        << "  --input <path>               read text from a file\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: ./miniparse.config.yaml, then default.yaml\n"
        << "  --out <path>                 write JSON to a file instead of stdout\n"
        << "  --compact                    single-line JSON\n";
    return 1;
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open input file: " + path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

int cmd_parse(int argc, char** argv) {
    std::string config_path;
    std::string text;
    bool has_text = false;
    std::string input_path;
    std::string out_path;
    bool compact = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--help") return parse_usage();

        if (a == "--compact") {
            compact = true;
            continue;
        }

        if (a == "--config" || a == "--text" || a == "--input" || a == "--out") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << a << " requires a value\n";
                return 1;
            }
            const std::string v = argv[++i];
            if (a == "--config") config_path = v;
            else if (a == "--text") { text = v; has_text = true; }
            else if (a == "--input") input_path = v;
            else out_path = v;
            continue;
        }

        std::cerr << "error: unknown arg: " << a << "\n";
        return parse_usage();
    }

    if (has_text && !input_path.empty()) {
        std::cerr << "error: --text and --input are mutually exclusive\n";
        return parse_usage();
    }

    try {
        if (!input_path.empty()) {
            text = read_file(input_path);
        } else if (!has_text) {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }

        const Pipeline pipeline = Pipeline::from_config_file(config_path);
        const IntentResult result = pipeline.process(text);
        const nlohmann::json j = to_json(result);

        if (!out_path.empty()) {
            write_json(out_path, j);
            std::cerr << "OUT_PARSE: " << out_path << "\n";
        } else {
            std::cout << dump_json(j, compact ? -1 : 2) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    return 0;
}

} // namespace miniparse
