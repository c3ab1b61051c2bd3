#include "miniparse/config/ConfigLoader.hpp"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace miniparse {

namespace {

struct BoolField {
    const char* key;
    bool* target;
};

void overlay_section(const YAML::Node& root, const char* section, std::initializer_list<BoolField> fields) {
    const YAML::Node node = root[section];
    if (!node || node.IsNull()) return;
    if (!node.IsMap()) {
        throw std::runtime_error(std::string(section) + " must be a mapping");
    }

    std::set<std::string> known;
    for (const auto& f : fields) {
        known.insert(f.key);

        const YAML::Node v = node[f.key];
        if (!v || v.IsNull()) continue;
        if (!v.IsScalar()) {
            throw std::runtime_error(std::string(section) + "." + f.key + " must be a boolean");
        }
        try {
            *f.target = v.as<bool>();
        } catch (const YAML::Exception&) {
            throw std::runtime_error(std::string(section) + "." + f.key +
                                     " must be a boolean, got '" + v.Scalar() + "'");
        }
    }

    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        if (!known.count(key)) {
            std::cerr << "warning: unknown config key " << section << "." << key << "\n";
        }
    }
}

} // namespace

void ConfigLoader::overlay(Settings& settings, const YAML::Node& root) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a mapping");
    }

    overlay_section(root, "tokenizer", {
        {"lowercase", &settings.tokenizer.lowercase},
        {"mergeSymbols", &settings.tokenizer.merge_symbols},
    });

    overlay_section(root, "pipeline", {
        {"enableNormalization", &settings.pipeline.enable_normalization},
        {"enableCleaning", &settings.pipeline.enable_cleaning},
        {"enableExtraction", &settings.pipeline.enable_extraction},
        {"enableSegmentation", &settings.pipeline.enable_segmentation},
    });

    overlay_section(root, "extraction", {
        {"extractEmails", &settings.extraction.extract_emails},
        {"extractPhones", &settings.extraction.extract_phones},
        {"extractUrls", &settings.extraction.extract_urls},
        {"extractNumbers", &settings.extraction.extract_numbers},
    });

    for (const auto& kv : root) {
        const std::string key = kv.first.as<std::string>();
        if (key != "tokenizer" && key != "pipeline" && key != "extraction") {
            std::cerr << "warning: unknown config section " << key << "\n";
        }
    }
}

Settings ConfigLoader::load_string(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("failed to parse YAML: ") + e.what());
    }

    Settings s;
    overlay(s, root);
    return s;
}

Settings ConfigLoader::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path.string());
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    return load_string(oss.str());
}

fs::path ConfigLoader::project_dir() {
#ifdef MINIPARSE_PROJECT_DIR
    return fs::path(MINIPARSE_PROJECT_DIR);
#else
    return fs::path();
#endif
}

Settings ConfigLoader::load(const std::string& custom_path) {
    std::vector<fs::path> candidates;
    if (!custom_path.empty()) candidates.push_back(custom_path);
    std::error_code cwd_ec;
    const fs::path cwd = fs::current_path(cwd_ec);
    if (!cwd_ec) candidates.push_back(cwd / kConfigFileName);
    if (!project_dir().empty()) candidates.push_back(project_dir() / kDefaultConfigFileName);

    for (const auto& p : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) continue;

        try {
            return load_file(p);
        } catch (const std::exception& e) {
            std::cerr << "warning: failed to load config from " << p.string() << ": " << e.what() << "\n";
            std::cerr << "warning: falling back to default configuration\n";
            return Settings{};
        }
    }

    return Settings{};
}

} // namespace miniparse
