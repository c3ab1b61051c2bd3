#pragma once
#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "miniparse/config/Settings.hpp"

namespace miniparse {

class ConfigLoader {
public:
    static constexpr const char* kConfigFileName = "miniparse.config.yaml";
    static constexpr const char* kDefaultConfigFileName = "default.yaml";

    // First existing of: custom_path, ./miniparse.config.yaml,
    // <project dir>/default.yaml. Built-in defaults when none exists or the
    // chosen file cannot be loaded (a warning is printed in that case).
    static Settings load(const std::string& custom_path = "");

    // Defaults overlaid with the file. Throws std::runtime_error on read,
    // parse or conversion errors.
    static Settings load_file(const std::filesystem::path& path);

    // Same as load_file() for YAML text already in memory.
    static Settings load_string(const std::string& yaml_text);

    // Field-by-field overlay. Keys missing from the node keep their current
    // value; unknown keys are reported on stderr and ignored.
    static void overlay(Settings& settings, const YAML::Node& root);

private:
    static std::filesystem::path project_dir();
};

} // namespace miniparse
