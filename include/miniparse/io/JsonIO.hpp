#pragma once
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "miniparse/config/Settings.hpp"
#include "miniparse/core/Types.hpp"

namespace miniparse {

nlohmann::json to_json(const Token& t);
nlohmann::json to_json(const Entity& e);
nlohmann::json to_json(const IntentResult& r);

// camelCase keys, same layout as the YAML config
nlohmann::json to_json(const Settings& s);

// Serialized text. Input bytes that are not valid UTF-8 become U+FFFD instead
// of throwing. indent < 0 gives a single line.
std::string dump_json(const nlohmann::json& j, int indent = 2);

// pretty-printed; creates parent directories, throws if the file can't be opened
void write_json(const std::filesystem::path& path, const nlohmann::json& j);

} // namespace miniparse
