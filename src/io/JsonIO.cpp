#include "miniparse/io/JsonIO.hpp"

#include <fstream>
#include <stdexcept>

namespace miniparse {

nlohmann::json to_json(const Token& t) {
    return {
        {"type", token_type_str(t.type)},
        {"value", t.value},
        {"start", t.start},
        {"end", t.end}
    };
}

nlohmann::json to_json(const Entity& e) {
    return {
        {"type", entity_type_str(e.type)},
        {"value", e.value},
        {"start", e.start},
        {"end", e.end}
    };
}

nlohmann::json to_json(const IntentResult& r) {
    nlohmann::json j;
    j["text"] = r.text;

    nlohmann::json tokens = nlohmann::json::array();
    for (const auto& t : r.tokens) tokens.push_back(to_json(t));
    j["tokens"] = tokens;

    nlohmann::json entities = nlohmann::json::array();
    for (const auto& e : r.entities) entities.push_back(to_json(e));
    j["entities"] = entities;

    // only present when segmentation ran
    if (!r.segments.empty()) {
        nlohmann::json segs = nlohmann::json::array();
        for (const auto& s : r.segments) {
            segs.push_back({{"text", s.text}, {"start", s.start}, {"end", s.end}});
        }
        j["segments"] = segs;
    }

    return j;
}

nlohmann::json to_json(const Settings& s) {
    nlohmann::json j;

    j["tokenizer"] = {
        {"lowercase", s.tokenizer.lowercase},
        {"mergeSymbols", s.tokenizer.merge_symbols}
    };

    j["pipeline"] = {
        {"enableNormalization", s.pipeline.enable_normalization},
        {"enableCleaning", s.pipeline.enable_cleaning},
        {"enableExtraction", s.pipeline.enable_extraction},
        {"enableSegmentation", s.pipeline.enable_segmentation}
    };

    j["extraction"] = {
        {"extractEmails", s.extraction.extract_emails},
        {"extractPhones", s.extraction.extract_phones},
        {"extractUrls", s.extraction.extract_urls},
        {"extractNumbers", s.extraction.extract_numbers}
    };

    return j;
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

void write_json(const std::filesystem::path& path, const nlohmann::json& j) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    out << dump_json(j) << "\n";
}

} // namespace miniparse
