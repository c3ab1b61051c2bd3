#include "miniparse/core/Pipeline.hpp"

#include "miniparse/config/ConfigLoader.hpp"
#include "miniparse/processors/Clean.hpp"
#include "miniparse/processors/Extract.hpp"
#include "miniparse/processors/Normalize.hpp"
#include "miniparse/processors/Segment.hpp"

#include <utility>

namespace miniparse {

Pipeline::Pipeline(const Settings& settings)
    : m_settings(settings), m_tokenizer(settings.tokenizer) {
    const PipelineSettings& p = m_settings.pipeline;
    const ExtractionSettings& x = m_settings.extraction;

    if (p.enable_normalization) {
        // case folding happens once: in the tokenizer when it lowercases,
        // otherwise here
        if (m_settings.tokenizer.lowercase) use(normalize_keep_word_case);
        else use(normalize);
    }
    if (p.enable_cleaning) use(clean);

    if (p.enable_extraction) {
        if (x.extract_emails) use(extract_emails_only);
        if (x.extract_phones) use(extract_phones_only);
        if (x.extract_urls) use(extract_urls_only);
        if (x.extract_numbers) use(extract_numbers_only);
    }

    if (p.enable_segmentation) use(segment);
}

Pipeline Pipeline::from_config_file(const std::string& config_path) {
    return Pipeline(ConfigLoader::load(config_path));
}

Pipeline& Pipeline::use(Stage stage) {
    m_stages.push_back(std::move(stage));
    return *this;
}

Pipeline& Pipeline::add_custom_processor(Stage stage) {
    return use(std::move(stage));
}

IntentResult Pipeline::process(const std::string& text) const {
    IntentResult result;
    result.text = text;
    result.tokens = m_tokenizer.tokenize(text);

    for (const auto& stage : m_stages) {
        result = stage(std::move(result));
    }

    return result;
}

std::future<IntentResult> Pipeline::process_async(const std::string& text) const {
    return std::async(std::launch::async, [this, text]() { return process(text); });
}

} // namespace miniparse
