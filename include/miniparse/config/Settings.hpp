#pragma once

namespace miniparse {

struct TokenizerSettings {
    bool lowercase = true;
    bool merge_symbols = false;
};

struct PipelineSettings {
    bool enable_normalization = true;
    bool enable_cleaning = true;
    bool enable_extraction = true;
    bool enable_segmentation = false;
};

// individual extractors, only consulted when enable_extraction is set
struct ExtractionSettings {
    bool extract_emails = true;
    bool extract_phones = true;
    bool extract_urls = true;
    bool extract_numbers = true;
};

struct Settings {
    TokenizerSettings tokenizer;
    PipelineSettings pipeline;
    ExtractionSettings extraction;
};

} // namespace miniparse
