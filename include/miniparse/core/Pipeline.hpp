#pragma once
#include <cstddef>
#include <future>
#include <string>
#include <vector>

#include "miniparse/config/Settings.hpp"
#include "miniparse/core/Stage.hpp"
#include "miniparse/core/Tokenizer.hpp"
#include "miniparse/core/Types.hpp"

namespace miniparse {

class Pipeline {
public:
    // Registers the built-in stages selected by settings, in this order:
    // normalize, clean, email, phone, url, number extraction, segment.
    explicit Pipeline(const Settings& settings = {});

    // Settings come from ConfigLoader::load(config_path), defaults on failure.
    static Pipeline from_config_file(const std::string& config_path = "");

    // Appends after everything already registered. Returns *this for chaining.
    Pipeline& use(Stage stage);
    Pipeline& add_custom_processor(Stage stage);

    // Tokenize once, then run every stage in registration order. An exception
    // from a stage propagates as-is and no partial record is returned.
    IntentResult process(const std::string& text) const;

    // process() on a worker thread. The pipeline must outlive the future.
    std::future<IntentResult> process_async(const std::string& text) const;

    const Settings& config() const { return m_settings; }
    std::size_t stage_count() const { return m_stages.size(); }

private:
    Settings m_settings;
    Tokenizer m_tokenizer;
    std::vector<Stage> m_stages;
};

} // namespace miniparse
