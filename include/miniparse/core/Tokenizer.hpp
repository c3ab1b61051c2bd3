#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "miniparse/config/Settings.hpp"
#include "miniparse/core/Types.hpp"

namespace miniparse {

class Tokenizer {
public:
    explicit Tokenizer(const TokenizerSettings& settings = {});

    // Left-to-right scan into word/number/punct/symbol tokens.
    // Whitespace separates tokens and is never emitted; every other byte of
    // the input ends up inside exactly one token.
    std::vector<Token> tokenize(const std::string& text) const;

    const TokenizerSettings& settings() const { return m_settings; }

private:
    TokenizerSettings m_settings;

    static bool is_ws(char c);
    static bool is_alpha(char c);
    static bool is_digit(char c);
    static bool is_punct(char c);
    static std::size_t char_len(const std::string& text, std::size_t pos);
    static std::string lower_ascii(std::string s);

    std::size_t scan_word(const std::string& text, std::size_t pos) const;
    std::size_t scan_number(const std::string& text, std::size_t pos) const;
    std::size_t scan_other(const std::string& text, std::size_t pos, bool& all_punct) const;
};

} // namespace miniparse
