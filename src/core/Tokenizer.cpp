#include "miniparse/core/Tokenizer.hpp"
#include <cctype>
#include <utility>

namespace miniparse {

Tokenizer::Tokenizer(const TokenizerSettings& settings) : m_settings(settings) {}

bool Tokenizer::is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool Tokenizer::is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool Tokenizer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Tokenizer::is_punct(char c) {
    switch (c) {
        case '.': case ',': case ';': case ':': case '!': case '?':
        case '\'': case '"': case '(': case ')': case '[': case ']':
        case '{': case '}': case '-':
            return true;
        default:
            return false;
    }
}

// byte length of the character starting at pos; a UTF-8 lead byte claims its
// continuation bytes so multibyte characters are never split across tokens
std::size_t Tokenizer::char_len(const std::string& text, std::size_t pos) {
    unsigned char c = (unsigned char)text[pos];
    std::size_t len = 1;
    if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;

    std::size_t n = 1;
    while (n < len && pos + n < text.size() &&
           ((unsigned char)text[pos + n] & 0xC0) == 0x80) {
        ++n;
    }
    return n;
}

std::string Tokenizer::lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::size_t Tokenizer::scan_word(const std::string& text, std::size_t pos) const {
    while (pos < text.size() && (is_alpha(text[pos]) || is_digit(text[pos]))) ++pos;
    return pos;
}

std::size_t Tokenizer::scan_number(const std::string& text, std::size_t pos) const {
    bool seen_dot = false;
    while (pos < text.size()) {
        char c = text[pos];
        if (is_digit(c)) {
            ++pos;
        } else if (c == '.' && !seen_dot && pos + 1 < text.size() && is_digit(text[pos + 1])) {
            // the preceding byte is a digit: numbers always start on one
            seen_dot = true;
            ++pos;
        } else {
            break;
        }
    }
    return pos;
}

std::size_t Tokenizer::scan_other(const std::string& text, std::size_t pos, bool& all_punct) const {
    all_punct = true;
    do {
        if (!is_punct(text[pos])) all_punct = false;
        pos += char_len(text, pos);
    } while (m_settings.merge_symbols && pos < text.size() &&
             !is_ws(text[pos]) && !is_alpha(text[pos]) && !is_digit(text[pos]));
    return pos;
}

std::vector<Token> Tokenizer::tokenize(const std::string& text) const {
    std::vector<Token> out;
    std::size_t i = 0;

    while (i < text.size()) {
        char c = text[i];
        if (is_ws(c)) {
            ++i;
            continue;
        }

        Token tok;
        tok.start = i;

        if (is_alpha(c)) {
            tok.type = TokenType::Word;
            tok.end = scan_word(text, i);
        } else if (is_digit(c)) {
            tok.type = TokenType::Number;
            tok.end = scan_number(text, i);
        } else {
            bool all_punct = false;
            tok.end = scan_other(text, i, all_punct);
            tok.type = all_punct ? TokenType::Punct : TokenType::Symbol;
        }

        tok.value = text.substr(tok.start, tok.end - tok.start);
        if (tok.type == TokenType::Word && m_settings.lowercase) tok.value = lower_ascii(tok.value);

        i = tok.end;
        out.push_back(std::move(tok));
    }

    return out;
}

} // namespace miniparse
