#include "miniparse/processors/Normalize.hpp"

#include <cctype>
#include <utility>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace miniparse {

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// "1e-07" -> "1e-7", "1e+21" stays
static std::string trim_exponent(std::string s) {
    std::size_t e = s.find('e');
    if (e == std::string::npos) return s;

    std::size_t digits = e + 1;
    if (digits < s.size() && (s[digits] == '+' || s[digits] == '-')) ++digits;

    std::size_t first = digits;
    while (first + 1 < s.size() && s[first] == '0') ++first;
    s.erase(digits, first - digits);
    return s;
}

std::string canonical_number(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    // underflow gives a finite value (possibly 0) and is kept
    if (end == begin || *end != '\0' || !std::isfinite(v)) return s;

    // fixed notation for 1e-6 <= |v| < 1e21 (and 0), scientific outside
    const double mag = std::fabs(v);
    const bool fixed = v == 0.0 || (mag >= 1e-6 && mag < 1e21);

    char buf[512];
    auto res = std::to_chars(buf, buf + sizeof(buf), v,
                             fixed ? std::chars_format::fixed : std::chars_format::scientific);
    if (res.ec != std::errc()) return s;
    return trim_exponent(std::string(buf, res.ptr));
}

static IntentResult normalize_impl(IntentResult input, bool fold_words) {
    for (auto& tok : input.tokens) {
        if (tok.type == TokenType::Word) {
            if (fold_words) tok.value = lower_ascii(tok.value);
        } else if (tok.type == TokenType::Number) {
            tok.value = canonical_number(tok.value);
        }
    }

    for (auto& ent : input.entities) {
        ent.value = lower_ascii(ent.value);
    }

    return input;
}

IntentResult normalize(IntentResult input) {
    return normalize_impl(std::move(input), true);
}

IntentResult normalize_keep_word_case(IntentResult input) {
    return normalize_impl(std::move(input), false);
}

} // namespace miniparse
