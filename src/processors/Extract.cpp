#include "miniparse/processors/Extract.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

namespace miniparse {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_space(char c) {
    return std::isspace((unsigned char)c) != 0;
}

static void push_entity(IntentResult& input, EntityType type, std::size_t start, std::size_t end) {
    Entity e;
    e.type = type;
    e.value = input.text.substr(start, end - start);
    e.start = start;
    e.end = end;
    input.entities.push_back(std::move(e));
}

static std::vector<std::string> split_any(const std::string& s, bool (*is_delim)(char)) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (is_delim(c)) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static std::vector<std::string> split_on(const std::string& s, const std::string& sep) {
    std::vector<std::string> out;
    std::size_t from = 0;
    while (true) {
        std::size_t at = s.find(sep, from);
        if (at == std::string::npos) {
            out.push_back(s.substr(from));
            return out;
        }
        out.push_back(s.substr(from, at - from));
        from = at + sep.size();
    }
}

// ---------------- emails ----------------

static bool is_email_local(char c) {
    return std::isalnum((unsigned char)c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

static bool is_email_domain(char c) {
    return std::isalnum((unsigned char)c) || c == '.' || c == '-';
}

static bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Leftmost matches of local@domain.tld: local is [A-Za-z0-9._%+-]+, domain
// [A-Za-z0-9.-]+, tld two or more letters. Anchored on each '@'; the domain
// ends at the last '.' inside the domain run that is followed by a tld.
void extract_emails(IntentResult& input) {
    const std::string& text = input.text;
    const std::size_t n = text.size();
    std::size_t pos = 0;

    while (pos < n) {
        std::size_t at = text.find('@', pos);
        if (at == std::string::npos) break;

        std::size_t start = at;
        while (start > pos && is_email_local(text[start - 1])) --start;
        if (start == at) {
            pos = at + 1;
            continue;
        }

        std::size_t run_end = at + 1;
        while (run_end < n && is_email_domain(text[run_end])) ++run_end;

        std::size_t match_end = 0;
        for (std::size_t k = run_end; k > at + 2;) {
            --k;
            if (text[k] != '.') continue;
            std::size_t tld_end = k + 1;
            while (tld_end < n && is_alpha(text[tld_end])) ++tld_end;
            if (tld_end - (k + 1) >= 2) {
                match_end = tld_end;
                break;
            }
        }

        if (match_end == 0) {
            pos = at + 1;
            continue;
        }

        push_entity(input, EntityType::Email, start, match_end);
        pos = match_end;
    }
}

// ---------------- phones ----------------

static bool is_phone_delim(char c) {
    switch (c) {
        case ',': case ';': case '(': case ')': case '<': case '>':
        case '[': case ']': case '{': case '}':
            return true;
        default:
            return is_space(c);
    }
}

static bool is_phone_separator(char c) {
    return c == '-' || c == '.' || c == ' ' || c == '(' || c == ')' || c == '+';
}

void extract_phones(IntentResult& input) {
    const std::string& text = input.text;

    for (const std::string& cand : split_any(text, is_phone_delim)) {
        if (cand.size() < 10) continue;

        std::size_t digits = 0;
        std::size_t separators = 0;
        for (char c : cand) {
            if (is_digit(c)) ++digits;
            else if (is_phone_separator(c)) ++separators;
        }

        if (digits < 10 || digits > 15 || digits + separators != cand.size()) continue;

        std::size_t start = text.find(cand);
        if (start == std::string::npos) continue;
        push_entity(input, EntityType::Phone, start, start + cand.size());
    }
}

// ---------------- urls ----------------

static bool is_url_terminator(char c) {
    switch (c) {
        case ' ': case '\n': case '\r': case '\t':
        case '<': case '>': case '(': case ')': case '[': case ']': case '{': case '}':
            return true;
        default:
            return false;
    }
}

static bool is_label(const std::string& part) {
    if (part.empty()) return false;
    for (char c : part) {
        if (!(std::isalnum((unsigned char)c) || c == '-')) return false;
    }
    return true;
}

bool is_valid_url(const std::string& url) {
    std::vector<std::string> parts = split_on(url, "://");
    if (parts.size() != 2) return false;

    const std::string& scheme = parts[0];
    const std::string& rest = parts[1];
    if (rest.empty() || (scheme != "http" && scheme != "https")) return false;

    std::string host = rest.substr(0, rest.find('/'));
    if (host.empty()) return false;

    std::vector<std::string> labels = split_on(host, ".");
    if (labels.size() < 2) return false;
    for (const auto& l : labels) {
        if (!is_label(l)) return false;
    }
    return true;
}

void extract_urls(IntentResult& input) {
    static const char* const schemes[] = {"http://", "https://"};
    const std::string& text = input.text;

    for (const char* scheme : schemes) {
        const std::string prefix = scheme;
        std::size_t search_from = 0;

        while (search_from < text.size()) {
            std::size_t at = text.find(prefix, search_from);
            if (at == std::string::npos) break;

            std::size_t url_end = at + prefix.size();
            while (url_end < text.size() && !is_url_terminator(text[url_end])) ++url_end;

            if (is_valid_url(text.substr(at, url_end - at))) {
                push_entity(input, EntityType::Url, at, url_end);
            }

            search_from = url_end > search_from ? url_end : search_from + 1;
        }
    }
}

// ---------------- numbers ----------------

static bool parses_as_number(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    // underflow parses to a finite value, overflow to inf
    if (end == begin) return false;
    return std::isfinite(v);
}

void extract_numbers(IntentResult& input) {
    const std::string& text = input.text;
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        while (i < n && !is_digit(text[i]) && text[i] != '.') ++i;
        if (i >= n) break;

        std::size_t start = i;
        bool has_decimal = false;

        while (i < n) {
            char c = text[i];
            if (is_digit(c)) {
                ++i;
            } else if (c == '.' && !has_decimal &&
                       i > 0 && is_digit(text[i - 1]) &&
                       i + 1 < n && is_digit(text[i + 1])) {
                has_decimal = true;
                ++i;
            } else {
                break;
            }
        }

        if (i == start) {
            // a '.' that is not a decimal point
            ++i;
            continue;
        }

        if (parses_as_number(text.substr(start, i - start))) {
            push_entity(input, EntityType::Number, start, i);
        }
    }
}

// ---------------- stages ----------------

IntentResult extract_emails_only(IntentResult input) {
    extract_emails(input);
    return input;
}

IntentResult extract_phones_only(IntentResult input) {
    extract_phones(input);
    return input;
}

IntentResult extract_urls_only(IntentResult input) {
    extract_urls(input);
    return input;
}

IntentResult extract_numbers_only(IntentResult input) {
    extract_numbers(input);
    return input;
}

IntentResult extract(IntentResult input) {
    extract_emails(input);
    extract_phones(input);
    extract_urls(input);
    // tokens already carry numbers, this catches runs the tokenizer split
    extract_numbers(input);
    return input;
}

} // namespace miniparse
