#include "miniparse/processors/Segment.hpp"

#include <cctype>
#include <utility>

namespace miniparse {

static bool is_space(char c) {
    return std::isspace((unsigned char)c) != 0;
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_terminator(const std::string& text, std::size_t i) {
    char c = text[i];
    if (c == '!' || c == '?') return true;
    if (c != '.') return false;
    bool decimal = i > 0 && is_digit(text[i - 1]) && i + 1 < text.size() && is_digit(text[i + 1]);
    return !decimal;
}

static void push_trimmed(std::vector<Segment>& out, const std::string& text, std::size_t b, std::size_t e) {
    while (b < e && is_space(text[b])) ++b;
    while (e > b && is_space(text[e - 1])) --e;
    if (b == e) return;

    Segment s;
    s.text = text.substr(b, e - b);
    s.start = b;
    s.end = e;
    out.push_back(std::move(s));
}

std::vector<Segment> split_sentences(const std::string& text) {
    std::vector<Segment> out;
    std::size_t seg_start = 0;
    std::size_t i = 0;

    while (i < text.size()) {
        if (text[i] == '\n') {
            push_trimmed(out, text, seg_start, i);
            seg_start = ++i;
            continue;
        }

        if (is_terminator(text, i)) {
            std::size_t run_end = i;
            while (run_end < text.size() && is_terminator(text, run_end)) ++run_end;
            if (run_end == text.size() || is_space(text[run_end])) {
                push_trimmed(out, text, seg_start, run_end);
                seg_start = run_end;
            }
            i = run_end;
            continue;
        }

        ++i;
    }

    push_trimmed(out, text, seg_start, text.size());
    return out;
}

IntentResult segment(IntentResult input) {
    for (auto& s : split_sentences(input.text)) {
        input.segments.push_back(std::move(s));
    }
    return input;
}

} // namespace miniparse
