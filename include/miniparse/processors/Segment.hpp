#pragma once
#include <string>
#include <vector>

#include "miniparse/core/Types.hpp"

namespace miniparse {

// Sentence boundaries: a run of . ! ? followed by whitespace or end of text,
// or a newline. A '.' between two digits is a decimal point, not a boundary.
// Segments are trimmed and empty ones dropped.
std::vector<Segment> split_sentences(const std::string& text);

IntentResult segment(IntentResult input);

} // namespace miniparse
