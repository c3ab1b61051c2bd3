#pragma once
#include <string>

#include "miniparse/core/Types.hpp"

namespace miniparse {

// Shortest decimal string that round-trips the parsed value: "12.50" -> "12.5",
// "007" -> "7", "1.0" -> "1". Returns the input unchanged if it does not parse
// to a finite number.
std::string canonical_number(const std::string& s);

// Lowercases words and entity values, canonicalizes numbers. Offsets and
// ordering are left alone. Applying it twice changes nothing.
IntentResult normalize(IntentResult input);

// Same as normalize() but leaves word tokens as they are. Used when the
// tokenizer already folded case at scan time.
IntentResult normalize_keep_word_case(IntentResult input);

} // namespace miniparse
