#pragma once
#include <string>

#include "miniparse/core/Types.hpp"

namespace miniparse {

// Scanners over IntentResult::text (never over tokens). Each appends its
// matches to entities in left-to-right order and skips invalid candidates.
void extract_emails(IntentResult& input);
// Offsets come from the first occurrence of the candidate in the text, so a
// phone number repeated verbatim reports the first position every time.
void extract_phones(IntentResult& input);
void extract_urls(IntentResult& input);
void extract_numbers(IntentResult& input);

bool is_valid_url(const std::string& url);

// pipeline stages
IntentResult extract_emails_only(IntentResult input);
IntentResult extract_phones_only(IntentResult input);
IntentResult extract_urls_only(IntentResult input);
IntentResult extract_numbers_only(IntentResult input);

// all four extractors: emails, phones, urls, numbers
IntentResult extract(IntentResult input);

} // namespace miniparse
