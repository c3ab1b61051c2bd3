#include "miniparse/processors/Clean.hpp"

#include <algorithm>

namespace miniparse {

IntentResult clean(IntentResult input) {
    auto& toks = input.tokens;
    toks.erase(std::remove_if(toks.begin(), toks.end(),
                              [](const Token& t) { return t.type == TokenType::Punct; }),
               toks.end());
    return input;
}

} // namespace miniparse
