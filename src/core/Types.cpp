#include "miniparse/core/Types.hpp"

namespace miniparse {

const char* token_type_str(TokenType t) {
    switch (t) {
        case TokenType::Word: return "word";
        case TokenType::Number: return "number";
        case TokenType::Punct: return "punct";
        case TokenType::Symbol: return "symbol";
        default: return "unknown";
    }
}

const char* entity_type_str(EntityType t) {
    switch (t) {
        case EntityType::Email: return "email";
        case EntityType::Phone: return "phone";
        case EntityType::Url: return "url";
        case EntityType::Number: return "number";
        default: return "unknown";
    }
}

} // namespace miniparse
