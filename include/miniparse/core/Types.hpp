#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace miniparse {

enum class TokenType {
    Word,
    Number,
    Punct,
    Symbol
};

enum class EntityType {
    Email,
    Phone,
    Url,
    Number
};

struct Token {
    TokenType type = TokenType::Word;
    std::string value;      // rewritten by normalization, span is not
    std::size_t start = 0;  // byte offsets into IntentResult::text
    std::size_t end = 0;
};

struct Entity {
    EntityType type = EntityType::Number;
    std::string value;
    std::size_t start = 0;
    std::size_t end = 0;
};

// sentence span produced by the segmentation stage
struct Segment {
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
};

struct IntentResult {
    std::string text;               // original input, never modified by stages
    std::vector<Token> tokens;
    std::vector<Entity> entities;   // extraction order, not position order
    std::vector<Segment> segments;
};

const char* token_type_str(TokenType t);
const char* entity_type_str(EntityType t);

} // namespace miniparse
