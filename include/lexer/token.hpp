#pragma once

#include "lexer/sourceLocation.hpp"
#include "lexer/tokenType.hpp"

#include <string>

namespace regen {

struct Token {
  TokenType type = TokenType::END_OF_FILE;
  std::string lexeme; // Source text of the token ("\\d", "a", "{", ...)
  char value = '\0';  // Character carried by LITERAL, ESCAPED and SHORTHAND_CLASS
  SourceLocation location;

  bool is(TokenType other) const { return type == other; }
  bool isDigit() const {
    return type == TokenType::LITERAL && value >= '0' && value <= '9';
  }
  bool isLetter() const {
    return type == TokenType::LITERAL &&
           ((value >= 'a' && value <= 'z') || (value >= 'A' && value <= 'Z'));
  }
  bool isQuantifier() const {
    return type == TokenType::STAR || type == TokenType::PLUS ||
           type == TokenType::QUESTION || type == TokenType::LBRACE;
  }
};

} // namespace regen
