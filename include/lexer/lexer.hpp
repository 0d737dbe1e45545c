#pragma once

#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace regen {

/**
 * Lexer - splits pattern text into single-character tokens
 *
 * Lexing never fails: malformed input (a trailing lone backslash) becomes an
 * ERROR token and the parser reports it.
 */
class Lexer {
public:
  explicit Lexer(const std::string &source);

  // Tokenize the entire source; the last token is always END_OF_FILE
  std::vector<Token> tokenize();

  // Get next token
  Token nextToken();

  // Peek at next token without consuming
  Token peek();

  // Peek N tokens ahead (0 = next token, 1 = token after that, etc.)
  Token peekAhead(size_t n);

private:
  std::string source_;
  size_t pos_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;

  char advance();
  bool atEnd() const;

  Token makeToken(TokenType type, const std::string &lexeme, char value,
                  const SourceLocation &start) const;
  Token scanEscape(const SourceLocation &start);
};

} // namespace regen
