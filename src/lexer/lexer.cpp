#include "lexer/lexer.hpp"

#include <unordered_map>

namespace regen {

static const std::unordered_map<char, TokenType> reservedCharacters = {
    {'|', TokenType::PIPE},     {'(', TokenType::LPAREN},
    {')', TokenType::RPAREN},   {'^', TokenType::CARET},
    {'$', TokenType::DOLLAR},   {'.', TokenType::DOT},
    {'*', TokenType::STAR},     {'+', TokenType::PLUS},
    {'?', TokenType::QUESTION}, {'{', TokenType::LBRACE},
    {'}', TokenType::RBRACE},   {'[', TokenType::LBRACKET},
    {']', TokenType::RBRACKET}, {'~', TokenType::TILDE},
    {',', TokenType::COMMA},    {'=', TokenType::EQUALS},
};

Lexer::Lexer(const std::string &source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    tokens.push_back(nextToken());
    if (tokens.back().type == TokenType::END_OF_FILE) {
      break;
    }
  }
  return tokens;
}

Token Lexer::nextToken() {
  SourceLocation start{pos_, line_, column_};

  if (atEnd()) {
    return makeToken(TokenType::END_OF_FILE, "", '\0', start);
  }

  char c = advance();

  if (c == '\\') {
    return scanEscape(start);
  }

  auto it = reservedCharacters.find(c);
  if (it != reservedCharacters.end()) {
    return makeToken(it->second, std::string(1, c), c, start);
  }

  if (c == '\n') {
    line_++;
    column_ = 1;
  }
  return makeToken(TokenType::LITERAL, std::string(1, c), c, start);
}

Token Lexer::peek() { return peekAhead(0); }

Token Lexer::peekAhead(size_t n) {
  size_t savedPos = pos_;
  size_t savedLine = line_;
  size_t savedColumn = column_;

  Token token;
  for (size_t i = 0; i <= n; i++) {
    token = nextToken();
  }

  pos_ = savedPos;
  line_ = savedLine;
  column_ = savedColumn;

  return token;
}

char Lexer::advance() {
  column_++;
  return source_[pos_++];
}

bool Lexer::atEnd() const { return pos_ >= source_.size(); }

Token Lexer::makeToken(TokenType type, const std::string &lexeme, char value,
                       const SourceLocation &start) const {
  Token token;
  token.type = type;
  token.lexeme = lexeme;
  token.value = value;
  token.location = start;
  return token;
}

Token Lexer::scanEscape(const SourceLocation &start) {
  if (atEnd()) {
    return makeToken(TokenType::ERROR, "\\", '\\', start);
  }

  char escaped = advance();
  std::string lexeme = std::string("\\") + escaped;
  if (escaped == '\n') {
    line_++;
    column_ = 1;
  }

  switch (escaped) {
  case 'w':
  case 's':
  case 'd':
    return makeToken(TokenType::SHORTHAND_CLASS, lexeme, escaped, start);
  default:
    return makeToken(TokenType::ESCAPED, lexeme, escaped, start);
  }
}

} // namespace regen
