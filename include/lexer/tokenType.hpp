#pragma once

namespace regen {

/**
 * @brief Pattern Token Types
 *
 * The pattern language is lexed one character at a time. Every reserved
 * character gets its own type; everything else is a LITERAL. Escapes are
 * folded into a single ESCAPED token, except the shorthand classes \w \s \d.
 */
enum class TokenType {
  // Characters that stand for themselves
  LITERAL,
  ESCAPED,         // \x, the escaped character is the token value
  SHORTHAND_CLASS, // \w \s \d

  // Alternation, grouping and anchors
  PIPE,   // |
  LPAREN, // (
  RPAREN, // )
  CARET,  // ^
  DOLLAR, // $
  DOT,    // .

  // Quantifiers
  STAR,     // *
  PLUS,     // +
  QUESTION, // ?
  LBRACE,   // {
  RBRACE,   // }

  // Character classes
  LBRACKET, // [
  RBRACKET, // ]

  // Distribution annotations
  TILDE,  // ~
  COMMA,  // ,
  EQUALS, // =

  END_OF_FILE,
  ERROR
};

} // namespace regen
