#pragma once

#include "lexer/sourceLocation.hpp"

#include <stdexcept>
#include <string>

namespace regen {

/**
 * PatternError - a pattern text that could not be turned into a Pattern
 *
 * Carries the location of the problem and the construct involved: what was
 * expected for syntax errors, the offending construct for validation errors.
 * Parsing never returns a partial Pattern; it throws one of the subclasses.
 */
class PatternError : public std::runtime_error {
public:
  PatternError(const std::string &kind, const std::string &message,
               SourceLocation location, std::string construct);

  const std::string &message() const { return message_; }
  const SourceLocation &location() const { return location_; }
  size_t offset() const { return location_.offset; }
  const std::string &construct() const { return construct_; }

  /**
   * Render the error against the pattern it came from:
   *
   *   syntax error at column 2: unmatched '(' (expected ')')
   *     a(b
   *      ^
   */
  std::string render(const std::string &source) const;

private:
  std::string message_;
  SourceLocation location_;
  std::string construct_;
};

// Pattern text violates the grammar
class SyntaxError : public PatternError {
public:
  SyntaxError(const std::string &message, SourceLocation location,
              std::string expected)
      : PatternError("syntax error", message, location, std::move(expected)) {}
};

// Well-formed text with an invalid distribution or bound
class ValidationError : public PatternError {
public:
  ValidationError(const std::string &message, SourceLocation location,
                  std::string construct)
      : PatternError("validation error", message, location,
                     std::move(construct)) {}
};

} // namespace regen
