#pragma once

#include "lexer/token.hpp"
#include "parser/distributionAnnotation.hpp"
#include "pattern/node.hpp"
#include "pattern/pattern.hpp"

#include <string>
#include <vector>

namespace regen {

/**
 * Parser - recursive descent over the token stream of one pattern
 *
 * Grammar, lowest precedence first:
 *
 *   pattern     := '^'? alternation '$'?
 *   alternation := expression ('|' expression)*
 *   expression  := factor+
 *   factor      := atom quantifier?
 *   atom        := literal | '.' | class | '(' alternation ')'
 *   quantifier  := ('*' | '+' | '?') annotation?
 *                | '{' count (',' count?)? annotation? '}'
 *   class       := shorthand annotation?
 *                | '[' '^'? member+ ']' annotation?
 *   annotation  := '~' name ('(' (parameter (',' parameter)*)? ')')?
 *
 * Alternations and concatenations are built as flat n-ary nodes. A group
 * adds no node of its own. Annotations are resolved into distributions as
 * soon as their context (quantifier baseline or class alphabet) is known.
 */
class Parser {
public:
  // Largest literal repeat count accepted in {n}, {n,} and {n,m}
  static constexpr size_t MAX_REPEAT_COUNT = 1000000;
  // Deepest nesting of parenthesized groups
  static constexpr size_t MAX_GROUP_DEPTH = 1000;

  explicit Parser(const std::string &source);

  // Parse the whole source; throws SyntaxError or ValidationError
  Pattern parse();

private:
  std::string source_;
  std::vector<Token> tokens_;
  size_t current_ = 0;
  size_t groupDepth_ = 0;

  // Token navigation
  const Token &peek() const;
  const Token &peekAhead(size_t n) const;
  const Token &previous() const;
  const Token &advance();
  bool check(TokenType type) const;
  bool match(TokenType type);
  bool isAtEnd() const;

  // Grammar rules
  NodePtr parseAlternation();
  NodePtr parseExpression();
  NodePtr parseFactor();
  NodePtr parseAtom();
  NodePtr parseGroup();
  NodePtr parseClass();
  NodePtr parseShorthand();
  NodePtr parseQuantifier(NodePtr atom);
  ClassMember parsePosixClass();
  DistributionAnnotation parseAnnotation();
  AnnotationParameter parseParameter();
  void parseNumber(AnnotationParameter &parameter);
  size_t parseCount();

  NodePtr finishClass(std::vector<ClassMember> members, bool negated,
                      bool bracketed, const Token &start);

  static bool startsAtom(const Token &token);
  [[noreturn]] void unexpected(const Token &token) const;
};

// Parse pattern text into a validated Pattern
Pattern parse(const std::string &source);

} // namespace regen
