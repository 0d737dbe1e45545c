#include "parser/parser.hpp"
#include "lexer/lexer.hpp"
#include "parser/annotationResolver.hpp"
#include "parser/patternError.hpp"
#include "pattern/charSet.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace regen {

Parser::Parser(const std::string &source) : source_(source) {
  Lexer lexer(source_);
  tokens_ = lexer.tokenize();
}

Pattern parse(const std::string &source) {
  Parser parser(source);
  return parser.parse();
}

// ============================================================================
// Token navigation
// ============================================================================

const Token &Parser::peek() const { return peekAhead(0); }

const Token &Parser::peekAhead(size_t n) const {
  size_t index = current_ + n;
  if (index >= tokens_.size()) {
    return tokens_.back(); // END_OF_FILE
  }
  return tokens_[index];
}

const Token &Parser::previous() const {
  return tokens_[current_ > 0 ? current_ - 1 : 0];
}

const Token &Parser::advance() {
  if (!isAtEnd()) {
    current_++;
  }
  return previous();
}

bool Parser::check(TokenType type) const { return peek().type == type; }

bool Parser::match(TokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::isAtEnd() const { return check(TokenType::END_OF_FILE); }

// ============================================================================
// Pattern structure
// ============================================================================

Pattern Parser::parse() {
  bool anchoredStart = match(TokenType::CARET);

  if (isAtEnd() || (check(TokenType::DOLLAR) &&
                    peekAhead(1).is(TokenType::END_OF_FILE))) {
    throw SyntaxError("empty pattern", peek().location, "pattern");
  }

  NodePtr root = parseAlternation();

  bool anchoredEnd = false;
  if (check(TokenType::DOLLAR) && peekAhead(1).is(TokenType::END_OF_FILE)) {
    advance();
    anchoredEnd = true;
  }
  if (!isAtEnd()) {
    unexpected(peek());
  }

  return Pattern(std::move(root), anchoredStart, anchoredEnd, source_);
}

NodePtr Parser::parseAlternation() {
  if (check(TokenType::PIPE)) {
    throw SyntaxError("empty alternative", peek().location,
                      "pattern before '|'");
  }

  size_t offset = peek().location.offset;
  std::vector<NodePtr> branches;
  branches.push_back(parseExpression());

  while (check(TokenType::PIPE)) {
    const Token &pipe = advance();
    if (isAtEnd() || check(TokenType::PIPE) || check(TokenType::RPAREN) ||
        check(TokenType::DOLLAR)) {
      throw SyntaxError("empty alternative", pipe.location,
                        "pattern after '|'");
    }
    branches.push_back(parseExpression());
  }

  if (branches.size() == 1) {
    return std::move(branches.front());
  }
  return std::make_unique<AlternationNode>(std::move(branches), offset);
}

NodePtr Parser::parseExpression() {
  if (!startsAtom(peek())) {
    unexpected(peek());
  }

  size_t offset = peek().location.offset;
  std::vector<NodePtr> factors;
  while (startsAtom(peek())) {
    factors.push_back(parseFactor());
  }

  if (factors.size() == 1) {
    return std::move(factors.front());
  }
  return std::make_unique<ConcatNode>(std::move(factors), offset);
}

NodePtr Parser::parseFactor() {
  NodePtr atom = parseAtom();
  if (!peek().isQuantifier()) {
    return atom;
  }

  NodePtr quantified = parseQuantifier(std::move(atom));
  if (peek().isQuantifier()) {
    throw SyntaxError("quantifier cannot follow another quantifier",
                      peek().location, "group around the quantified part");
  }
  return quantified;
}

NodePtr Parser::parseAtom() {
  const Token &token = peek();

  switch (token.type) {
  case TokenType::LITERAL:
  case TokenType::ESCAPED:
    advance();
    return std::make_unique<LiteralNode>(token.value, token.location.offset);
  case TokenType::DOT:
    advance();
    return std::make_unique<WildcardNode>(token.location.offset);
  case TokenType::SHORTHAND_CLASS:
    return parseShorthand();
  case TokenType::LBRACKET:
    return parseClass();
  case TokenType::LPAREN:
    return parseGroup();
  default:
    unexpected(token);
  }
}

NodePtr Parser::parseGroup() {
  const Token &open = advance(); // '('

  if (check(TokenType::RPAREN)) {
    throw SyntaxError("empty group", open.location, "pattern inside '()'");
  }
  if (++groupDepth_ > MAX_GROUP_DEPTH) {
    throw ValidationError("groups are nested deeper than " +
                              std::to_string(MAX_GROUP_DEPTH) + " levels",
                          open.location, "(");
  }

  NodePtr content = parseAlternation();

  if (!check(TokenType::RPAREN)) {
    if (isAtEnd()) {
      throw SyntaxError("unmatched '('", open.location, "')'");
    }
    unexpected(peek());
  }
  advance();
  groupDepth_--;
  return content;
}

// ============================================================================
// Character classes
// ============================================================================

NodePtr Parser::parseShorthand() {
  const Token &token = advance();
  ClassMember member;
  member.type = ClassMember::Type::Shorthand;
  member.character = token.value;
  return finishClass({member}, false, false, token);
}

NodePtr Parser::parseClass() {
  const Token &open = advance(); // '['
  bool negated = match(TokenType::CARET);

  std::vector<ClassMember> members;
  while (!check(TokenType::RBRACKET)) {
    const Token &token = peek();
    ClassMember member;

    switch (token.type) {
    case TokenType::END_OF_FILE:
      throw SyntaxError("unmatched '['", open.location, "']'");
    case TokenType::ERROR:
      unexpected(token);
    case TokenType::LBRACKET:
      members.push_back(parsePosixClass());
      continue;
    case TokenType::DOT:
      member.type = ClassMember::Type::Wildcard;
      break;
    case TokenType::SHORTHAND_CLASS:
      member.type = ClassMember::Type::Shorthand;
      member.character = token.value;
      break;
    default:
      // Reserved characters other than brackets stand for themselves here
      member.type = ClassMember::Type::Literal;
      member.character = token.value;
      break;
    }

    advance();
    members.push_back(member);
  }

  if (members.empty()) {
    throw SyntaxError("empty character class", open.location,
                      "class member before ']'");
  }
  advance(); // ']'

  return finishClass(std::move(members), negated, true, open);
}

ClassMember Parser::parsePosixClass() {
  const Token &open = advance(); // '['
  if (!(peek().is(TokenType::LITERAL) && peek().value == ':')) {
    throw SyntaxError("'[' inside a class must open a POSIX class",
                      open.location, "[:name:] or '\\['");
  }
  advance();

  std::string name;
  while (peek().isLetter()) {
    name += advance().value;
  }

  if (!(peek().is(TokenType::LITERAL) && peek().value == ':') ||
      !peekAhead(1).is(TokenType::RBRACKET)) {
    if (isAtEnd()) {
      throw SyntaxError("unmatched '['", open.location, ":]");
    }
    throw SyntaxError("malformed POSIX class", peek().location, ":]");
  }
  advance();
  advance();

  if (!charset::posix(name)) {
    throw SyntaxError("unknown POSIX class '" + name + "'", open.location,
                      "alnum, alpha, blank, cntrl, digit, graph, lower, "
                      "print, punct, space, upper, word or xdigit");
  }

  ClassMember member;
  member.type = ClassMember::Type::Posix;
  member.name = name;
  return member;
}

NodePtr Parser::finishClass(std::vector<ClassMember> members, bool negated,
                            bool bracketed, const Token &start) {
  std::string alphabet = CharClassNode::resolveAlphabet(members, negated);
  if (alphabet.empty()) {
    std::string construct = source_.substr(
        start.location.offset, previous().location.offset +
                                   previous().lexeme.size() -
                                   start.location.offset);
    throw ValidationError("character class has no characters to generate",
                          start.location, construct);
  }

  std::optional<Distribution> distribution;
  if (check(TokenType::TILDE)) {
    distribution = AnnotationResolver::forClass(parseAnnotation(), alphabet);
  }

  return std::make_unique<CharClassNode>(std::move(members), negated, bracketed,
                                         std::move(distribution),
                                         start.location.offset);
}

// ============================================================================
// Quantifiers
// ============================================================================

NodePtr Parser::parseQuantifier(NodePtr atom) {
  const Token &token = advance();
  size_t min = 0;
  size_t max = QuantifiedNode::UNBOUNDED;
  bool exact = false;
  std::optional<DistributionAnnotation> annotation;

  switch (token.type) {
  case TokenType::STAR:
    break;
  case TokenType::PLUS:
    min = 1;
    break;
  case TokenType::QUESTION:
    max = 1;
    break;
  default: {
    // '{'
    if (isAtEnd()) {
      throw SyntaxError("unmatched '{'", token.location, "'}'");
    }
    min = parseCount();
    if (match(TokenType::COMMA)) {
      if (peek().isDigit()) {
        max = parseCount();
      }
    } else {
      max = min;
      exact = true;
    }

    if (check(TokenType::TILDE)) {
      annotation = parseAnnotation();
    }
    if (!check(TokenType::RBRACE)) {
      if (isAtEnd()) {
        throw SyntaxError("unmatched '{'", token.location, "'}'");
      }
      throw SyntaxError("unexpected '" + peek().lexeme + "' in quantifier",
                        peek().location, exact ? "',', '~' or '}'" : "'~' or '}'");
    }
    advance();

    if (min > max) {
      throw ValidationError("repeat bounds are inverted: {" +
                                std::to_string(min) + "," +
                                std::to_string(max) + "}",
                            token.location,
                            source_.substr(token.location.offset,
                                           previous().location.offset + 1 -
                                               token.location.offset));
    }
    break;
  }
  }

  if (token.type != TokenType::LBRACE && check(TokenType::TILDE)) {
    annotation = parseAnnotation();
  }

  std::optional<Distribution> distribution;
  if (annotation) {
    distribution = AnnotationResolver::forQuantifier(*annotation, min);
    if (exact) {
      // The distribution replaces the literal count
      min = 0;
      max = QuantifiedNode::UNBOUNDED;
    }
  }

  size_t offset = atom->offset();
  return std::make_unique<QuantifiedNode>(std::move(atom), min, max,
                                          std::move(distribution), offset);
}

size_t Parser::parseCount() {
  if (!peek().isDigit()) {
    throw SyntaxError("expected a repeat count", peek().location, "digits");
  }

  SourceLocation location = peek().location;
  std::string digits;
  while (peek().isDigit()) {
    digits += advance().value;
  }

  size_t first = digits.find_first_not_of('0');
  std::string significant = first == std::string::npos ? "0" : digits.substr(first);
  if (significant.size() > 7 || std::stoul(significant) > MAX_REPEAT_COUNT) {
    throw ValidationError("repeat count " + digits + " exceeds the limit of " +
                              std::to_string(MAX_REPEAT_COUNT),
                          location, digits);
  }
  return std::stoul(significant);
}

// ============================================================================
// Distribution annotations
// ============================================================================

DistributionAnnotation Parser::parseAnnotation() {
  const Token &tilde = advance(); // '~'
  DistributionAnnotation annotation;
  annotation.location = tilde.location;

  while (peek().isLetter()) {
    annotation.name += advance().value;
  }
  if (annotation.name.empty()) {
    throw SyntaxError("expected a distribution name after '~'",
                      peek().location, "Bin, Ber, Cat, Const, Geo or Zipf");
  }

  if (!check(TokenType::LPAREN)) {
    return annotation;
  }
  const Token &open = advance();
  if (match(TokenType::RPAREN)) {
    return annotation;
  }

  do {
    annotation.parameters.push_back(parseParameter());
  } while (match(TokenType::COMMA));

  if (!check(TokenType::RPAREN)) {
    if (isAtEnd()) {
      throw SyntaxError("unmatched '('", open.location, "')'");
    }
    throw SyntaxError("unexpected '" + peek().lexeme + "' in parameter list",
                      peek().location, "',' or ')'");
  }
  advance();
  return annotation;
}

AnnotationParameter Parser::parseParameter() {
  AnnotationParameter parameter;
  parameter.location = peek().location;

  if (peekAhead(1).is(TokenType::EQUALS)) {
    const Token &key = peek();
    switch (key.type) {
    case TokenType::LITERAL:
      parameter.key = key.value;
      break;
    case TokenType::ESCAPED:
      parameter.key = key.value;
      parameter.keyEscaped = true;
      break;
    case TokenType::DOT:
      parameter.key = '.';
      break;
    default:
      throw SyntaxError("invalid parameter key '" + key.lexeme + "'",
                        key.location, "single character or '.'");
    }
    advance();
    advance(); // '='
  }

  parseNumber(parameter);
  return parameter;
}

void Parser::parseNumber(AnnotationParameter &parameter) {
  SourceLocation location = peek().location;
  std::string text;
  bool integral = true;
  bool digits = false;

  auto isLiteral = [this](char c) {
    return peek().is(TokenType::LITERAL) && peek().value == c;
  };

  if (isLiteral('-')) {
    text += advance().value;
  }
  while (peek().isDigit()) {
    text += advance().value;
    digits = true;
  }
  if (check(TokenType::DOT)) {
    advance();
    text += '.';
    integral = false;
    while (peek().isDigit()) {
      text += advance().value;
      digits = true;
    }
  }
  if (digits && (isLiteral('e') || isLiteral('E'))) {
    text += advance().value;
    integral = false;
    if (isLiteral('-')) {
      text += advance().value;
    } else if (check(TokenType::PLUS)) {
      advance();
      text += '+';
    }
    bool exponentDigits = false;
    while (peek().isDigit()) {
      text += advance().value;
      exponentDigits = true;
    }
    digits = exponentDigits;
  }

  if (!digits) {
    throw SyntaxError(text.empty() ? "expected a number"
                                   : "malformed number '" + text + "'",
                      text.empty() ? peek().location : location, "number");
  }

  try {
    parameter.value = std::stod(text);
  } catch (const std::out_of_range &) {
    // Underflow rounds toward zero; only overflow is rejected
    double rounded = std::strtod(text.c_str(), nullptr);
    if (!std::isfinite(rounded)) {
      throw ValidationError("number out of range '" + text + "'", location,
                            text);
    }
    parameter.value = rounded;
  }
  parameter.integral = integral;
  parameter.text = text;
}

// ============================================================================
// Errors
// ============================================================================

bool Parser::startsAtom(const Token &token) {
  switch (token.type) {
  case TokenType::LITERAL:
  case TokenType::ESCAPED:
  case TokenType::DOT:
  case TokenType::SHORTHAND_CLASS:
  case TokenType::LBRACKET:
  case TokenType::LPAREN:
  case TokenType::ERROR:
    return true;
  default:
    return false;
  }
}

void Parser::unexpected(const Token &token) const {
  switch (token.type) {
  case TokenType::ERROR:
    throw SyntaxError("unterminated escape at end of pattern", token.location,
                      "character after '\\'");
  case TokenType::END_OF_FILE:
    throw SyntaxError("unexpected end of pattern", token.location, "pattern");
  case TokenType::STAR:
  case TokenType::PLUS:
  case TokenType::QUESTION:
  case TokenType::LBRACE:
    throw SyntaxError("quantifier '" + token.lexeme + "' has nothing to repeat",
                      token.location, "character, class or group");
  case TokenType::RPAREN:
    throw SyntaxError("unmatched ')'", token.location, "'(' before it");
  case TokenType::RBRACKET:
  case TokenType::RBRACE:
    throw SyntaxError("unmatched '" + token.lexeme + "'", token.location,
                      "'\\" + token.lexeme + "'");
  case TokenType::CARET:
    throw SyntaxError("'^' is only allowed at the start of the pattern",
                      token.location, "'\\^'");
  case TokenType::DOLLAR:
    throw SyntaxError("'$' is only allowed at the end of the pattern",
                      token.location, "'\\$'");
  case TokenType::TILDE:
    throw SyntaxError("distribution annotation must follow a quantifier or a "
                      "class",
                      token.location, "'\\~'");
  default:
    throw SyntaxError("unexpected '" + token.lexeme + "'", token.location,
                      "'\\" + token.lexeme + "'");
  }
}

} // namespace regen
