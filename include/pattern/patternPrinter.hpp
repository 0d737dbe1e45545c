#pragma once

#include "pattern/node.hpp"

#include <string>

namespace regen {

class Pattern;

/**
 * PatternPrinter - writes a node tree back as canonical pattern text
 *
 * Parentheses are emitted wherever the tree shape differs from what plain
 * precedence would produce (nested concatenations and alternations,
 * quantified composites), reserved characters are escaped and every
 * distribution is written with all of its parameters.
 */
class PatternPrinter : public NodeVisitor {
public:
  static std::string print(const Pattern &pattern);
  static std::string print(const Node &node);

  void visit(const LiteralNode &node) override;
  void visit(const WildcardNode &node) override;
  void visit(const CharClassNode &node) override;
  void visit(const ConcatNode &node) override;
  void visit(const AlternationNode &node) override;
  void visit(const QuantifiedNode &node) override;

  const std::string &text() const { return text_; }

private:
  std::string text_;

  void printChild(const Node &child, bool grouped);
  void printQuantifier(const QuantifiedNode &node);
  static bool isReserved(char character);
};

} // namespace regen
