#include "pattern/patternPrinter.hpp"
#include "pattern/pattern.hpp"

#include <string_view>

namespace regen {

std::string PatternPrinter::print(const Pattern &pattern) {
  std::string text = pattern.anchoredStart() ? "^" : "";
  text += print(pattern.root());
  if (pattern.anchoredEnd()) {
    text += "$";
  }
  return text;
}

std::string PatternPrinter::print(const Node &node) {
  PatternPrinter printer;
  node.accept(printer);
  return printer.text();
}

bool PatternPrinter::isReserved(char character) {
  static constexpr std::string_view reserved = "^$|().\\+?*{}[]~,=";
  return reserved.find(character) != std::string_view::npos;
}

void PatternPrinter::visit(const LiteralNode &node) {
  if (isReserved(node.character())) {
    text_ += '\\';
  }
  text_ += node.character();
}

void PatternPrinter::visit(const WildcardNode &node) {
  (void)node;
  text_ += '.';
}

void PatternPrinter::visit(const CharClassNode &node) {
  if (!node.bracketed() && node.members().size() == 1 &&
      node.members().front().type == ClassMember::Type::Shorthand) {
    text_ += '\\';
    text_ += node.members().front().character;
  } else {
    text_ += node.negated() ? "[^" : "[";
    for (const auto &member : node.members()) {
      switch (member.type) {
      case ClassMember::Type::Literal:
        if (isReserved(member.character)) {
          text_ += '\\';
        }
        text_ += member.character;
        break;
      case ClassMember::Type::Shorthand:
        text_ += '\\';
        text_ += member.character;
        break;
      case ClassMember::Type::Posix:
        text_ += "[:" + member.name + ":]";
        break;
      case ClassMember::Type::Wildcard:
        text_ += '.';
        break;
      }
    }
    text_ += ']';
  }

  if (node.distribution()) {
    text_ += node.distribution()->describe();
  }
}

void PatternPrinter::visit(const ConcatNode &node) {
  for (const auto &child : node.children()) {
    NodeKind kind = child->kind();
    printChild(*child, kind == NodeKind::Concat || kind == NodeKind::Alternation);
  }
}

void PatternPrinter::visit(const AlternationNode &node) {
  bool first = true;
  for (const auto &branch : node.branches()) {
    if (!first) {
      text_ += '|';
    }
    first = false;
    printChild(*branch, branch->kind() == NodeKind::Alternation);
  }
}

void PatternPrinter::visit(const QuantifiedNode &node) {
  NodeKind kind = node.child().kind();
  printChild(node.child(), kind == NodeKind::Concat ||
                               kind == NodeKind::Alternation ||
                               kind == NodeKind::Quantified);
  printQuantifier(node);
}

void PatternPrinter::printChild(const Node &child, bool grouped) {
  if (grouped) {
    text_ += '(';
  }
  child.accept(*this);
  if (grouped) {
    text_ += ')';
  }
}

void PatternPrinter::printQuantifier(const QuantifiedNode &node) {
  const auto &distribution = node.distribution();

  if (!distribution) {
    if (node.min() == 0 && node.max() == 1) {
      text_ += '?';
    } else if (node.min() == 0 && node.unbounded()) {
      text_ += '*';
    } else if (node.min() == 1 && node.unbounded()) {
      text_ += '+';
    } else if (node.min() == node.max()) {
      text_ += "{" + std::to_string(node.min()) + "}";
    } else if (node.unbounded()) {
      text_ += "{" + std::to_string(node.min()) + ",}";
    } else {
      text_ += "{" + std::to_string(node.min()) + "," +
               std::to_string(node.max()) + "}";
    }
    return;
  }

  // [0, unbounded] with a distribution is what the exact form {n~D} parses
  // to; n only matters to Geo, whose offset it becomes
  if (node.min() == 0 && node.unbounded()) {
    uint64_t baseline = 0;
    if (auto *geometric = distribution->get<Geometric>()) {
      baseline = geometric->offset;
    }
    text_ += "{" + std::to_string(baseline) + distribution->describe() + "}";
  } else if (node.unbounded()) {
    text_ += "{" + std::to_string(node.min()) + "," + distribution->describe() +
             "}";
  } else {
    text_ += "{" + std::to_string(node.min()) + "," +
             std::to_string(node.max()) + distribution->describe() + "}";
  }
}

} // namespace regen
