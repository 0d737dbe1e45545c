#pragma once

#include "pattern/node.hpp"

#include <memory>
#include <string>

namespace regen {

/**
 * Pattern - parsed and validated generation template
 *
 * Owns its node tree and never changes after construction, so a single
 * Pattern can be rendered by any number of threads at once, each with its own
 * RandomSource. Anchors are kept as metadata only; they emit nothing.
 */
class Pattern {
public:
  Pattern(NodePtr root, bool anchoredStart, bool anchoredEnd,
          std::string source);

  Pattern(Pattern &&) = default;
  Pattern &operator=(Pattern &&) = default;
  Pattern(const Pattern &) = delete;
  Pattern &operator=(const Pattern &) = delete;

  const Node &root() const { return *root_; }
  bool anchoredStart() const { return anchoredStart_; }
  bool anchoredEnd() const { return anchoredEnd_; }

  // Text this pattern was parsed from
  const std::string &source() const { return source_; }

  // Canonical pattern text; parsing it yields a structurally identical tree
  std::string toString() const;

private:
  NodePtr root_;
  bool anchoredStart_;
  bool anchoredEnd_;
  std::string source_;
};

} // namespace regen
