#pragma once

#include "distribution/distribution.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regen {

class NodeVisitor;

enum class NodeKind { Literal, Wildcard, CharClass, Concat, Alternation, Quantified };

/**
 * Node - one element of a parsed pattern
 *
 * Nodes are immutable once built and own their children exclusively. Each
 * node remembers the offset in the pattern text where it begins.
 */
class Node {
public:
  virtual ~Node() = default;

  virtual NodeKind kind() const = 0;
  virtual void accept(NodeVisitor &visitor) const = 0;

  size_t offset() const { return offset_; }

protected:
  explicit Node(size_t offset) : offset_(offset) {}

private:
  size_t offset_;
};

using NodePtr = std::unique_ptr<Node>;

// A single fixed character
class LiteralNode : public Node {
public:
  LiteralNode(char character, size_t offset)
      : Node(offset), character_(character) {}

  NodeKind kind() const override { return NodeKind::Literal; }
  void accept(NodeVisitor &visitor) const override;

  char character() const { return character_; }

private:
  char character_;
};

// '.' outside a class: any character of the default universe
class WildcardNode : public Node {
public:
  explicit WildcardNode(size_t offset) : Node(offset) {}

  NodeKind kind() const override { return NodeKind::Wildcard; }
  void accept(NodeVisitor &visitor) const override;
};

// One constituent of a character class as written in the pattern
struct ClassMember {
  enum class Type { Literal, Shorthand, Posix, Wildcard };

  Type type = Type::Literal;
  char character = '\0'; // Literal: the character; Shorthand: 'w', 's' or 'd'
  std::string name;      // Posix: class name without the [: :] brackets

  bool operator==(const ClassMember &) const = default;
};

/**
 * CharClassNode - a set of characters eligible at one position
 *
 * The effective alphabet is resolved once, at construction: the union of the
 * members in order of first appearance, or for a negated class the default
 * universe minus that union, in universe order. An attached distribution
 * draws an index into the alphabet; without one, members are uniform.
 */
class CharClassNode : public Node {
public:
  CharClassNode(std::vector<ClassMember> members, bool negated, bool bracketed,
                std::optional<Distribution> distribution, size_t offset);

  NodeKind kind() const override { return NodeKind::CharClass; }
  void accept(NodeVisitor &visitor) const override;

  const std::vector<ClassMember> &members() const { return members_; }
  bool negated() const { return negated_; }
  // False for a bare shorthand class such as \d
  bool bracketed() const { return bracketed_; }
  const std::string &alphabet() const { return alphabet_; }
  const std::optional<Distribution> &distribution() const {
    return distribution_;
  }

  // Effective alphabet of the given members, as described above
  static std::string resolveAlphabet(const std::vector<ClassMember> &members,
                                     bool negated);

private:
  std::vector<ClassMember> members_;
  bool negated_;
  bool bracketed_;
  std::string alphabet_;
  std::optional<Distribution> distribution_;
};

// Ordered sequence of at least two nodes
class ConcatNode : public Node {
public:
  ConcatNode(std::vector<NodePtr> children, size_t offset);

  NodeKind kind() const override { return NodeKind::Concat; }
  void accept(NodeVisitor &visitor) const override;

  const std::vector<NodePtr> &children() const { return children_; }

private:
  std::vector<NodePtr> children_;
};

// Choice among at least two branches, kept in source order
class AlternationNode : public Node {
public:
  AlternationNode(std::vector<NodePtr> branches, size_t offset);

  NodeKind kind() const override { return NodeKind::Alternation; }
  void accept(NodeVisitor &visitor) const override;

  const std::vector<NodePtr> &branches() const { return branches_; }

private:
  std::vector<NodePtr> branches_;
};

/**
 * QuantifiedNode - a child repeated between min and max times
 *
 * max may be UNBOUNDED; the generator substitutes its configured cap. The
 * parser guarantees min <= max; the generator treats a violation as a fault.
 */
class QuantifiedNode : public Node {
public:
  static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

  QuantifiedNode(NodePtr child, size_t min, size_t max,
                 std::optional<Distribution> distribution, size_t offset);

  NodeKind kind() const override { return NodeKind::Quantified; }
  void accept(NodeVisitor &visitor) const override;

  const Node &child() const { return *child_; }
  size_t min() const { return min_; }
  size_t max() const { return max_; }
  bool unbounded() const { return max_ == UNBOUNDED; }
  const std::optional<Distribution> &distribution() const {
    return distribution_;
  }

private:
  NodePtr child_;
  size_t min_;
  size_t max_;
  std::optional<Distribution> distribution_;
};

class NodeVisitor {
public:
  virtual ~NodeVisitor() = default;

  virtual void visit(const LiteralNode &node) = 0;
  virtual void visit(const WildcardNode &node) = 0;
  virtual void visit(const CharClassNode &node) = 0;
  virtual void visit(const ConcatNode &node) = 0;
  virtual void visit(const AlternationNode &node) = 0;
  virtual void visit(const QuantifiedNode &node) = 0;
};

} // namespace regen
