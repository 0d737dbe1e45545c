#include "pattern/node.hpp"
#include "pattern/charSet.hpp"

#include <stdexcept>

namespace regen {

void LiteralNode::accept(NodeVisitor &visitor) const { visitor.visit(*this); }

void WildcardNode::accept(NodeVisitor &visitor) const { visitor.visit(*this); }

// ============================================================================
// CharClassNode
// ============================================================================

CharClassNode::CharClassNode(std::vector<ClassMember> members, bool negated,
                             bool bracketed,
                             std::optional<Distribution> distribution,
                             size_t offset)
    : Node(offset), members_(std::move(members)), negated_(negated),
      bracketed_(bracketed), alphabet_(resolveAlphabet(members_, negated)),
      distribution_(std::move(distribution)) {}

void CharClassNode::accept(NodeVisitor &visitor) const { visitor.visit(*this); }

std::string CharClassNode::resolveAlphabet(const std::vector<ClassMember> &members,
                                           bool negated) {
  std::string alphabet;
  for (const auto &member : members) {
    switch (member.type) {
    case ClassMember::Type::Literal:
      charset::appendUnique(alphabet, std::string(1, member.character));
      break;
    case ClassMember::Type::Shorthand:
      charset::appendUnique(alphabet,
                            charset::shorthand(member.character).value_or(""));
      break;
    case ClassMember::Type::Posix:
      charset::appendUnique(alphabet, charset::posix(member.name).value_or(""));
      break;
    case ClassMember::Type::Wildcard:
      charset::appendUnique(alphabet, charset::defaultUniverse());
      break;
    }
  }
  return negated ? charset::complement(alphabet) : alphabet;
}

// ============================================================================
// Composite nodes
// ============================================================================

ConcatNode::ConcatNode(std::vector<NodePtr> children, size_t offset)
    : Node(offset), children_(std::move(children)) {
  if (children_.size() < 2) {
    throw std::invalid_argument("concatenation needs at least two children");
  }
}

void ConcatNode::accept(NodeVisitor &visitor) const { visitor.visit(*this); }

AlternationNode::AlternationNode(std::vector<NodePtr> branches, size_t offset)
    : Node(offset), branches_(std::move(branches)) {
  if (branches_.size() < 2) {
    throw std::invalid_argument("alternation needs at least two branches");
  }
}

void AlternationNode::accept(NodeVisitor &visitor) const {
  visitor.visit(*this);
}

QuantifiedNode::QuantifiedNode(NodePtr child, size_t min, size_t max,
                               std::optional<Distribution> distribution,
                               size_t offset)
    : Node(offset), child_(std::move(child)), min_(min), max_(max),
      distribution_(std::move(distribution)) {
  if (!child_) {
    throw std::invalid_argument("quantifier needs a child");
  }
}

void QuantifiedNode::accept(NodeVisitor &visitor) const { visitor.visit(*this); }

} // namespace regen
