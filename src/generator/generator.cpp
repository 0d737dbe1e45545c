#include "generator/generator.hpp"
#include "pattern/charSet.hpp"

#include <algorithm>

namespace regen {

namespace {

// Appends the rendering of each visited node to one output string
class RenderVisitor : public NodeVisitor {
public:
  RenderVisitor(const Generator &generator, RandomSource &source,
                std::string &out)
      : generator_(generator), source_(source), out_(out) {}

  void visit(const LiteralNode &node) override { out_ += node.character(); }

  void visit(const WildcardNode &node) override {
    (void)node;
    const std::string &universe = charset::defaultUniverse();
    out_ += universe[source_.uniformInt(0, universe.size() - 1)];
  }

  void visit(const CharClassNode &node) override {
    out_ += node.alphabet()[generator_.memberIndex(node, source_)];
  }

  void visit(const ConcatNode &node) override {
    for (const auto &child : node.children()) {
      child->accept(*this);
    }
  }

  void visit(const AlternationNode &node) override {
    const auto &branches = node.branches();
    branches[source_.uniformInt(0, branches.size() - 1)]->accept(*this);
  }

  void visit(const QuantifiedNode &node) override {
    size_t count = generator_.repeatCount(node, source_);
    for (size_t i = 0; i < count; i++) {
      node.child().accept(*this);
    }
  }

private:
  const Generator &generator_;
  RandomSource &source_;
  std::string &out_;
};

} // namespace

std::string Generator::generate(const Pattern &pattern,
                                RandomSource &source) const {
  std::string out;
  RenderVisitor renderer(*this, source, out);
  pattern.root().accept(renderer);
  return out;
}

std::vector<std::string> Generator::generateBatch(const Pattern &pattern,
                                                  size_t count,
                                                  RandomSource &source) const {
  std::vector<std::string> results;
  results.reserve(count);
  for (size_t i = 0; i < count; i++) {
    results.push_back(generate(pattern, source));
  }
  return results;
}

size_t Generator::repeatCount(const QuantifiedNode &node,
                              RandomSource &source) const {
  if (node.min() > node.max()) {
    throw GenerationFault("quantifier bounds are inverted: min " +
                          std::to_string(node.min()) + " > max " +
                          std::to_string(node.max()));
  }

  size_t max = node.unbounded() ? std::max(options_.unboundedCap, node.min())
                                : node.max();

  if (!node.distribution()) {
    return source.uniformInt(node.min(), max);
  }

  uint64_t sample = node.distribution()->sample(source);
  return std::clamp<uint64_t>(sample, node.min(), max);
}

size_t Generator::memberIndex(const CharClassNode &node,
                              RandomSource &source) const {
  size_t size = node.alphabet().size();
  if (size == 0) {
    throw GenerationFault("character class has an empty alphabet");
  }

  const auto &distribution = node.distribution();
  if (!distribution) {
    return source.uniformInt(0, size - 1);
  }

  uint64_t index = distribution->sample(source);
  if (distribution->get<Zipf>()) {
    index -= 1; // ranks start at 1
  }
  return std::min<uint64_t>(index, size - 1);
}

std::string generate(const Pattern &pattern, RandomSource &source) {
  return Generator().generate(pattern, source);
}

} // namespace regen
