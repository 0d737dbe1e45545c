#pragma once

#include "pattern/pattern.hpp"
#include "random/randomSource.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace regen {

/**
 * Invariant violation that reached the generator (min > max, empty
 * alphabet). A parsed Pattern never contains one; hand-built trees can.
 */
class GenerationFault : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

struct GeneratorOptions {
  // Repeat count substituted for an unbounded quantifier maximum
  size_t unboundedCap = 32;
};

/**
 * Generator - renders a Pattern into random strings
 *
 * Stateless apart from its options: generate() is const and every draw comes
 * from the RandomSource passed in, so identical sources produce identical
 * strings and one Generator can be shared between threads.
 */
class Generator {
public:
  Generator() = default;
  explicit Generator(GeneratorOptions options) : options_(options) {}

  std::string generate(const Pattern &pattern, RandomSource &source) const;

  // count renderings of the same pattern, in draw order
  std::vector<std::string> generateBatch(const Pattern &pattern, size_t count,
                                         RandomSource &source) const;

  /**
   * Number of repetitions for one occurrence of a quantifier: a sample of its
   * distribution clamped into [min, effective max], or a uniform draw from
   * that range. The effective max is the cap for unbounded quantifiers and
   * never less than min.
   */
  size_t repeatCount(const QuantifiedNode &node, RandomSource &source) const;

  // Index into the class alphabet for one draw, clamped to the last member
  size_t memberIndex(const CharClassNode &node, RandomSource &source) const;

  const GeneratorOptions &options() const { return options_; }

private:
  GeneratorOptions options_;
};

// Render pattern once with default options
std::string generate(const Pattern &pattern, RandomSource &source);

} // namespace regen
