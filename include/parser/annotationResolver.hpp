#pragma once

#include "distribution/distribution.hpp"
#include "parser/distributionAnnotation.hpp"

#include <cstdint>
#include <string>

namespace regen {

/**
 * AnnotationResolver - validation pass for distribution annotations
 *
 * Turns a raw ~Name(params) annotation into a Distribution for the place it
 * is attached to. Positional parameters fill the distribution's slots left
 * to right, named parameters then fill slots by key; assigning a slot twice,
 * an unknown key or a surplus positional parameter is an error. Unfilled
 * slots take defaults derived from the context. All failures are thrown as
 * ValidationError located at the offending parameter or annotation.
 */
class AnnotationResolver {
public:
  /**
   * Resolve an annotation attached to a quantifier. baseline is the count the
   * quantifier states on its own (n for {n}, the lower bound otherwise); it
   * supplies defaults: Const value, Bin trials, Zipf ranks and Geo offset.
   */
  static Distribution forQuantifier(const DistributionAnnotation &annotation,
                                    uint64_t baseline);

  /**
   * Resolve an annotation attached to a character class with the given
   * effective alphabet. The distribution draws an index into the alphabet.
   */
  static Distribution forClass(const DistributionAnnotation &annotation,
                               const std::string &alphabet);

  // Canonical spelling of a distribution name (case-insensitive), or empty
  static std::string canonicalName(const std::string &name);
};

} // namespace regen
