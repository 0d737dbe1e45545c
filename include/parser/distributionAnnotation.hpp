#pragma once

#include "lexer/sourceLocation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace regen {

// One parameter of ~Name(...), recorded as written
struct AnnotationParameter {
  std::optional<char> key; // set for key=value
  bool keyEscaped{};       // key written as \x
  double value{};
  bool integral{};  // written without a decimal point
  std::string text; // value as written
  SourceLocation location;

  // An unescaped '.' key names the mass left over for unweighted members
  bool isRemainder() const { return key && *key == '.' && !keyEscaped; }
};

// Raw ~Name(params) annotation, before it is checked against its context
struct DistributionAnnotation {
  std::string name;
  SourceLocation location; // of the '~'
  std::vector<AnnotationParameter> parameters;

  size_t positionalCount() const {
    size_t count = 0;
    for (const auto &parameter : parameters) {
      if (!parameter.key) {
        count++;
      }
    }
    return count;
  }
};

} // namespace regen
