#include "pattern/pattern.hpp"
#include "pattern/patternPrinter.hpp"

#include <stdexcept>

namespace regen {

Pattern::Pattern(NodePtr root, bool anchoredStart, bool anchoredEnd,
                 std::string source)
    : root_(std::move(root)), anchoredStart_(anchoredStart),
      anchoredEnd_(anchoredEnd), source_(std::move(source)) {
  if (!root_) {
    throw std::invalid_argument("pattern needs a root node");
  }
}

std::string Pattern::toString() const { return PatternPrinter::print(*this); }

} // namespace regen
