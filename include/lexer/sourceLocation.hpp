#pragma once

#include <cstddef>

namespace regen {

struct SourceLocation {
  size_t offset{}; // 0-based byte offset into the pattern text
  size_t line{};   // 1-based
  size_t column{}; // 1-based
};

} // namespace regen
