#include "random/randomSource.hpp"

#include <chrono>
#include <limits>

namespace regen {

RandomSource::RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

uint64_t RandomSource::next() { return engine_(); }

double RandomSource::uniformReal() {
  // top 53 bits scaled by 2^-53
  return static_cast<double>(next() >> 11) * 0x1.0p-53;
}

uint64_t RandomSource::uniformInt(uint64_t low, uint64_t high) {
  uint64_t range = high - low;
  if (range == std::numeric_limits<uint64_t>::max()) {
    return next();
  }

  // Rejection sampling removes the modulo bias
  uint64_t bound = range + 1;
  uint64_t threshold = (0 - bound) % bound;
  while (true) {
    uint64_t value = next();
    if (value >= threshold) {
      return low + value % bound;
    }
  }
}

bool RandomSource::chance(double probability) {
  if (probability <= 0.0)
    return false;
  if (probability >= 1.0)
    return true;
  return uniformReal() < probability;
}

uint64_t RandomSource::timeSeed() {
  std::random_device device;
  uint64_t entropy = (static_cast<uint64_t>(device()) << 32) | device();
  auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return entropy ^ static_cast<uint64_t>(ticks);
}

} // namespace regen
