#pragma once

#include <cstdint>
#include <random>

namespace regen {

/**
 * RandomSource - seeded source of uniform draws
 *
 * Every sampler and the generation engine take a RandomSource by reference;
 * there is no global random state. Uniform integers and reals are derived
 * from the raw output of std::mt19937_64 (whose sequence is fixed by the
 * standard) instead of std::uniform_*_distribution, so a seed produces the
 * same draws with every standard library.
 *
 * Not thread-safe: give each thread its own instance.
 */
class RandomSource {
public:
  explicit RandomSource(uint64_t seed);

  uint64_t seed() const { return seed_; }

  // Raw 64-bit engine output
  uint64_t next();

  /**
   * Uniform real in [0, 1) with 53 bits of precision
   */
  double uniformReal();

  /**
   * Uniform integer in [low, high], both inclusive. Requires low <= high.
   */
  uint64_t uniformInt(uint64_t low, uint64_t high);

  /**
   * True with the given probability; values outside [0, 1] saturate
   */
  bool chance(double probability);

  // Seed derived from the clock and std::random_device, for unseeded runs
  static uint64_t timeSeed();

private:
  uint64_t seed_;
  std::mt19937_64 engine_;
};

} // namespace regen
