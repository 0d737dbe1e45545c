#pragma once

#include "random/randomSource.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace regen {

// Thrown by the validating constructors when a parameter is out of domain
class DistributionError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

struct Constant {
  uint64_t value{};

  bool operator==(const Constant &) const = default;
};

struct Bernoulli {
  double probability{};

  bool operator==(const Bernoulli &) const = default;
};

struct Binomial {
  uint64_t trials{};
  double probability{};

  bool operator==(const Binomial &) const = default;
};

struct Categorical {
  std::vector<double> weights;
  double totalWeight{};

  bool operator==(const Categorical &) const = default;
};

// Number of failures before the first success, shifted by offset
struct Geometric {
  double probability{};
  uint64_t offset{};

  bool operator==(const Geometric &) const = default;
};

// Ranks 1..ranks, weight proportional to rank^-exponent
struct Zipf {
  double exponent{};
  uint64_t ranks{};
  std::vector<double> cumulative; // normalized CDF, cumulative[i] = P(rank <= i + 1)

  bool operator==(const Zipf &) const = default;
};

/**
 * Distribution - closed set of discrete probability laws
 *
 * The set of kinds is fixed by the pattern grammar (~Const, ~Ber, ~Bin, ~Cat,
 * ~Geo, ~Zipf), so it is a tagged variant rather than a class hierarchy.
 * Instances are only created through the validating factories below and are
 * immutable afterwards; sample() is const and draws exclusively from the
 * RandomSource it is handed.
 */
class Distribution {
public:
  using Params =
      std::variant<Constant, Bernoulli, Binomial, Categorical, Geometric, Zipf>;

  // Upper limits that keep sampling cost bounded
  static constexpr uint64_t MAX_BINOMIAL_TRIALS = 1u << 20;
  static constexpr uint64_t MAX_ZIPF_RANKS = 1u << 16;

  static Distribution constant(uint64_t value);
  static Distribution bernoulli(double probability);
  static Distribution binomial(uint64_t trials, double probability);
  static Distribution categorical(std::vector<double> weights);
  static Distribution geometric(double probability, uint64_t offset = 0);
  static Distribution zipf(double exponent, uint64_t ranks);

  uint64_t sample(RandomSource &source) const;

  // Exact probability mass at x
  double pmf(uint64_t x) const;

  // Smallest value in the support
  uint64_t lowerBound() const;

  // Largest value in the support, nullopt when unbounded (Geometric)
  std::optional<uint64_t> upperBound() const;

  // Grammar name of the kind: "Const", "Ber", "Bin", "Cat", "Geo", "Zipf"
  std::string kindName() const;

  /**
   * Canonical annotation text, e.g. "~Bin(4,0.5)". Every parameter is
   * written out, so reparsing it in the same context yields an equal
   * distribution. Geometric's offset is not part of the text; it comes from
   * the quantifier the annotation is attached to.
   */
  std::string describe() const;

  const Params &params() const { return params_; }

  template <typename T> const T *get() const {
    return std::get_if<T>(&params_);
  }

  bool operator==(const Distribution &other) const;
  bool operator!=(const Distribution &other) const { return !(*this == other); }

private:
  explicit Distribution(Params params) : params_(std::move(params)) {}

  Params params_;
};

// Shortest decimal text that reads back as the same double
std::string formatNumber(double value);

} // namespace regen
