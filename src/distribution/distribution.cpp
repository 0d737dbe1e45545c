#include "distribution/distribution.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace regen {

namespace {

// Geometric draws beyond this are saturated; every caller clamps far below it
constexpr double GEOMETRIC_SATURATION = 9.0e18;

void requireProbability(double probability, const std::string &kind) {
  if (!std::isfinite(probability) || probability < 0.0 || probability > 1.0) {
    throw DistributionError(kind + " probability must be within [0, 1], got " +
                            formatNumber(probability));
  }
}

uint64_t saturatingAdd(uint64_t a, uint64_t b) {
  uint64_t max = std::numeric_limits<uint64_t>::max();
  return a > max - b ? max : a + b;
}

} // namespace

std::string formatNumber(double value) {
  char buffer[32];
  for (int precision = 1; precision <= 17; precision++) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) {
      break;
    }
  }
  return buffer;
}

// ============================================================================
// Validating constructors
// ============================================================================

Distribution Distribution::constant(uint64_t value) {
  return Distribution(Constant{value});
}

Distribution Distribution::bernoulli(double probability) {
  requireProbability(probability, "Ber");
  return Distribution(Bernoulli{probability});
}

Distribution Distribution::binomial(uint64_t trials, double probability) {
  requireProbability(probability, "Bin");
  if (trials > MAX_BINOMIAL_TRIALS) {
    throw DistributionError("Bin trial count must be at most " +
                            std::to_string(MAX_BINOMIAL_TRIALS) + ", got " +
                            std::to_string(trials));
  }
  return Distribution(Binomial{trials, probability});
}

Distribution Distribution::categorical(std::vector<double> weights) {
  if (weights.empty()) {
    throw DistributionError("Cat needs at least one weight");
  }
  double total = 0.0;
  for (double weight : weights) {
    if (!std::isfinite(weight) || weight < 0.0) {
      throw DistributionError("Cat weights must be non-negative, got " +
                              formatNumber(weight));
    }
    total += weight;
  }
  if (total <= 0.0) {
    throw DistributionError("Cat weights must not all be zero");
  }
  return Distribution(Categorical{std::move(weights), total});
}

Distribution Distribution::geometric(double probability, uint64_t offset) {
  if (!std::isfinite(probability) || probability <= 0.0 || probability >= 1.0) {
    throw DistributionError("Geo probability must be within (0, 1), got " +
                            formatNumber(probability));
  }
  return Distribution(Geometric{probability, offset});
}

Distribution Distribution::zipf(double exponent, uint64_t ranks) {
  if (!std::isfinite(exponent) || exponent <= 0.0) {
    throw DistributionError("Zipf exponent must be positive, got " +
                            formatNumber(exponent));
  }
  if (ranks < 1 || ranks > MAX_ZIPF_RANKS) {
    throw DistributionError("Zipf rank count must be within [1, " +
                            std::to_string(MAX_ZIPF_RANKS) + "], got " +
                            std::to_string(ranks));
  }

  std::vector<double> cumulative(ranks);
  double sum = 0.0;
  for (uint64_t rank = 1; rank <= ranks; rank++) {
    sum += std::pow(static_cast<double>(rank), -exponent);
    cumulative[rank - 1] = sum;
  }
  for (double &value : cumulative) {
    value /= sum;
  }
  cumulative.back() = 1.0;
  return Distribution(Zipf{exponent, ranks, std::move(cumulative)});
}

// ============================================================================
// Sampling
// ============================================================================

uint64_t Distribution::sample(RandomSource &source) const {
  if (auto *constant = std::get_if<Constant>(&params_)) {
    return constant->value;
  }

  if (auto *bernoulli = std::get_if<Bernoulli>(&params_)) {
    return source.chance(bernoulli->probability) ? 1 : 0;
  }

  if (auto *binomial = std::get_if<Binomial>(&params_)) {
    uint64_t successes = 0;
    for (uint64_t trial = 0; trial < binomial->trials; trial++) {
      if (source.chance(binomial->probability)) {
        successes++;
      }
    }
    return successes;
  }

  if (auto *categorical = std::get_if<Categorical>(&params_)) {
    double target = source.uniformReal() * categorical->totalWeight;
    double cumulative = 0.0;
    uint64_t lastPositive = 0;
    for (size_t index = 0; index < categorical->weights.size(); index++) {
      double weight = categorical->weights[index];
      if (weight <= 0.0)
        continue;
      cumulative += weight;
      lastPositive = index;
      if (target < cumulative) {
        return index;
      }
    }
    // Rounding can leave target just above the accumulated total
    return lastPositive;
  }

  if (auto *geometric = std::get_if<Geometric>(&params_)) {
    // Inverse transform: floor(log(U) / log(1 - p)) with U in (0, 1]
    double uniform = 1.0 - source.uniformReal();
    double failures =
        std::floor(std::log(uniform) / std::log1p(-geometric->probability));
    if (!(failures < GEOMETRIC_SATURATION)) {
      failures = GEOMETRIC_SATURATION;
    }
    return saturatingAdd(geometric->offset, static_cast<uint64_t>(failures));
  }

  const Zipf &zipf = std::get<Zipf>(params_);
  double target = source.uniformReal();
  for (size_t index = 0; index < zipf.cumulative.size(); index++) {
    if (target < zipf.cumulative[index]) {
      return index + 1;
    }
  }
  return zipf.ranks;
}

// ============================================================================
// Probability mass and support
// ============================================================================

double Distribution::pmf(uint64_t x) const {
  if (auto *constant = std::get_if<Constant>(&params_)) {
    return x == constant->value ? 1.0 : 0.0;
  }

  if (auto *bernoulli = std::get_if<Bernoulli>(&params_)) {
    if (x == 0)
      return 1.0 - bernoulli->probability;
    if (x == 1)
      return bernoulli->probability;
    return 0.0;
  }

  if (auto *binomial = std::get_if<Binomial>(&params_)) {
    uint64_t n = binomial->trials;
    double p = binomial->probability;
    if (x > n)
      return 0.0;
    if (p <= 0.0)
      return x == 0 ? 1.0 : 0.0;
    if (p >= 1.0)
      return x == n ? 1.0 : 0.0;
    double k = static_cast<double>(x);
    double trials = static_cast<double>(n);
    double logChoose =
        std::lgamma(trials + 1) - std::lgamma(k + 1) - std::lgamma(trials - k + 1);
    return std::exp(logChoose + k * std::log(p) + (trials - k) * std::log1p(-p));
  }

  if (auto *categorical = std::get_if<Categorical>(&params_)) {
    if (x >= categorical->weights.size())
      return 0.0;
    return categorical->weights[x] / categorical->totalWeight;
  }

  if (auto *geometric = std::get_if<Geometric>(&params_)) {
    if (x < geometric->offset)
      return 0.0;
    double failures = static_cast<double>(x - geometric->offset);
    return geometric->probability *
           std::pow(1.0 - geometric->probability, failures);
  }

  const Zipf &zipf = std::get<Zipf>(params_);
  if (x < 1 || x > zipf.ranks)
    return 0.0;
  double previous = x == 1 ? 0.0 : zipf.cumulative[x - 2];
  return zipf.cumulative[x - 1] - previous;
}

uint64_t Distribution::lowerBound() const {
  if (auto *constant = std::get_if<Constant>(&params_)) {
    return constant->value;
  }
  if (auto *geometric = std::get_if<Geometric>(&params_)) {
    return geometric->offset;
  }
  if (std::holds_alternative<Zipf>(params_)) {
    return 1;
  }
  return 0;
}

std::optional<uint64_t> Distribution::upperBound() const {
  if (auto *constant = std::get_if<Constant>(&params_)) {
    return constant->value;
  }
  if (std::holds_alternative<Bernoulli>(params_)) {
    return 1;
  }
  if (auto *binomial = std::get_if<Binomial>(&params_)) {
    return binomial->trials;
  }
  if (auto *categorical = std::get_if<Categorical>(&params_)) {
    return categorical->weights.size() - 1;
  }
  if (auto *zipf = std::get_if<Zipf>(&params_)) {
    return zipf->ranks;
  }
  return std::nullopt;
}

// ============================================================================
// Text
// ============================================================================

std::string Distribution::kindName() const {
  switch (params_.index()) {
  case 0:
    return "Const";
  case 1:
    return "Ber";
  case 2:
    return "Bin";
  case 3:
    return "Cat";
  case 4:
    return "Geo";
  default:
    return "Zipf";
  }
}

std::string Distribution::describe() const {
  std::string text = "~" + kindName() + "(";

  if (auto *constant = std::get_if<Constant>(&params_)) {
    text += std::to_string(constant->value);
  } else if (auto *bernoulli = std::get_if<Bernoulli>(&params_)) {
    text += formatNumber(bernoulli->probability);
  } else if (auto *binomial = std::get_if<Binomial>(&params_)) {
    text += std::to_string(binomial->trials) + "," +
            formatNumber(binomial->probability);
  } else if (auto *categorical = std::get_if<Categorical>(&params_)) {
    for (size_t i = 0; i < categorical->weights.size(); i++) {
      if (i > 0)
        text += ",";
      text += formatNumber(categorical->weights[i]);
    }
  } else if (auto *geometric = std::get_if<Geometric>(&params_)) {
    text += formatNumber(geometric->probability);
  } else if (auto *zipf = std::get_if<Zipf>(&params_)) {
    text += formatNumber(zipf->exponent) + "," + std::to_string(zipf->ranks);
  }

  return text + ")";
}

bool Distribution::operator==(const Distribution &other) const {
  return params_ == other.params_;
}

} // namespace regen
