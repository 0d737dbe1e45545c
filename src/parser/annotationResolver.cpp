#include "parser/annotationResolver.hpp"
#include "parser/patternError.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace regen {

namespace {

std::string describeKey(const AnnotationParameter &parameter) {
  std::string key(1, *parameter.key);
  return parameter.keyEscaped ? "\\" + key : key;
}

/**
 * Slots of a fixed-arity distribution with the parameters assigned to them.
 * Positional parameters go to slots in declaration order, named parameters
 * to the slot with the same key.
 */
class SlotTable {
public:
  SlotTable(const DistributionAnnotation &annotation, const std::string &kind,
            const std::string &keys)
      : kind_(kind), keys_(keys), assigned_(keys.size(), nullptr) {
    size_t next = 0;
    for (const auto &parameter : annotation.parameters) {
      if (parameter.key) {
        continue;
      }
      if (next >= keys_.size()) {
        throw ValidationError(kind_ + " takes at most " +
                                  std::to_string(keys_.size()) +
                                  " parameter(s)",
                              parameter.location, "~" + kind_);
      }
      assigned_[next++] = &parameter;
    }

    for (const auto &parameter : annotation.parameters) {
      if (!parameter.key) {
        continue;
      }
      size_t slot = parameter.keyEscaped ? std::string::npos
                                         : keys_.find(*parameter.key);
      if (slot == std::string::npos) {
        throw ValidationError("unknown parameter '" + describeKey(parameter) +
                                  "' for " + kind_,
                              parameter.location, describeKey(parameter));
      }
      if (assigned_[slot]) {
        throw ValidationError("parameter '" + describeKey(parameter) +
                                  "' of " + kind_ + " is assigned twice",
                              parameter.location, describeKey(parameter));
      }
      assigned_[slot] = &parameter;
    }
  }

  double real(char key, double fallback) const {
    const AnnotationParameter *parameter = find(key);
    return parameter ? parameter->value : fallback;
  }

  uint64_t count(char key, uint64_t fallback) const {
    const AnnotationParameter *parameter = find(key);
    if (!parameter) {
      return fallback;
    }
    std::string name = kind_ + " parameter '" + std::string(1, key) + "'";
    if (!parameter->integral) {
      throw ValidationError(name + " must be an integer, got " + parameter->text,
                            parameter->location, parameter->text);
    }
    if (parameter->value < 0) {
      throw ValidationError(name + " must not be negative, got " +
                                parameter->text,
                            parameter->location, parameter->text);
    }
    try {
      return std::stoull(parameter->text);
    } catch (const std::out_of_range &) {
      throw ValidationError(name + " is too large: " + parameter->text,
                            parameter->location, parameter->text);
    }
  }

  const AnnotationParameter *find(char key) const {
    size_t slot = keys_.find(key);
    return slot == std::string::npos ? nullptr : assigned_[slot];
  }

private:
  std::string kind_;
  std::string keys_;
  std::vector<const AnnotationParameter *> assigned_;
};

// Bin(p) or Bin(n, p): a single positional parameter is the probability
std::string binomialKeys(const DistributionAnnotation &annotation) {
  return annotation.positionalCount() >= 2 ? "np" : "pn";
}

template <typename Factory>
Distribution build(const DistributionAnnotation &annotation,
                   const std::string &kind, Factory factory) {
  try {
    return factory();
  } catch (const DistributionError &error) {
    throw ValidationError(error.what(), annotation.location, "~" + kind);
  }
}

void requireNonNegativeWeight(const AnnotationParameter &parameter) {
  if (parameter.value < 0) {
    throw ValidationError("Cat weights must be non-negative, got " +
                              parameter.text,
                          parameter.location, parameter.text);
  }
}

std::string resolveName(const DistributionAnnotation &annotation) {
  std::string kind = AnnotationResolver::canonicalName(annotation.name);
  if (kind.empty()) {
    throw ValidationError("unknown distribution '" + annotation.name +
                              "' (expected Bin, Ber, Cat, Const, Geo or Zipf)",
                          annotation.location, "~" + annotation.name);
  }
  return kind;
}

// Cat on a quantifier: weight i is the weight of repeating i times. Digit
// keys address the first ten counts; gaps weigh zero.
Distribution quantifierCategorical(const DistributionAnnotation &annotation) {
  std::vector<const AnnotationParameter *> assigned;
  for (const auto &parameter : annotation.parameters) {
    if (!parameter.key) {
      requireNonNegativeWeight(parameter);
      assigned.push_back(&parameter);
    }
  }

  for (const auto &parameter : annotation.parameters) {
    if (!parameter.key) {
      continue;
    }
    char key = *parameter.key;
    if (parameter.keyEscaped || !std::isdigit(static_cast<unsigned char>(key))) {
      throw ValidationError("unknown parameter '" + describeKey(parameter) +
                                "' for Cat (expected a repeat count 0-9)",
                            parameter.location, describeKey(parameter));
    }
    requireNonNegativeWeight(parameter);
    size_t index = static_cast<size_t>(key - '0');
    if (assigned.size() <= index) {
      assigned.resize(index + 1, nullptr);
    }
    if (assigned[index]) {
      throw ValidationError("weight for count " + std::to_string(index) +
                                " is assigned twice",
                            parameter.location, describeKey(parameter));
    }
    assigned[index] = &parameter;
  }

  std::vector<double> weights;
  weights.reserve(assigned.size());
  for (const auto *parameter : assigned) {
    weights.push_back(parameter ? parameter->value : 0.0);
  }
  return build(annotation, "Cat",
               [&] { return Distribution::categorical(std::move(weights)); });
}

/**
 * Cat on a class: one weight per alphabet member. Positional weights follow
 * alphabet order, named weights are keyed by member character. Members
 * without a weight share the '.' remainder if one is given, otherwise
 * whatever is left of a total mass of 1.
 */
Distribution classCategorical(const DistributionAnnotation &annotation,
                              const std::string &alphabet) {
  std::vector<std::optional<double>> weights(alphabet.size());
  std::optional<double> remainder;

  size_t next = 0;
  for (const auto &parameter : annotation.parameters) {
    if (parameter.key) {
      continue;
    }
    requireNonNegativeWeight(parameter);
    if (next >= alphabet.size()) {
      throw ValidationError("Cat has more weights than the class has members (" +
                                std::to_string(alphabet.size()) + ")",
                            parameter.location, parameter.text);
    }
    weights[next++] = parameter.value;
  }

  for (const auto &parameter : annotation.parameters) {
    if (!parameter.key) {
      continue;
    }
    requireNonNegativeWeight(parameter);
    if (parameter.isRemainder()) {
      if (remainder) {
        throw ValidationError("remainder weight '.' is assigned twice",
                              parameter.location, ".");
      }
      remainder = parameter.value;
      continue;
    }
    size_t index = alphabet.find(*parameter.key);
    if (index == std::string::npos) {
      throw ValidationError("'" + describeKey(parameter) +
                                "' is not a member of the class",
                            parameter.location, describeKey(parameter));
    }
    if (weights[index]) {
      throw ValidationError("weight for '" + describeKey(parameter) +
                                "' is assigned twice",
                            parameter.location, describeKey(parameter));
    }
    weights[index] = parameter.value;
  }

  double explicitMass = 0.0;
  size_t unweighted = 0;
  for (const auto &weight : weights) {
    if (weight) {
      explicitMass += *weight;
    } else {
      unweighted++;
    }
  }

  double shared = 0.0;
  if (unweighted > 0) {
    double pool = remainder ? *remainder : std::max(0.0, 1.0 - explicitMass);
    shared = pool / static_cast<double>(unweighted);
  }

  std::vector<double> resolved;
  resolved.reserve(weights.size());
  for (const auto &weight : weights) {
    resolved.push_back(weight.value_or(shared));
  }
  return build(annotation, "Cat",
               [&] { return Distribution::categorical(std::move(resolved)); });
}

} // namespace

std::string AnnotationResolver::canonicalName(const std::string &name) {
  static const std::unordered_map<std::string, std::string> names = {
      {"bin", "Bin"}, {"ber", "Ber"}, {"cat", "Cat"},
      {"const", "Const"}, {"geo", "Geo"}, {"zipf", "Zipf"},
  };

  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = names.find(lowered);
  return it == names.end() ? "" : it->second;
}

Distribution
AnnotationResolver::forQuantifier(const DistributionAnnotation &annotation,
                                  uint64_t baseline) {
  std::string kind = resolveName(annotation);

  if (kind == "Const") {
    SlotTable slots(annotation, kind, "v");
    uint64_t value = slots.count('v', baseline);
    return Distribution::constant(value);
  }
  if (kind == "Ber") {
    SlotTable slots(annotation, kind, "p");
    double probability = slots.real('p', 1.0);
    return build(annotation, kind,
                 [&] { return Distribution::bernoulli(probability); });
  }
  if (kind == "Bin") {
    SlotTable slots(annotation, kind, binomialKeys(annotation));
    uint64_t trials = slots.count('n', baseline);
    double probability = slots.real('p', 1.0);
    return build(annotation, kind,
                 [&] { return Distribution::binomial(trials, probability); });
  }
  if (kind == "Geo") {
    SlotTable slots(annotation, kind, "p");
    double probability = slots.real('p', 0.5);
    return build(annotation, kind, [&] {
      return Distribution::geometric(probability, baseline);
    });
  }
  if (kind == "Zipf") {
    SlotTable slots(annotation, kind, "sk");
    double exponent = slots.real('s', 1.0);
    uint64_t ranks = slots.count('k', std::max<uint64_t>(baseline, 1));
    return build(annotation, kind,
                 [&] { return Distribution::zipf(exponent, ranks); });
  }
  return quantifierCategorical(annotation);
}

Distribution AnnotationResolver::forClass(const DistributionAnnotation &annotation,
                                          const std::string &alphabet) {
  std::string kind = resolveName(annotation);
  uint64_t size = alphabet.size();

  if (kind == "Const") {
    SlotTable slots(annotation, kind, "v");
    uint64_t index = slots.count('v', 0);
    if (index >= size) {
      const AnnotationParameter *parameter = slots.find('v');
      throw ValidationError("Const index " + std::to_string(index) +
                                " is outside a class of " +
                                std::to_string(size) + " member(s)",
                            parameter ? parameter->location : annotation.location,
                            parameter ? parameter->text : "~Const");
    }
    return Distribution::constant(index);
  }
  if (kind == "Ber") {
    SlotTable slots(annotation, kind, "p");
    double probability = slots.real('p', 1.0);
    return build(annotation, kind,
                 [&] { return Distribution::bernoulli(probability); });
  }
  if (kind == "Bin") {
    SlotTable slots(annotation, kind, binomialKeys(annotation));
    uint64_t trials = slots.count('n', size == 0 ? 0 : size - 1);
    double probability = slots.real('p', 1.0);
    return build(annotation, kind,
                 [&] { return Distribution::binomial(trials, probability); });
  }
  if (kind == "Geo") {
    SlotTable slots(annotation, kind, "p");
    double probability = slots.real('p', 0.5);
    return build(annotation, kind,
                 [&] { return Distribution::geometric(probability); });
  }
  if (kind == "Zipf") {
    SlotTable slots(annotation, kind, "sk");
    double exponent = slots.real('s', 1.0);
    uint64_t ranks = slots.count('k', size);
    return build(annotation, kind,
                 [&] { return Distribution::zipf(exponent, ranks); });
  }
  return classCategorical(annotation, alphabet);
}

} // namespace regen
