#pragma once

#include "generator/generator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace regen {

using Json = nlohmann::json;

// Unreadable or malformed configuration, or an invalid command-line flag
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Options - everything one run of the driver needs
 *
 * Defaults live here; a JSON configuration file overrides them and
 * command-line flags override the file.
 */
struct Options {
  std::string pattern;
  size_t count = 1;
  std::optional<uint64_t> seed; // time based when unset
  size_t unboundedCap = 32;
  bool debug = false;
  bool dumpAst = false;
  bool canonical = false;
  bool help = false;

  std::string configPath;
  // Keys of the configuration file that were not recognized
  std::vector<std::string> ignoredKeys;

  GeneratorOptions generatorOptions() const {
    GeneratorOptions options;
    options.unboundedCap = unboundedCap;
    return options;
  }
};

/**
 * Read the keys count, seed, unboundedCap and debug from a configuration
 * object, keeping the current value of every absent key. Unknown keys are
 * recorded in ignoredKeys. Throws ConfigError on a wrong value type.
 */
void from_json(const Json &j, Options &options);

// Apply the JSON configuration file at path to options
void loadConfigFile(const std::string &path, Options &options);

/**
 * Build Options from command-line arguments (without the program name).
 * A --config file is applied first, so the other flags override it.
 * Throws ConfigError for unknown options, bad numbers or a missing pattern.
 */
Options parseCommandLine(const std::vector<std::string> &args);

} // namespace regen
