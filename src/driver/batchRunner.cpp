#include "driver/batchRunner.hpp"
#include "generator/generator.hpp"
#include "parser/parser.hpp"
#include "parser/patternError.hpp"
#include "pattern/patternJson.hpp"

#include <optional>

namespace regen {

BatchRunner::BatchRunner(Options options)
    : options_(std::move(options)), debugMode(options_.debug) {}

int BatchRunner::run(std::ostream &out, std::ostream &err) {
  logStream = &err;
  for (const auto &key : options_.ignoredKeys) {
    log("Ignoring unknown config key: " + key);
  }

  log("Parsing pattern: " + options_.pattern);
  std::optional<Pattern> pattern;
  try {
    pattern.emplace(parse(options_.pattern));
  } catch (const PatternError &error) {
    err << error.render(options_.pattern) << "\n";
    return EXIT_PATTERN;
  }
  log("Canonical form: " + pattern->toString());

  if (options_.dumpAst) {
    out << Json(*pattern).dump(2, ' ', false, Json::error_handler_t::replace)
        << "\n";
    return EXIT_OK;
  }
  if (options_.canonical) {
    out << pattern->toString() << "\n";
    return EXIT_OK;
  }

  uint64_t seed = options_.seed ? *options_.seed : RandomSource::timeSeed();
  log("Seed: " + std::to_string(seed) + ", count: " +
      std::to_string(options_.count) + ", unbounded cap: " +
      std::to_string(options_.unboundedCap));

  RandomSource source(seed);
  Generator generator(options_.generatorOptions());
  for (size_t i = 0; i < options_.count; i++) {
    out << generator.generate(*pattern, source) << "\n";
  }
  out.flush();

  log("Generated " + std::to_string(options_.count) + " string(s)");
  return EXIT_OK;
}

void BatchRunner::log(const std::string &message) {
  if (debugMode && logStream) {
    *logStream << "[regen] " << message << std::endl;
  }
}

} // namespace regen
