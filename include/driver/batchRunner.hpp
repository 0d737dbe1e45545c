#pragma once

#include "config/options.hpp"

#include <ostream>
#include <string>

namespace regen {

// Process exit codes of the regen executable
enum ExitCode { EXIT_OK = 0, EXIT_USAGE = 1, EXIT_PATTERN = 2 };

/**
 * BatchRunner - one invocation of the command-line tool
 *
 * Parses the configured pattern once, then either prints it (as JSON or in
 * canonical form) or writes count generated strings, one per line.
 */
class BatchRunner {
public:
  explicit BatchRunner(Options options);

  // Run to completion; returns the process exit code. Errors and debug
  // logs go to err.
  int run(std::ostream &out, std::ostream &err);

private:
  Options options_;
  bool debugMode{};
  std::ostream *logStream = nullptr;

  void log(const std::string &message);
};

} // namespace regen
