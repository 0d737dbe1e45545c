#include "config/options.hpp"

#include <fstream>

namespace regen {

namespace {

template <typename T>
void readUnsigned(const Json &j, const std::string &key, T &target) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number_unsigned()) {
    throw ConfigError("config key '" + key +
                      "' must be a non-negative integer, got " + it->dump());
  }
  it->get_to(target);
}

uint64_t parseUnsigned(const std::string &flag, const std::string &text) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError("invalid value for " + flag + ": '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range &) {
    throw ConfigError("value for " + flag + " is too large: " + text);
  }
}

} // namespace

void from_json(const Json &j, Options &options) {
  if (!j.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  readUnsigned(j, "count", options.count);
  readUnsigned(j, "unboundedCap", options.unboundedCap);
  if (j.contains("seed")) {
    uint64_t seed = 0;
    readUnsigned(j, "seed", seed);
    options.seed = seed;
  }
  if (j.contains("debug")) {
    if (!j.at("debug").is_boolean()) {
      throw ConfigError("config key 'debug' must be true or false, got " +
                        j.at("debug").dump());
    }
    j.at("debug").get_to(options.debug);
  }

  for (const auto &item : j.items()) {
    const std::string &key = item.key();
    if (key != "count" && key != "seed" && key != "unboundedCap" &&
        key != "debug") {
      options.ignoredKeys.push_back(key);
    }
  }
}

void loadConfigFile(const std::string &path, Options &options) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("cannot open config file: " + path);
  }

  Json j;
  try {
    j = Json::parse(file);
  } catch (const Json::parse_error &error) {
    throw ConfigError("malformed config file " + path + ": " + error.what());
  }
  j.get_to(options);
}

Options parseCommandLine(const std::vector<std::string> &args) {
  Options options;

  auto valueOf = [&args](size_t &index) -> const std::string & {
    if (index + 1 >= args.size()) {
      throw ConfigError("missing value for " + args[index]);
    }
    return args[++index];
  };

  // The config file goes first so that every flag overrides it
  for (size_t i = 0; i < args.size() && args[i] != "--"; i++) {
    if (args[i] == "--config") {
      options.configPath = valueOf(i);
    }
  }
  if (!options.configPath.empty()) {
    loadConfigFile(options.configPath, options);
  }

  bool patternSet = false;
  bool optionsDone = false;
  for (size_t i = 0; i < args.size(); i++) {
    const std::string &arg = args[i];

    if (optionsDone || arg.size() < 2 || arg[0] != '-') {
      if (patternSet) {
        throw ConfigError("more than one pattern given: '" + arg + "'");
      }
      options.pattern = arg;
      patternSet = true;
    } else if (arg == "--") {
      optionsDone = true;
    } else if (arg == "-n" || arg == "--count") {
      options.count = parseUnsigned(arg, valueOf(i));
    } else if (arg == "-s" || arg == "--seed") {
      options.seed = parseUnsigned(arg, valueOf(i));
    } else if (arg == "-c" || arg == "--cap") {
      options.unboundedCap = parseUnsigned(arg, valueOf(i));
    } else if (arg == "--config") {
      i++; // applied above
    } else if (arg == "--dump-ast") {
      options.dumpAst = true;
    } else if (arg == "--canonical") {
      options.canonical = true;
    } else if (arg == "--debug") {
      options.debug = true;
    } else if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else {
      throw ConfigError("unknown option: " + arg);
    }
  }

  if (!patternSet && !options.help) {
    throw ConfigError("no pattern given");
  }
  return options;
}

} // namespace regen
