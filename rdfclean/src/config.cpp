#include "config.hpp"

#include <cmath>
#include <fstream>
#include <limits>

namespace RdfClean {

namespace {

void applyOracle(const nlohmann::json &oracle, OracleConfig &config) {
  if (oracle.contains("command") && oracle["command"].is_string()) {
    config.command = oracle["command"];
  }
  if (oracle.contains("args") && oracle["args"].is_array()) {
    std::vector<std::string> args;
    for (const auto &arg : oracle["args"]) {
      if (!arg.is_string()) {
        throw ConfigError("oracle.args must contain only strings");
      }
      args.push_back(arg.get<std::string>());
    }
    config.args = args;
  }
  if (oracle.contains("timeoutSeconds") &&
      oracle["timeoutSeconds"].is_number()) {
    double seconds = oracle["timeoutSeconds"];
    if (!std::isfinite(seconds) || seconds <= 0) {
      throw ConfigError("oracle.timeoutSeconds must be positive");
    }
    using Rep = std::chrono::milliseconds::rep;
    double ms = seconds * 1000;
    // The upper bound is exclusive: max() itself rounds up as a double.
    if (ms < 1 ||
        ms >= static_cast<double>(std::numeric_limits<Rep>::max())) {
      throw ConfigError("oracle.timeoutSeconds out of range");
    }
    config.timeout = std::chrono::milliseconds(static_cast<Rep>(ms));
  }
  if (oracle.contains("postCleanCheck") &&
      oracle["postCleanCheck"].is_boolean()) {
    config.postCleanCheck = oracle["postCleanCheck"];
  }
}

void applyCleaning(const nlohmann::json &cleaning, CleaningConfig &config) {
  if (cleaning.contains("outputDir") && cleaning["outputDir"].is_string()) {
    std::string dir = cleaning["outputDir"];
    if (dir.empty() || dir.find('/') != std::string::npos) {
      throw ConfigError("cleaning.outputDir must be a plain directory name");
    }
    config.outputDirName = dir;
  }
  if (cleaning.contains("extensions") && cleaning["extensions"].is_array()) {
    std::vector<std::string> extensions;
    for (const auto &ext : cleaning["extensions"]) {
      if (!ext.is_string() || ext.get<std::string>().empty()) {
        throw ConfigError("cleaning.extensions must be non-empty strings");
      }
      extensions.push_back(ext.get<std::string>());
    }
    config.extensions = extensions;
  }
  if (cleaning.contains("changelogSuffix") &&
      cleaning["changelogSuffix"].is_string()) {
    config.changelogSuffix = cleaning["changelogSuffix"];
  }

  if (cleaning.contains("extraReservedChars") &&
      cleaning["extraReservedChars"].is_object()) {
    for (const auto &entry : cleaning["extraReservedChars"].items()) {
      const std::string &key = entry.key();
      if (key.size() != 1) {
        throw ConfigError("extraReservedChars key '" + key +
                          "' must be a single character");
      }
      if (!entry.value().is_string()) {
        throw ConfigError("extraReservedChars value for '" + key +
                          "' must be a string");
      }
      try {
        config.reservedChars.add(key[0], entry.value().get<std::string>());
      } catch (const std::invalid_argument &e) {
        throw ConfigError("extraReservedChars: " + std::string(e.what()));
      }
    }
  }
}

} // namespace

void applyConfig(const nlohmann::json &opts, RdfCleanConfig &config) {
  if (!opts.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }
  if (opts.contains("oracle") && opts["oracle"].is_object()) {
    applyOracle(opts["oracle"], config.oracle);
  }
  if (opts.contains("cleaning") && opts["cleaning"].is_object()) {
    applyCleaning(opts["cleaning"], config.cleaning);
  }
}

RdfCleanConfig loadConfigFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }

  nlohmann::json opts;
  try {
    opts = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigError("invalid configuration file " + path + ": " + e.what());
  }

  RdfCleanConfig config;
  applyConfig(opts, config);
  return config;
}

} // namespace RdfClean
