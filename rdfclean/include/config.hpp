#pragma once

#include "iri_sanitizer.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace RdfClean {

struct OracleConfig {
  std::string command = "rapper";
  // Format auto-detection, syntax check only; the file path is appended
  std::vector<std::string> args = {"-i", "guess", "-c"};
  std::chrono::milliseconds timeout{std::chrono::seconds(300)};
  bool postCleanCheck = true; // re-check cleaned output, logged only
};

struct CleaningConfig {
  std::string outputDirName = "rdf_cleaned";
  std::vector<std::string> extensions = {".nt", ".ttl", ".n3"};
  std::string changelogSuffix = ".changelog.json";
  iri::ReservedCharTable reservedChars = iri::ReservedCharTable::defaults();
  char terminator = '.';
};

struct RdfCleanConfig {
  OracleConfig oracle;
  CleaningConfig cleaning;
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

// Keys with the wrong JSON type are ignored; malformed reserved character
// entries throw ConfigError.
void applyConfig(const nlohmann::json &opts, RdfCleanConfig &config);

// Defaults overlaid with the JSON file at path. Throws ConfigError.
RdfCleanConfig loadConfigFile(const std::string &path);

} // namespace RdfClean
