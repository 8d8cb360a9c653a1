#pragma once

#include "config.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

namespace RdfClean {
namespace oracle {

enum class OracleStatus {
  Valid,
  Invalid,
  Unavailable, // checker missing or timed out; callers treat it as Invalid
};

const char *toString(OracleStatus status);

class ValidityOracle {
public:
  virtual ~ValidityOracle() = default;

  virtual OracleStatus check(const std::string &path) = 0;
};

// Runs `<command> <args...> <path>` once per check, with stdout discarded and
// stderr captured for the log. Exit code 0 means valid.
class CommandOracle : public ValidityOracle {
public:
  CommandOracle(OracleConfig config, const log::Logger &logger);

  OracleStatus check(const std::string &path) override;

  std::vector<std::string> buildArgv(const std::string &path) const;

  // stderr of the last check, truncated
  const std::string &lastDiagnostics() const { return diagnostics_; }

private:
  OracleConfig config_;
  const log::Logger &logger_;
  std::string diagnostics_;
};

} // namespace oracle
} // namespace RdfClean
