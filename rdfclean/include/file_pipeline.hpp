#pragma once

#include "config.hpp"
#include "edit_record.hpp"
#include "iri_sanitizer.hpp"
#include "logger.hpp"
#include "validity_oracle.hpp"
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>

namespace RdfClean {
namespace pipeline {

namespace fs = std::filesystem;

enum class OutcomeKind { CopiedUnchanged, CleanedWithEdits, CleanedNoEdits };

const char *toString(OutcomeKind kind);

struct CleanResult {
  EditRecord record;
  int linesRead{0};
  int statementsWritten{0};
  bool danglingTail{false}; // unterminated content at end of input, dropped
  int danglingStartLine{0};
};

struct ProcessingOutcome {
  OutcomeKind kind{OutcomeKind::CopiedUnchanged};
  EditRecord record;
  oracle::OracleStatus preCheck{oracle::OracleStatus::Unavailable};
  std::optional<oracle::OracleStatus> postCheck; // observability only
  bool danglingTail{false};
  fs::path outputPath;
  fs::path changelogPath;
};

// Validate -> copy, or validate -> reassemble + sanitize -> write. Holds no
// per-file state between calls.
class FilePipeline {
public:
  FilePipeline(CleaningConfig config, bool postCleanCheck,
               oracle::ValidityOracle &oracle, const log::Logger &logger);

  // Throws io::IoError; the output path never holds a partial file.
  ProcessingOutcome processFile(const fs::path &input,
                                const fs::path &datasetRoot);

  // Writes one line per logical statement. totalLines > 0 enables progress
  // logging every 10%.
  CleanResult cleanStream(std::istream &in, std::ostream &out,
                          std::size_t totalLines = 0) const;

  fs::path outputPathFor(const fs::path &input,
                         const fs::path &datasetRoot) const;
  fs::path changelogPathFor(const fs::path &output) const;

  const CleaningConfig &config() const { return config_; }

private:
  CleaningConfig config_;
  bool postCleanCheck_;
  oracle::ValidityOracle &oracle_;
  const log::Logger &logger_;
  iri::IriSanitizer sanitizer_;
};

} // namespace pipeline
} // namespace RdfClean
