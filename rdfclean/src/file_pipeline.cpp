#include "file_pipeline.hpp"
#include "file_output.hpp"
#include "statement_reassembler.hpp"
#include "text_processor.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace RdfClean {
namespace pipeline {

const char *toString(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::CopiedUnchanged:
    return "copied unchanged";
  case OutcomeKind::CleanedWithEdits:
    return "cleaned with edits";
  case OutcomeKind::CleanedNoEdits:
    return "cleaned without edits";
  }
  return "copied unchanged";
}

FilePipeline::FilePipeline(CleaningConfig config, bool postCleanCheck,
                           oracle::ValidityOracle &oracle,
                           const log::Logger &logger)
    : config_(std::move(config)), postCleanCheck_(postCleanCheck),
      oracle_(oracle), logger_(logger), sanitizer_(config_.reservedChars) {}

fs::path FilePipeline::outputPathFor(const fs::path &input,
                                     const fs::path &datasetRoot) const {
  fs::path relative = input.lexically_relative(datasetRoot);
  if (relative.empty()) {
    relative = input.filename();
  }
  return datasetRoot / config_.outputDirName / relative;
}

fs::path FilePipeline::changelogPathFor(const fs::path &output) const {
  return fs::path(output.string() + config_.changelogSuffix);
}

CleanResult FilePipeline::cleanStream(std::istream &in, std::ostream &out,
                                      std::size_t totalLines) const {
  CleanResult result;
  statement::StatementReassembler reassembler(in, config_.terminator);
  statement::LogicalStatement stmt;
  std::size_t nextDecile = 1;

  while (reassembler.next(stmt)) {
    if (stmt.merged) {
      result.record.mergedStatements.push_back(
          MergedStatement{stmt.lineNumber, text::TextProcessor::trim(stmt.text)});
    }

    iri::SanitizeResult fixed = sanitizer_.sanitize(stmt.text, stmt.lineNumber);
    result.record.append(fixed.rewrites);
    out << fixed.text << '\n';
    result.statementsWritten++;

    if (totalLines > 0 && nextDecile <= 10) {
      std::size_t processed = static_cast<std::size_t>(reassembler.linesRead());
      if (processed * 10 >= nextDecile * totalLines) {
        logger_.info(std::to_string(processed) + "/" +
                     std::to_string(totalLines) + " lines processed (" +
                     std::to_string(nextDecile * 10) + "%)");
        while (nextDecile <= 10 && processed * 10 >= nextDecile * totalLines) {
          nextDecile++;
        }
      }
    }
  }

  result.linesRead = reassembler.linesRead();
  if (reassembler.hasDanglingContinuation()) {
    result.danglingTail = true;
    result.danglingStartLine = reassembler.danglingStartLine();
    logger_.error("Unbalanced multiline structure at end of file: content "
                  "from line " +
                  std::to_string(result.danglingStartLine) + " dropped");
  }
  return result;
}

ProcessingOutcome FilePipeline::processFile(const fs::path &input,
                                            const fs::path &datasetRoot) {
  logger_.info("Processing file: " + input.string());

  ProcessingOutcome outcome;
  const fs::path relative = input.lexically_relative(datasetRoot);
  outcome.outputPath = outputPathFor(input, datasetRoot);
  outcome.changelogPath = changelogPathFor(outcome.outputPath);

  io::ensureParentDirectory(outcome.outputPath);

  outcome.preCheck = oracle_.check(input.string());
  if (outcome.preCheck == oracle::OracleStatus::Valid) {
    logger_.info("File is valid -> copying unchanged: " + relative.string());
    io::copyPreservingMetadata(input, outcome.outputPath);
    io::writeFileAtomically(outcome.changelogPath, EditRecord{}.dump());
    outcome.kind = OutcomeKind::CopiedUnchanged;
    return outcome;
  }

  if (outcome.preCheck == oracle::OracleStatus::Unavailable) {
    logger_.warning("Validity unknown -> starting cleaning: " +
                    relative.string());
  } else {
    logger_.info("Validation failed -> starting cleaning: " +
                 relative.string());
  }

  std::size_t totalLines = 0;
  {
    std::ifstream counter(input, std::ios::binary);
    if (!counter) {
      throw io::IoError("cannot open input", input);
    }
    totalLines = text::TextProcessor::countLines(counter);
  }

  std::ifstream in(input, std::ios::binary);
  if (!in) {
    throw io::IoError("cannot open input", input);
  }

  const auto start = std::chrono::steady_clock::now();
  CleanResult cleaned;
  {
    io::AtomicFile out(outcome.outputPath);
    cleaned = cleanStream(in, out.stream(), totalLines);
    if (in.bad()) {
      throw io::IoError("read failed", input);
    }
    out.commit();
  }
  io::writeFileAtomically(outcome.changelogPath, cleaned.record.dump());

  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;
  std::ostringstream seconds;
  seconds << std::fixed << std::setprecision(2) << elapsed.count();
  logger_.info("Finished cleaning: " + outcome.outputPath.string() + " in " +
               seconds.str() + "s");
  logger_.info("Changelog written: " + outcome.changelogPath.string());

  outcome.record = std::move(cleaned.record);
  outcome.danglingTail = cleaned.danglingTail;
  outcome.kind = outcome.record.empty() ? OutcomeKind::CleanedNoEdits
                                        : OutcomeKind::CleanedWithEdits;

  if (postCleanCheck_) {
    outcome.postCheck = oracle_.check(outcome.outputPath.string());
    logger_.debug("Post-clean check: " +
                  std::string(oracle::toString(*outcome.postCheck)));
  }
  return outcome;
}

} // namespace pipeline
} // namespace RdfClean
