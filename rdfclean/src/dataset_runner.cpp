#include "dataset_runner.hpp"
#include "file_output.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace RdfClean {
namespace dataset {

namespace {

std::string toLower(std::string input) {
  std::transform(
      input.begin(), input.end(), input.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return input;
}

bool endsWith(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool hasSupportedExtension(const fs::path &file,
                           const std::vector<std::string> &extensions) {
  std::string name = toLower(file.filename().string());
  for (const auto &ext : extensions) {
    if (endsWith(name, toLower(ext)))
      return true;
  }
  return false;
}

std::vector<fs::path> discoverInputs(const fs::path &root,
                                     const CleaningConfig &config,
                                     const log::Logger &logger) {
  std::vector<fs::path> inputs;

  std::error_code ec;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw io::IoError("cannot list directory (" + ec.message() + ")", root);
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      logger.warning("Skipping unreadable entry: " + ec.message());
      ec.clear();
      continue;
    }

    const fs::directory_entry &entry = *it;
    std::error_code typeEc;
    if (entry.is_directory(typeEc)) {
      if (entry.path().filename() == config.outputDirName) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (entry.is_regular_file(typeEc) &&
        hasSupportedExtension(entry.path(), config.extensions)) {
      inputs.push_back(entry.path());
    }
  }
  // increment() leaves an error for the last step when it fails
  if (ec) {
    logger.warning("Directory walk stopped early: " + ec.message());
  }

  std::sort(inputs.begin(), inputs.end());
  logger.debug("Discovered " + std::to_string(inputs.size()) +
               " candidate files under " + root.string());
  return inputs;
}

RunSummary processDataset(const fs::path &root,
                          pipeline::FilePipeline &pipeline,
                          const log::Logger &logger) {
  RunSummary summary;

  for (const auto &input : discoverInputs(root, pipeline.config(), logger)) {
    try {
      pipeline::ProcessingOutcome outcome = pipeline.processFile(input, root);
      switch (outcome.kind) {
      case pipeline::OutcomeKind::CopiedUnchanged:
        summary.copied++;
        break;
      case pipeline::OutcomeKind::CleanedWithEdits:
        summary.cleanedWithEdits++;
        break;
      case pipeline::OutcomeKind::CleanedNoEdits:
        summary.cleanedNoEdits++;
        break;
      }
      logger.info(input.string() + ": " + pipeline::toString(outcome.kind));
    } catch (const io::IoError &e) {
      logger.error("Failed to process " + input.string() + ": " + e.what());
      summary.failed++;
    } catch (const std::exception &e) {
      logger.error("Unexpected error while processing " + input.string() +
                   ": " + e.what());
      summary.failed++;
    }
  }

  return summary;
}

} // namespace dataset
} // namespace RdfClean
