#pragma once

#include "config.hpp"
#include "file_pipeline.hpp"
#include "logger.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace RdfClean {
namespace dataset {

namespace fs = std::filesystem;

struct RunSummary {
  std::size_t copied{0};
  std::size_t cleanedWithEdits{0};
  std::size_t cleanedNoEdits{0};
  std::size_t failed{0};

  std::size_t total() const {
    return copied + cleanedWithEdits + cleanedNoEdits + failed;
  }
};

// Case-insensitive suffix match against the allow-list.
bool hasSupportedExtension(const fs::path &file,
                           const std::vector<std::string> &extensions);

// Regular files below root with a supported extension, sorted. Directories
// named like the output directory are not entered. Throws io::IoError if
// root cannot be listed.
std::vector<fs::path> discoverInputs(const fs::path &root,
                                     const CleaningConfig &config,
                                     const log::Logger &logger);

// Runs the pipeline over every discovered file. A failing file is logged
// and counted; it never stops the run.
RunSummary processDataset(const fs::path &root,
                          pipeline::FilePipeline &pipeline,
                          const log::Logger &logger);

} // namespace dataset
} // namespace RdfClean
