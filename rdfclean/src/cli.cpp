#include "cli.hpp"
#include "config.hpp"
#include "dataset_runner.hpp"
#include "file_output.hpp"
#include "file_pipeline.hpp"
#include "validity_oracle.hpp"

#include <filesystem>
#include <string>

namespace RdfClean {
namespace cli {

void printUsage(std::ostream &out) {
  out << "Usage: rdfclean [--config <config.json>] <dataset_path>"
      << std::endl;
}

int run(int argc, char **argv, std::ostream &out, const log::Logger &logger) {
  std::string configPath;
  std::string datasetPath;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        printUsage(out);
        return 1;
      }
      configPath = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      printUsage(out);
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      printUsage(out);
      return 1;
    } else if (datasetPath.empty()) {
      datasetPath = arg;
    } else {
      printUsage(out);
      return 1;
    }
  }

  if (datasetPath.empty()) {
    printUsage(out);
    return 1;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(datasetPath, ec)) {
    out << "Error: dataset_path must be a directory." << std::endl;
    return 1;
  }

  RdfCleanConfig config;
  if (!configPath.empty()) {
    try {
      config = loadConfigFile(configPath);
    } catch (const ConfigError &e) {
      out << "Error: " << e.what() << std::endl;
      return 1;
    }
  }

  oracle::CommandOracle oracle(config.oracle, logger);
  pipeline::FilePipeline pipeline(config.cleaning,
                                  config.oracle.postCleanCheck, oracle, logger);

  logger.info("Starting RDF cleaning for dataset: " + datasetPath);
  try {
    dataset::RunSummary summary =
        dataset::processDataset(datasetPath, pipeline, logger);
    logger.info("All files processed: " + std::to_string(summary.total()) +
                " files, " + std::to_string(summary.copied) + " copied, " +
                std::to_string(summary.cleanedWithEdits) +
                " cleaned with edits, " +
                std::to_string(summary.cleanedNoEdits) +
                " cleaned without edits, " + std::to_string(summary.failed) +
                " failed");
  } catch (const io::IoError &e) {
    logger.error(e.what());
  }
  return 0;
}

} // namespace cli
} // namespace RdfClean
