#pragma once

#include "logger.hpp"
#include <ostream>

namespace RdfClean {
namespace cli {

// Parses `rdfclean [--config <file.json>] <dataset_path>` and runs the whole
// dataset. Usage and argument errors go to out; progress goes to logger.
// Returns the process exit code: 1 for bad arguments, a missing dataset
// directory or a bad config file, 0 otherwise, even when files failed.
int run(int argc, char **argv, std::ostream &out, const log::Logger &logger);

void printUsage(std::ostream &out);

} // namespace cli
} // namespace RdfClean
