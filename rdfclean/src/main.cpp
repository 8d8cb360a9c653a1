#include "cli.hpp"
#include "logger.hpp"

#include <iostream>

int main(int argc, char **argv) {
  RdfClean::log::Logger logger;
  return RdfClean::cli::run(argc, argv, std::cout, logger);
}
