#include "logger.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace RdfClean {
namespace log {

namespace {

std::string timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

} // namespace

const char *levelName(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  }
  return "INFO";
}

Logger::Logger(Sink sink) : sink_(std::move(sink)) {}

void Logger::debug(const std::string &message) const {
  if (isDebugEnabled()) {
    write(Level::Debug, message);
  }
}

void Logger::info(const std::string &message) const {
  write(Level::Info, message);
}

void Logger::warning(const std::string &message) const {
  write(Level::Warning, message);
}

void Logger::error(const std::string &message) const {
  write(Level::Error, message);
}

void Logger::write(Level level, const std::string &message) const {
  if (sink_) {
    sink_(level, message);
  }
}

Sink Logger::consoleSink(std::ostream &out) {
  return [&out](Level level, const std::string &message) {
    out << "[" << timestamp() << "] [" << levelName(level) << "] " << message
        << std::endl;
  };
}

Sink Logger::consoleSink() { return consoleSink(std::cout); }

Sink Logger::nullSink() {
  return [](Level, const std::string &) {};
}

bool Logger::isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("RDFCLEAN_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

} // namespace log
} // namespace RdfClean
