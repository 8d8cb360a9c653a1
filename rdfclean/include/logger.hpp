#pragma once

#include <functional>
#include <ostream>
#include <string>

namespace RdfClean {
namespace log {

enum class Level { Debug, Info, Warning, Error };

const char *levelName(Level level);

// Receives every message that passes the level filter.
using Sink = std::function<void(Level, const std::string &)>;

class Logger {
public:
  explicit Logger(Sink sink = consoleSink());

  void debug(const std::string &message) const;
  void info(const std::string &message) const;
  void warning(const std::string &message) const;
  void error(const std::string &message) const;

  void write(Level level, const std::string &message) const;

  // "[2024-01-31 12:00:00] [INFO] message" lines
  static Sink consoleSink(std::ostream &out);
  static Sink consoleSink();
  static Sink nullSink();

  // RDFCLEAN_DEBUG set in the environment
  static bool isDebugEnabled();

private:
  Sink sink_;
};

} // namespace log
} // namespace RdfClean
