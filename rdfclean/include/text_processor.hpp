#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace RdfClean {
namespace text {

class TextProcessor {
public:
  // Removes a trailing "\n" or "\r\n"; everything else is kept verbatim.
  static void stripLineEnding(std::string &line);

  static std::string trim(const std::string &text);

  // Last non-whitespace character equals the terminator.
  static bool endsWithTerminator(const std::string &line, char terminator);

  // Number of physical lines, a final line without newline included.
  static std::size_t countLines(std::istream &in);

  static bool isWhitespace(char c);
};

} // namespace text
} // namespace RdfClean
