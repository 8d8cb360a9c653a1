#include "text_processor.hpp"

namespace RdfClean {
namespace text {

void TextProcessor::stripLineEnding(std::string &line) {
  if (!line.empty() && line.back() == '\n')
    line.pop_back();
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
}

std::string TextProcessor::trim(const std::string &text) {
  size_t textStart = 0;
  while (textStart < text.size() && isWhitespace(text[textStart])) {
    textStart++;
  }

  size_t textEnd = text.size();
  while (textEnd > textStart && isWhitespace(text[textEnd - 1])) {
    textEnd--;
  }

  return text.substr(textStart, textEnd - textStart);
}

bool TextProcessor::endsWithTerminator(const std::string &line,
                                       char terminator) {
  size_t end = line.size();
  while (end > 0 && isWhitespace(line[end - 1])) {
    end--;
  }
  return end > 0 && line[end - 1] == terminator;
}

std::size_t TextProcessor::countLines(std::istream &in) {
  std::size_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    count++;
  }
  return count;
}

bool TextProcessor::isWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

} // namespace text
} // namespace RdfClean
