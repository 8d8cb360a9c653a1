#include "statement_reassembler.hpp"
#include "text_processor.hpp"

namespace RdfClean {
namespace statement {

StatementReassembler::StatementReassembler(std::istream &in, char terminator)
    : in_(in), terminator_(terminator) {}

bool StatementReassembler::next(LogicalStatement &out) {
  std::string raw;
  while (std::getline(in_, raw)) {
    lineNumber_++;
    text::TextProcessor::stripLineEnding(raw);
    std::string line = utf8_.clean(raw);

    if (!text::TextProcessor::endsWithTerminator(line, terminator_)) {
      if (pending_.empty()) {
        pendingStartLine_ = lineNumber_;
      }
      pending_ += line;
      pending_ += ' ';
      continue;
    }

    out.merged = !pending_.empty();
    out.text = pending_ + line;
    out.lineNumber = lineNumber_;
    pending_.clear();
    pendingStartLine_ = 0;
    return true;
  }
  return false;
}

} // namespace statement
} // namespace RdfClean
