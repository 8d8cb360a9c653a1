#pragma once

#include "encoding_utils.hpp"
#include <istream>
#include <string>

namespace RdfClean {
namespace statement {

struct LogicalStatement {
  std::string text;   // accumulated continuation lines + terminating line
  int lineNumber{0};  // physical line holding the terminator
  bool merged{false}; // spans more than one physical line
};

// Joins continuation lines into logical statements. A physical line whose
// last non-whitespace character is not the terminator is a continuation:
// it is buffered with a single space appended. Detection is textual, so a
// '.' closing a line inside a literal also ends the statement.
//
// Single pass over the stream; next() pulls one statement at a time.
class StatementReassembler {
public:
  explicit StatementReassembler(std::istream &in, char terminator = '.');

  // False once the input is exhausted. Unterminated trailing content is
  // never returned, see hasDanglingContinuation().
  bool next(LogicalStatement &out);

  // Valid after next() returned false.
  bool hasDanglingContinuation() const { return !pending_.empty(); }
  int danglingStartLine() const { return pendingStartLine_; }
  const std::string &danglingContent() const { return pending_; }

  // Physical lines consumed so far
  int linesRead() const { return lineNumber_; }

private:
  std::istream &in_;
  char terminator_;
  encoding::Utf8Cleaner utf8_;

  std::string pending_;
  int pendingStartLine_{0};
  int lineNumber_{0};
};

} // namespace statement
} // namespace RdfClean
