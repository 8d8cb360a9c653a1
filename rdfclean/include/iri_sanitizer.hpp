#pragma once

#include "edit_record.hpp"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace RdfClean {
namespace iri {

// Single characters that must be percent-encoded inside <...>.
class ReservedCharTable {
public:
  ReservedCharTable() = default;

  // space " < > { } | ^ `
  static ReservedCharTable defaults();

  // Encoded form must be "%XX" with upper-case hex digits; '%' itself is
  // rejected. Throws std::invalid_argument.
  void add(char c, const std::string &encoded);

  // nullptr when the character passes through unchanged
  const std::string *find(char c) const;

  bool contains(char c) const { return find(c) != nullptr; }
  size_t size() const { return size_; }

  static bool isValidEncoding(const std::string &encoded);

private:
  std::array<std::string, 256> encodings_;
  size_t size_{0};
};

struct SanitizeResult {
  std::string text;
  std::vector<IriRewrite> rewrites;
};

class IriSanitizer {
public:
  explicit IriSanitizer(ReservedCharTable table);

  // Rewrites every <...> span of the statement, left to right. One rewrite
  // entry per altered IRI, tagged with lineNumber.
  SanitizeResult sanitize(const std::string &statement, int lineNumber) const;

  // Returns true if at least one character was replaced.
  bool sanitizeIri(const std::string &iri, std::string &out) const;

  const ReservedCharTable &table() const { return table_; }

private:
  ReservedCharTable table_;
};

} // namespace iri
} // namespace RdfClean
