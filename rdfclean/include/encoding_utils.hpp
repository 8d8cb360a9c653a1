#pragma once

#include <string>

namespace RdfClean {
namespace encoding {

// Drops byte sequences that are not valid UTF-8 through an iconv
// "UTF-8//IGNORE" conversion. One iconv descriptor is kept open for the
// lifetime of the cleaner.
class Utf8Cleaner {
public:
  Utf8Cleaner();
  ~Utf8Cleaner();

  Utf8Cleaner(const Utf8Cleaner &) = delete;
  Utf8Cleaner &operator=(const Utf8Cleaner &) = delete;

  // Returns the input unchanged if iconv could not open the conversion.
  std::string clean(const std::string &input) const;

  bool isAvailable() const;

private:
  void *cd_;
};

bool isAscii(const std::string &input);

std::string dropInvalidUtf8(const std::string &input);

} // namespace encoding
} // namespace RdfClean
