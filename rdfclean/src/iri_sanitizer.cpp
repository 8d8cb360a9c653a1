#include "iri_sanitizer.hpp"

#include <stdexcept>
#include <utility>

namespace RdfClean {
namespace iri {

namespace {

size_t indexOf(char c) { return static_cast<unsigned char>(c); }

bool isUpperHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
}

} // namespace

ReservedCharTable ReservedCharTable::defaults() {
  ReservedCharTable table;
  table.add(' ', "%20");
  table.add('"', "%22");
  table.add('<', "%3C");
  table.add('>', "%3E");
  table.add('{', "%7B");
  table.add('}', "%7D");
  table.add('|', "%7C");
  table.add('^', "%5E");
  table.add('`', "%60");
  return table;
}

void ReservedCharTable::add(char c, const std::string &encoded) {
  if (c == '%') {
    throw std::invalid_argument("'%' cannot be a reserved IRI character");
  }
  if (static_cast<unsigned char>(c) >= 0x80) {
    throw std::invalid_argument("reserved IRI characters must be ASCII");
  }
  if (!isValidEncoding(encoded)) {
    throw std::invalid_argument("invalid percent-encoding '" + encoded +
                                "', expected %XX");
  }
  std::string &slot = encodings_[indexOf(c)];
  if (slot.empty()) {
    size_++;
  }
  slot = encoded;
}

const std::string *ReservedCharTable::find(char c) const {
  const std::string &slot = encodings_[indexOf(c)];
  return slot.empty() ? nullptr : &slot;
}

bool ReservedCharTable::isValidEncoding(const std::string &encoded) {
  return encoded.size() == 3 && encoded[0] == '%' && isUpperHex(encoded[1]) &&
         isUpperHex(encoded[2]);
}

IriSanitizer::IriSanitizer(ReservedCharTable table) : table_(std::move(table)) {}

bool IriSanitizer::sanitizeIri(const std::string &iri, std::string &out) const {
  bool modified = false;
  out.clear();
  out.reserve(iri.size());
  for (char c : iri) {
    if (const std::string *encoded = table_.find(c)) {
      out += *encoded;
      modified = true;
    } else {
      out += c;
    }
  }
  return modified;
}

SanitizeResult IriSanitizer::sanitize(const std::string &statement,
                                      int lineNumber) const {
  SanitizeResult result;
  result.text.reserve(statement.size());

  size_t pos = 0;
  std::string cleaned;
  while (pos < statement.size()) {
    size_t open = statement.find('<', pos);
    if (open == std::string::npos)
      break;
    // First '>' closes; no nesting
    size_t close = statement.find('>', open + 1);
    if (close == std::string::npos)
      break;

    std::string original = statement.substr(open + 1, close - open - 1);
    result.text.append(statement, pos, open - pos);

    if (sanitizeIri(original, cleaned)) {
      result.rewrites.push_back(IriRewrite{lineNumber, original, cleaned});
      result.text += '<';
      result.text += cleaned;
      result.text += '>';
    } else {
      result.text.append(statement, open, close - open + 1);
    }
    pos = close + 1;
  }

  if (pos < statement.size()) {
    result.text.append(statement, pos, std::string::npos);
  }
  return result;
}

} // namespace iri
} // namespace RdfClean
