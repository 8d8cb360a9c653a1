#include "encoding_utils.hpp"
#include <cerrno>
#include <iconv.h>

namespace RdfClean {
namespace encoding {

namespace {

iconv_t toHandle(void *cd) { return static_cast<iconv_t>(cd); }

const iconv_t kInvalidHandle = (iconv_t)-1;

} // namespace

Utf8Cleaner::Utf8Cleaner()
    : cd_(static_cast<void *>(iconv_open("UTF-8//IGNORE", "UTF-8"))) {}

Utf8Cleaner::~Utf8Cleaner() {
  if (isAvailable()) {
    iconv_close(toHandle(cd_));
  }
}

bool Utf8Cleaner::isAvailable() const { return toHandle(cd_) != kInvalidHandle; }

std::string Utf8Cleaner::clean(const std::string &input) const {
  if (input.empty() || isAscii(input) || !isAvailable())
    return input;

  iconv_t cd = toHandle(cd_);
  // Reset shift state left over from a previous call
  iconv(cd, nullptr, nullptr, nullptr, nullptr);

  // UTF-8 -> UTF-8 never grows
  std::string result(input.size(), '\0');

  char *inBuf = const_cast<char *>(input.data());
  size_t inBytesLeft = input.size();
  char *outBuf = &result[0];
  size_t outBytesLeft = result.size();

  while (inBytesLeft > 0) {
    char *before = inBuf;
    if (iconv(cd, &inBuf, &inBytesLeft, &outBuf, &outBytesLeft) !=
        (size_t)-1) {
      break;
    }
    if (errno == EINVAL) {
      // Truncated multi-byte sequence at the end of the input
      break;
    }
    if (errno == EILSEQ) {
      if (inBuf == before && inBytesLeft > 0) {
        ++inBuf;
        --inBytesLeft;
      }
      continue;
    }
    break;
  }

  result.resize(result.size() - outBytesLeft);
  return result;
}

bool isAscii(const std::string &input) {
  for (char c : input) {
    if (static_cast<unsigned char>(c) >= 0x80)
      return false;
  }
  return true;
}

std::string dropInvalidUtf8(const std::string &input) {
  Utf8Cleaner cleaner;
  return cleaner.clean(input);
}

} // namespace encoding
} // namespace RdfClean
