#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace RdfClean {
namespace io {

namespace fs = std::filesystem;

// Read/write/mkdir/rename failure for a single file.
class IoError : public std::runtime_error {
public:
  IoError(const std::string &what, const fs::path &path)
      : std::runtime_error(what + ": " + path.string()), path_(path) {}

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

// Writes to "<target>.tmp" and renames over the target on commit(). A file
// that is never committed leaves nothing at the target path.
class AtomicFile {
public:
  explicit AtomicFile(const fs::path &target);
  ~AtomicFile();

  AtomicFile(const AtomicFile &) = delete;
  AtomicFile &operator=(const AtomicFile &) = delete;

  std::ostream &stream() { return out_; }

  void commit();

  const fs::path &target() const { return target_; }
  const fs::path &tempPath() const { return temp_; }

private:
  fs::path target_;
  fs::path temp_;
  std::ofstream out_;
  bool committed_{false};
};

void ensureParentDirectory(const fs::path &file);

void writeFileAtomically(const fs::path &target, const std::string &content);

// Byte-for-byte copy that keeps permissions and modification time.
void copyPreservingMetadata(const fs::path &from, const fs::path &to);

} // namespace io
} // namespace RdfClean
