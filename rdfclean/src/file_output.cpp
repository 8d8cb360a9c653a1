#include "file_output.hpp"

#include <system_error>

namespace RdfClean {
namespace io {

AtomicFile::AtomicFile(const fs::path &target)
    : target_(target), temp_(target.string() + ".tmp") {
  // Leftover from an interrupted run
  std::error_code ec;
  fs::remove(temp_, ec);

  out_.open(temp_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw IoError("cannot open temporary file", temp_);
  }
}

AtomicFile::~AtomicFile() {
  if (!committed_) {
    out_.close();
    std::error_code ec;
    fs::remove(temp_, ec);
  }
}

void AtomicFile::commit() {
  out_.flush();
  if (!out_) {
    throw IoError("write failed", temp_);
  }
  out_.close();
  if (out_.fail()) {
    throw IoError("close failed", temp_);
  }

  std::error_code ec;
  fs::rename(temp_, target_, ec);
  if (ec) {
    throw IoError("rename failed (" + ec.message() + ")", target_);
  }
  committed_ = true;
}

void ensureParentDirectory(const fs::path &file) {
  fs::path parent = file.parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw IoError("cannot create directory (" + ec.message() + ")", parent);
  }
}

void writeFileAtomically(const fs::path &target, const std::string &content) {
  AtomicFile file(target);
  file.stream().write(content.data(),
                      static_cast<std::streamsize>(content.size()));
  file.commit();
}

void copyPreservingMetadata(const fs::path &from, const fs::path &to) {
  fs::path temp = to.string() + ".tmp";
  std::error_code ec;
  fs::remove(temp, ec);

  fs::copy_file(from, temp, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    fs::remove(temp, ec);
    throw IoError("copy failed", from);
  }

  // Best effort, like a metadata-preserving copy
  auto st = fs::status(from, ec);
  if (!ec) {
    fs::permissions(temp, st.permissions(), ec);
  }
  auto mtime = fs::last_write_time(from, ec);
  if (!ec) {
    fs::last_write_time(temp, mtime, ec);
  }

  fs::rename(temp, to, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw IoError("rename failed (" + ec.message() + ")", to);
  }
}

} // namespace io
} // namespace RdfClean
