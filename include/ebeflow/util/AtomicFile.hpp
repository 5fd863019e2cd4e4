#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ebeflow::util {
namespace fs = std::filesystem;

// Sibling path the data is written to before it replaces `out_path`.
inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Replace `out_path` by `tmp_path`. Readers see either the old or the complete new file.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  // Some filesystems refuse to rename over an existing file.
  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

inline void ensure_parent_dir(const fs::path& out_path) {
  const fs::path dir = out_path.parent_path();
  if (dir.empty()) return;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("failed to create output directory '" + dir.string() + "' (" + ec.message() + ")");
  }
}

// Write a whole text file through `fn(std::ostream&)`, then move it into place.
template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  ensure_parent_dir(out_path);
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp);
    if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
    fn(ofs);
    ofs.flush();
    if (!ofs) throw std::runtime_error("failed while writing temp file: " + tmp.string());
  }
  atomic_rename_over(tmp, out_path);
}

} // namespace ebeflow::util
