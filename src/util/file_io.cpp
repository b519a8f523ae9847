#include "gatewatch/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gatewatch {

namespace fs = std::filesystem;

namespace {

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (fs::exists(requested, ec) && !ec) return requested;

#ifdef GATEWATCH_SOURCE_DIR
  const fs::path candidate = fs::path(GATEWATCH_SOURCE_DIR) / requested;
  ec.clear();
  if (fs::exists(candidate, ec) && !ec) return candidate;
#endif

  return requested;
}

// Removes the temp file unless the write was committed.
struct TempGuard {
  fs::path path;
  bool committed{false};
  ~TempGuard() {
    if (committed) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
};

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory: " + target.parent_path().string() + " (" +
                               ec.message() + ")");
    }
  }

  TempGuard tmp{fs::path(path + ".tmp")};
  {
    std::ofstream out(tmp.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path.string());
  }

  fs::rename(tmp.path, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp.path, target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.committed = true;
}

} // namespace gatewatch
