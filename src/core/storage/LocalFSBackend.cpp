#include "LocalFSBackend.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

#include "core/Errors.hpp"

FileStat LocalFSBackend::stat(const std::string& path) const {
  struct statx stx{};
  if (::statx(AT_FDCWD, path.c_str(), 0,
              STATX_TYPE | STATX_SIZE | STATX_MTIME | STATX_BTIME, &stx) != 0) {
    throw IoError("stat " + path + ": " + std::strerror(errno));
  }
  if (!S_ISREG(stx.stx_mode)) throw IoError("not a regular file: " + path);

  FileStat st;
  st.name        = std::filesystem::path(path).filename().string();
  st.size_bytes  = static_cast<int64_t>(stx.stx_size);
  st.modified_at = static_cast<int64_t>(stx.stx_mtime.tv_sec);
  st.created_at  = (stx.stx_mask & STATX_BTIME) ? static_cast<int64_t>(stx.stx_btime.tv_sec)
                                                : st.modified_at;
  return st;
}

std::ifstream LocalFSBackend::openRead(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw IoError("cannot open " + path + ": " + std::strerror(errno));
  return in;
}

bool LocalFSBackend::isReadableDirectory(const std::string& path) const {
  std::error_code ec;
  if (path.empty() || !std::filesystem::is_directory(path, ec) || ec) return false;
  return ::access(path.c_str(), R_OK | X_OK) == 0;
}
