#include "utils/file_io.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

static bool WriteAll(int fd, const uint8_t* data, size_t size) {
  while (size > 0) {
    const ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

static bool SyncParentDirectory(const std::string& path, std::string& error) {
  fs::path dir = fs::path(path).parent_path();
  if (dir.empty()) dir = ".";
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    error = "cannot open directory " + dir.string() + ": " + std::strerror(errno);
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  if (!ok) error = "fsync failed: " + dir.string() + ": " + std::strerror(errno);
  ::close(fd);
  return ok;
}

namespace FileIO {
  bool ReadFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& error) {
    out.clear();
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      error = "cannot open " + path + ": " + std::strerror(errno);
      return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
      error = "read failed: " + path;
      out.clear();
      return false;
    }
    return true;
  }

  bool WriteFileAtomic(const std::string& path, const std::vector<uint8_t>& bytes, std::string& error) {
    const std::string tmp_path = path + ".tmp";
    std::error_code ec;
    const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
      error = "cannot open " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    if (!WriteAll(fd, bytes.data(), bytes.size()) || ::fsync(fd) != 0) {
      error = "write failed: " + tmp_path + ": " + std::strerror(errno);
      ::close(fd);
      fs::remove(tmp_path, ec);
      return false;
    }
    if (::close(fd) != 0) {
      error = "close failed: " + tmp_path + ": " + std::strerror(errno);
      fs::remove(tmp_path, ec);
      return false;
    }
    fs::rename(tmp_path, path, ec);
    if (ec) {
      error = "rename " + tmp_path + " -> " + path + " failed: " + ec.message();
      std::error_code ignored;
      fs::remove(tmp_path, ignored);
      return false;
    }
    // The rename itself is durable only once the directory entry is synced.
    if (!SyncParentDirectory(path, error)) return false;
    return true;
  }
}
