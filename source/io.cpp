#include <gitwebdiff/io.hpp>

#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitwebdiff {
namespace io {

void ensure_dir(const fs::path &p) {
  if (!fs::exists(p))
    fs::create_directories(p);
}

void rotate_logs(const fs::path &base_path, std::uintmax_t max_bytes,
                 int backups) {
  std::error_code ec;
  if (!fs::exists(base_path, ec))
    return;
  auto sz = fs::file_size(base_path, ec);
  if (ec || sz < max_bytes)
    return;

  for (int i = backups - 1; i >= 1; --i) {
    fs::path src = base_path;
    src += "." + std::to_string(i);
    fs::path dst = base_path;
    dst += "." + std::to_string(i + 1);
    std::error_code e2;
    if (fs::exists(src, e2))
      fs::rename(src, dst, e2);
  }
  fs::path first = base_path;
  first += ".1";
  std::error_code e3;
  fs::rename(base_path, first, e3);
  if (e3)
    return;
  int fd = ::open(base_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd >= 0)
    ::close(fd);
}

int open_append(const fs::path &path) {
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::runtime_error("open: " + path.string());
  return fd;
}

void write_executable(const fs::path &path, const std::string &content) {
  if (path.has_parent_path())
    ensure_dir(path.parent_path());
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::binary | std::ios::trunc);
    if (!o)
      throw std::runtime_error("cannot write " + tmp.string());
    o << content;
    if (!o)
      throw std::runtime_error("short write " + tmp.string());
  }
  if (::chmod(tmp.c_str(), 0755) != 0)
    throw std::runtime_error("chmod failed: " + tmp.string());
  fs::rename(tmp, path);
}

std::uintmax_t log_max_bytes_from_env() {
  std::uintmax_t max_mb = 5;
  if (const char *env = ::getenv("GITWEBDIFF_LOG_MAX_MB")) {
    long v = std::strtol(env, nullptr, 10);
    if (v >= 0)
      max_mb = static_cast<std::uintmax_t>(v);
  }
  return max_mb * 1024 * 1024;
}

} // namespace io
} // namespace gitwebdiff
