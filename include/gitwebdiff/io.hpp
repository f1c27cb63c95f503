#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace gitwebdiff {
namespace io {
  void ensure_dir(const std::filesystem::path& p);

  // O_APPEND|O_CREAT, close-on-exec. Throws std::runtime_error.
  int  open_append(const std::filesystem::path& path);

  // base -> base.1 -> ... -> base.<backups> once base reaches max_bytes.
  void rotate_logs(const std::filesystem::path& base_path,
                   std::uintmax_t max_bytes,
                   int backups);

  // Atomically replaces path with content and mode 0755.
  void write_executable(const std::filesystem::path& path,
                        const std::string& content);

  std::uintmax_t log_max_bytes_from_env();
}
} // namespace gitwebdiff
