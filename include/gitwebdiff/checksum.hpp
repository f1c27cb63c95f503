#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitwebdiff {

// 32 lowercase hex chars (XXH3-128).
using Checksum = std::string;

Checksum xxh3_128_hex(const void *data, std::size_t size);

inline std::string short_sum(const std::optional<Checksum> &c) {
  return c ? c->substr(0, 8) : std::string("none");
}

class DiffChecksummer {
public:
  DiffChecksummer() = default;
  DiffChecksummer(std::vector<std::string> diff_cmd, std::chrono::milliseconds timeout)
      : diff_cmd_(std::move(diff_cmd)), timeout_(timeout) {}

  // Hash of the raw textual diff for these args, nullopt on any failure.
  std::optional<Checksum> compute(const std::filesystem::path &repo_path,
                                  const std::vector<std::string> &args) const;

private:
  std::vector<std::string> diff_cmd_{"git", "diff"};
  std::chrono::milliseconds timeout_{30000};
};

} // namespace gitwebdiff
