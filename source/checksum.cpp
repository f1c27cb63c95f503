#include <gitwebdiff/checksum.hpp>
#include <gitwebdiff/subprocess.hpp>

#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <cstdio>

namespace fs = std::filesystem;

namespace gitwebdiff {

Checksum xxh3_128_hex(const void *data, std::size_t size) {
  XXH128_hash_t h = XXH3_128bits(data, size);
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                static_cast<unsigned long long>(h.high64),
                static_cast<unsigned long long>(h.low64));
  return Checksum(buf, 32);
}

std::optional<Checksum> DiffChecksummer::compute(const fs::path &repo_path,
                                                 const std::vector<std::string> &args) const {
  std::vector<std::string> cmd = diff_cmd_;
  cmd.insert(cmd.end(), args.begin(), args.end());

  auto res = run_command(cmd, repo_path, timeout_);
  if (res.timed_out) {
    spdlog::error("[checksum] diff timed out for {}", repo_path.string());
    return std::nullopt;
  }
  // 0 = no diff, 1 = has diff (--exit-code style wrappers)
  if (res.exit_code != 0 && res.exit_code != 1) {
    spdlog::warn("[checksum] diff failed for {} with code {}: {}", repo_path.string(),
                 res.exit_code, res.err);
    return std::nullopt;
  }
  return xxh3_128_hex(res.out.data(), res.out.size());
}

} // namespace gitwebdiff
