#pragma once
#include "repo.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitwebdiff {

inline constexpr const char *kVersion = "0.4.0";

struct Config {
  std::string host = "localhost";
  int port = 0;
  std::string root_path;
  int timeout_minutes = 0;
  int watch_seconds = 10;
  bool manage_repos = true;
  bool manage_repos_explicit = false;

  std::vector<RepoDescriptor> repos;
  std::vector<std::string> git_args;

  std::optional<std::filesystem::path> difftool_wrapper;
  std::filesystem::path run_dir;
  std::optional<std::filesystem::path> logs_dir;

  std::optional<std::filesystem::path> log_file;
  std::size_t log_rotate_max = 10 * 1024 * 1024;
  std::size_t log_rotate_files = 3;
  bool verbose = false;

  bool help = false;
  bool version = false;
};

struct ParseResult {
  std::optional<Config> config;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

std::string usage_text(const char *prog);

} // namespace gitwebdiff
