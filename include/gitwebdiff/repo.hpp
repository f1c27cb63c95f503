#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace gitwebdiff {

struct RepoDescriptor {
  std::string label;
  std::filesystem::path path;

  bool operator==(const RepoDescriptor &o) const {
    return label == o.label && path == o.path;
  }
};

// "frontend:/path/to/repo" or "/path/to/repo" (label = basename).
// Relative paths are resolved against the current directory.
RepoDescriptor parse_repo_arg(const std::string &arg);

// Appends -1, -2, ... to repeated labels.
std::vector<RepoDescriptor> ensure_unique_labels(const std::vector<RepoDescriptor> &repos);

bool validate_single_repo(const std::string &label, const std::filesystem::path &path,
                          std::string *err);

bool validate_repo_list(const std::vector<RepoDescriptor> &repos, std::string *err);

} // namespace gitwebdiff
