#include <gitwebdiff/repo.hpp>

#include <algorithm>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace gitwebdiff {

static std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static fs::path normalized(const fs::path &p) {
  auto n = fs::absolute(p).lexically_normal();
  if (n.filename().empty() && n.has_parent_path())
    n = n.parent_path();
  return n;
}

RepoDescriptor parse_repo_arg(const std::string &arg) {
  RepoDescriptor d;
  auto colon = arg.find(':');
  if (colon != std::string::npos) {
    d.label = arg.substr(0, colon);
    d.path = normalized(arg.substr(colon + 1));
  } else {
    d.path = normalized(arg);
    d.label = d.path.filename().string();
  }
  return d;
}

std::vector<RepoDescriptor> ensure_unique_labels(const std::vector<RepoDescriptor> &repos) {
  std::map<std::string, int> counts;
  std::vector<RepoDescriptor> out;
  out.reserve(repos.size());
  for (const auto &r : repos) {
    auto it = counts.find(r.label);
    if (it == counts.end()) {
      counts[r.label] = 1;
      out.push_back(r);
    } else {
      out.push_back({r.label + "-" + std::to_string(it->second), r.path});
      it->second++;
    }
  }
  return out;
}

bool validate_single_repo(const std::string &label, const fs::path &path, std::string *err) {
  auto fail = [&](const char *msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (trim(label).empty())
    return fail("Label cannot be empty");
  if (label.find(':') != std::string::npos)
    return fail("Label cannot contain colon (:)");
  if (!path.is_absolute())
    return fail("Path must be absolute");

  std::error_code ec;
  if (!fs::exists(path, ec))
    return fail("Path does not exist");
  if (!fs::is_directory(path, ec))
    return fail("Path is not a directory");
  // .git may be a file (worktrees, submodules)
  if (!fs::exists(path / ".git", ec))
    return fail("Path is not a git repository (no .git directory)");
  return true;
}

bool validate_repo_list(const std::vector<RepoDescriptor> &repos, std::string *err) {
  if (repos.empty()) {
    if (err)
      *err = "Must have at least one repository";
    return false;
  }

  std::map<std::string, int> label_counts;
  for (const auto &r : repos)
    label_counts[r.label]++;
  std::string dups;
  for (const auto &[label, n] : label_counts) {
    if (n < 2)
      continue;
    if (!dups.empty())
      dups += ", ";
    dups += label;
  }
  if (!dups.empty()) {
    if (err)
      *err = "Duplicate labels: " + dups;
    return false;
  }

  std::set<fs::path> paths;
  for (const auto &r : repos) {
    if (!paths.insert(normalized(r.path)).second) {
      if (err)
        *err = "Duplicate paths not allowed";
      return false;
    }
  }

  for (const auto &r : repos) {
    std::string e;
    if (!validate_single_repo(r.label, r.path, &e)) {
      if (err)
        *err = "Invalid repo '" + r.label + "': " + e;
      return false;
    }
  }
  return true;
}

} // namespace gitwebdiff
