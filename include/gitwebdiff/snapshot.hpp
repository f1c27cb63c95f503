#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gitwebdiff {

enum class PairType { Add, Delete, Change, Move };

std::string to_string(PairType t);

struct FilePair {
  int idx = 0;
  std::string a; // path relative to the left tree, empty when added
  std::string b; // path relative to the right tree, empty when deleted
  PairType type = PairType::Change;
  std::filesystem::path a_path;
  std::filesystem::path b_path;
  std::uintmax_t size_a = 0;
  std::uintmax_t size_b = 0;
  bool is_image_diff = false;
};

using Snapshot = std::shared_ptr<const std::vector<FilePair>>;

Snapshot empty_snapshot();

class SnapshotComputer {
public:
  virtual ~SnapshotComputer() = default;
  // May throw on malformed trees.
  virtual std::vector<FilePair> compute(const std::filesystem::path &left,
                                        const std::filesystem::path &right) const = 0;
};

struct DirDiffOptions {
  bool detect_moves = true;
};

class DirDiffComputer : public SnapshotComputer {
public:
  explicit DirDiffComputer(DirDiffOptions opts = {}) : opts_(opts) {}

  std::vector<FilePair> compute(const std::filesystem::path &left,
                                const std::filesystem::path &right) const override;

private:
  DirDiffOptions opts_;
};

bool is_image_path(const std::string &rel);

} // namespace gitwebdiff
