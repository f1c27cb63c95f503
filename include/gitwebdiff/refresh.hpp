#pragma once
#include "checksum.hpp"
#include "difftool.hpp"
#include "repo_state.hpp"
#include "snapshot.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitwebdiff {

enum class RefreshError {
  None,
  InvalidRepo,
  AlreadyInProgress,
  ProbeFailed,
  ProtocolViolation,
  MissingDirectories,
  SpawnFailed,
  ComputeFailed,
  Closed
};

std::string to_string(RefreshError e);
RefreshError from_start_status(StartStatus s);

struct RefreshResult {
  bool success = false;
  RefreshError error = RefreshError::None;
  std::size_t file_count = 0;
  std::string message;
};

// Replaces one repository's (process, snapshot, checksum) triple.
// At most one refresh per RepoState runs at a time; a concurrent call is
// rejected with AlreadyInProgress rather than queued. When the helper cannot
// be started the repository is published empty with the new args; a failed
// snapshot computation publishes nothing.
class RefreshOrchestrator {
public:
  RefreshOrchestrator(DifftoolLauncher launcher,
                      std::shared_ptr<const SnapshotComputer> computer,
                      DiffChecksummer checksummer);

  RefreshResult refresh(RepoState &state,
                        const std::optional<std::vector<std::string>> &new_args =
                            std::nullopt) const;

  const DifftoolLauncher &launcher() const { return launcher_; }
  const DiffChecksummer &checksummer() const { return checksummer_; }

private:
  RefreshResult do_refresh(RepoState &state, const std::vector<std::string> &args) const;

  DifftoolLauncher launcher_;
  std::shared_ptr<const SnapshotComputer> computer_;
  DiffChecksummer checksummer_;
};

} // namespace gitwebdiff
