#pragma once
#include "refresh.hpp"
#include "repo.hpp"
#include "repo_state.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gitwebdiff {

enum class ReplaceError {
  None,
  ValidationFailed,
  InitFailed,
  CriticalRollbackFailure,
  Closed
};

std::string to_string(ReplaceError e);

struct ReplaceResult {
  bool success = false;
  ReplaceError error = ReplaceError::None;
  std::string message;
};

// One immutable registry generation; index i of `repos` pairs with `states[i]`.
struct Generation {
  std::vector<RepoDescriptor> repos;
  std::vector<std::shared_ptr<RepoState>> states;
};

class RepoRegistry {
public:
  RepoRegistry(const RefreshOrchestrator &orchestrator,
               std::vector<std::string> default_args);
  ~RepoRegistry();

  RepoRegistry(const RepoRegistry &) = delete;
  RepoRegistry &operator=(const RepoRegistry &) = delete;

  // Validate, stop every helper, build + refresh the new set, publish.
  // On failure the previous set is restored and refreshed again.
  ReplaceResult replace_all(const std::vector<RepoDescriptor> &repos);

  RefreshResult refresh(std::size_t idx,
                        const std::optional<std::vector<std::string>> &new_args =
                            std::nullopt);

  std::shared_ptr<const Generation> generation() const;
  std::shared_ptr<RepoState> state(std::size_t idx) const;
  std::vector<RepoDescriptor> descriptors() const;
  std::optional<std::size_t> index_of(const std::string &label) const;
  std::size_t size() const;

  Snapshot snapshot(std::size_t idx) const;
  std::shared_ptr<const RepoView> view(std::size_t idx) const;

  const std::vector<std::string> &default_args() const { return default_args_; }

  void stop_all();

  // Waits for in-flight refresh/replace work, then stops every helper.
  // Afterwards refresh() reports Closed and replace_all() is rejected.
  void close();
  bool closed() const { return closed_.load(); }

private:
  bool initialize(const Generation &gen, std::string *err) const;
  void publish(std::shared_ptr<const Generation> gen);

  const RefreshOrchestrator &orchestrator_;
  const std::vector<std::string> default_args_;

  mutable std::mutex gen_mu_;
  std::shared_ptr<const Generation> gen_;

  // shared: index-based refresh; exclusive: replace_all
  std::shared_mutex swap_mu_;
  std::atomic<bool> closed_{false};
};

} // namespace gitwebdiff
