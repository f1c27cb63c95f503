#include <gitwebdiff/refresh.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gitwebdiff {

std::string to_string(RefreshError e) {
  switch (e) {
  case RefreshError::None: return "none";
  case RefreshError::InvalidRepo: return "invalid repo";
  case RefreshError::AlreadyInProgress: return "reload already in progress";
  case RefreshError::ProbeFailed: return "difference probe failed";
  case RefreshError::ProtocolViolation: return "difftool protocol violation";
  case RefreshError::MissingDirectories: return "difftool directories missing";
  case RefreshError::SpawnFailed: return "difftool failed to start";
  case RefreshError::ComputeFailed: return "failed to compute diff";
  case RefreshError::Closed: return "server is shutting down";
  }
  return "unknown";
}

RefreshError from_start_status(StartStatus s) {
  switch (s) {
  case StartStatus::Started:
  case StartStatus::NoDifferences: return RefreshError::None;
  case StartStatus::ProbeFailed: return RefreshError::ProbeFailed;
  case StartStatus::ProtocolViolation: return RefreshError::ProtocolViolation;
  case StartStatus::MissingDirectories: return RefreshError::MissingDirectories;
  case StartStatus::SpawnFailed: return RefreshError::SpawnFailed;
  }
  return RefreshError::SpawnFailed;
}

static std::string join_args(const std::vector<std::string> &args) {
  std::string s = "[";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i)
      s += ", ";
    s += args[i];
  }
  return s + "]";
}

RefreshOrchestrator::RefreshOrchestrator(DifftoolLauncher launcher,
                                         std::shared_ptr<const SnapshotComputer> computer,
                                         DiffChecksummer checksummer)
    : launcher_(std::move(launcher)), computer_(std::move(computer)),
      checksummer_(std::move(checksummer)) {}

RefreshResult RefreshOrchestrator::refresh(
    RepoState &state, const std::optional<std::vector<std::string>> &new_args) const {
  auto gate = state.try_begin_reload();
  if (!gate.owns_lock()) {
    spdlog::info("[refresh] [repo={}] reload already in progress", state.label());
    return {false, RefreshError::AlreadyInProgress, 0, to_string(RefreshError::AlreadyInProgress)};
  }

  auto args = new_args ? *new_args : state.comparison_args();
  spdlog::info("[refresh] [repo={}] refreshing with args {}", state.label(), join_args(args));

  try {
    return do_refresh(state, args);
  } catch (const std::exception &e) {
    spdlog::error("[refresh] [repo={}] refresh failed: {}", state.label(), e.what());
    return {false, RefreshError::ComputeFailed, 0, e.what()};
  }
}

RefreshResult RefreshOrchestrator::do_refresh(RepoState &state,
                                              const std::vector<std::string> &args) const {
  const auto &repo_path = state.descriptor().path;

  // never two helpers for one repository: old temp trees could be taken for new ones
  state.stop_process();

  auto started = launcher_.start(args, repo_path, state.label());
  if (!started.ok()) {
    // the old trees are gone with the old helper: degrade to an empty view
    auto err = from_start_status(started.status);
    auto checksum = checksummer_.compute(repo_path, args);
    state.publish(args, empty_snapshot(), checksum);
    spdlog::warn("[refresh] [repo={}] difftool did not start ({}), snapshot now empty",
                 state.label(), started.detail);
    return {false, err, 0, fmt::format("{}: {}", to_string(err), started.detail)};
  }

  Snapshot snap = empty_snapshot();
  if (started.status == StartStatus::Started) {
    const auto &proc = started.process;
    try {
      snap = std::make_shared<const std::vector<FilePair>>(
          computer_->compute(proc->left_dir(), proc->right_dir()));
    } catch (const std::exception &e) {
      spdlog::error("[refresh] [repo={}] failed to compute new diff: {}", state.label(),
                    e.what());
      started.process->stop();
      return {false, RefreshError::ComputeFailed, 0,
              fmt::format("Failed to compute diff: {}", e.what())};
    } catch (...) {
      spdlog::error("[refresh] [repo={}] failed to compute new diff: unknown error",
                    state.label());
      started.process->stop();
      return {false, RefreshError::ComputeFailed, 0, "Failed to compute diff: unknown error"};
    }
  }

  auto checksum = checksummer_.compute(repo_path, args);
  const std::size_t n = snap->size();

  state.install_process(std::move(started.process));
  state.publish(args, std::move(snap), checksum);

  spdlog::info("[refresh] [repo={}] published {} files, checksum baseline {}", state.label(),
               n, short_sum(checksum));
  if (n == 0)
    return {true, RefreshError::None, 0, "Reloaded (0 files - no differences)"};
  return {true, RefreshError::None, n, fmt::format("Reloaded {} files", n)};
}

} // namespace gitwebdiff
