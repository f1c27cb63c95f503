#include <gitwebdiff/registry.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace gitwebdiff {

std::string to_string(ReplaceError e) {
  switch (e) {
  case ReplaceError::None: return "none";
  case ReplaceError::ValidationFailed: return "validation failed";
  case ReplaceError::InitFailed: return "failed to initialize repositories";
  case ReplaceError::CriticalRollbackFailure: return "rollback failed";
  case ReplaceError::Closed: return "server is shutting down";
  }
  return "unknown";
}

RepoRegistry::RepoRegistry(const RefreshOrchestrator &orchestrator,
                           std::vector<std::string> default_args)
    : orchestrator_(orchestrator), default_args_(std::move(default_args)),
      gen_(std::make_shared<Generation>()) {}

RepoRegistry::~RepoRegistry() { close(); }

std::shared_ptr<const Generation> RepoRegistry::generation() const {
  std::lock_guard<std::mutex> lk(gen_mu_);
  return gen_;
}

void RepoRegistry::publish(std::shared_ptr<const Generation> gen) {
  std::lock_guard<std::mutex> lk(gen_mu_);
  gen_ = std::move(gen);
}

std::shared_ptr<RepoState> RepoRegistry::state(std::size_t idx) const {
  auto g = generation();
  if (idx >= g->states.size())
    return nullptr;
  return g->states[idx];
}

std::vector<RepoDescriptor> RepoRegistry::descriptors() const { return generation()->repos; }

std::optional<std::size_t> RepoRegistry::index_of(const std::string &label) const {
  auto g = generation();
  for (std::size_t i = 0; i < g->repos.size(); ++i)
    if (g->repos[i].label == label)
      return i;
  return std::nullopt;
}

std::size_t RepoRegistry::size() const { return generation()->repos.size(); }

Snapshot RepoRegistry::snapshot(std::size_t idx) const {
  auto s = state(idx);
  return s ? s->snapshot() : empty_snapshot();
}

std::shared_ptr<const RepoView> RepoRegistry::view(std::size_t idx) const {
  auto s = state(idx);
  return s ? s->view() : nullptr;
}

RefreshResult RepoRegistry::refresh(std::size_t idx,
                                    const std::optional<std::vector<std::string>> &new_args) {
  std::shared_lock<std::shared_mutex> lk(swap_mu_);
  if (closed_.load())
    return {false, RefreshError::Closed, 0, to_string(RefreshError::Closed)};
  auto s = state(idx);
  if (!s) {
    auto msg = fmt::format("Invalid repo index: {}", idx);
    spdlog::warn("[registry] {}", msg);
    return {false, RefreshError::InvalidRepo, 0, msg};
  }
  return orchestrator_.refresh(*s, new_args);
}

void RepoRegistry::stop_all() {
  auto g = generation();
  for (std::size_t i = 0; i < g->states.size(); ++i) {
    if (g->states[i]->has_process())
      spdlog::info("[registry] terminating difftool for repo {} ({})", i,
                   g->states[i]->label());
    g->states[i]->stop_process();
  }
}

void RepoRegistry::close() {
  std::unique_lock<std::shared_mutex> lk(swap_mu_);
  if (!closed_.exchange(true))
    spdlog::info("[registry] closed to new work");
  stop_all();
}

// Initial refresh of every state. Start failures only leave that repository
// empty; a snapshot computation failure fails the whole set.
bool RepoRegistry::initialize(const Generation &gen, std::string *err) const {
  for (std::size_t i = 0; i < gen.states.size(); ++i) {
    auto &st = *gen.states[i];
    auto r = orchestrator_.refresh(st);
    if (r.success) {
      spdlog::info("[registry] repo {} ({}): loaded {} files", i, st.label(), r.file_count);
      continue;
    }
    if (r.error == RefreshError::ComputeFailed || r.error == RefreshError::AlreadyInProgress) {
      *err = fmt::format("repo '{}': {}", st.label(), r.message);
      return false;
    }
    spdlog::warn("[registry] repo {} ({}): starting with empty diff ({})", i, st.label(),
                 r.message);
  }
  return true;
}

ReplaceResult RepoRegistry::replace_all(const std::vector<RepoDescriptor> &repos) {
  std::string err;
  if (!validate_repo_list(repos, &err)) {
    spdlog::warn("[registry] rejected repository list: {}", err);
    return {false, ReplaceError::ValidationFailed, err};
  }

  std::unique_lock<std::shared_mutex> lk(swap_mu_);
  if (closed_.load())
    return {false, ReplaceError::Closed, to_string(ReplaceError::Closed)};
  auto old_gen = generation();

  spdlog::info("[registry] cleaning up old difftool processes...");
  stop_all();

  auto next = std::make_shared<Generation>();
  std::string failure;
  try {
    next->repos = repos;
    next->states.reserve(repos.size());
    for (const auto &d : repos)
      next->states.push_back(std::make_shared<RepoState>(d, default_args_));

    spdlog::info("[registry] initializing {} repos...", repos.size());
    if (initialize(*next, &failure)) {
      publish(next);
      spdlog::info("[registry] successfully updated to {} repos", repos.size());
      return {true, ReplaceError::None, {}};
    }
  } catch (const std::exception &e) {
    failure = e.what();
  }

  spdlog::error("[registry] error updating repos, rolling back: {}", failure);
  for (auto &s : next->states)
    s->stop_process();
  auto msg = fmt::format("Failed to update repos: {}", failure);

  try {
    publish(old_gen);
    std::string rb_err;
    if (!initialize(*old_gen, &rb_err))
      throw std::runtime_error(rb_err);
  } catch (const std::exception &e) {
    spdlog::critical("[registry] CRITICAL: rollback failed: {}", e.what());
    return {false, ReplaceError::CriticalRollbackFailure,
            fmt::format("{}; rollback failed: {}", msg, e.what())};
  }
  return {false, ReplaceError::InitFailed, msg};
}

} // namespace gitwebdiff
