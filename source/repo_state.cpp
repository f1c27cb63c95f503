#include <gitwebdiff/repo_state.hpp>

#include <spdlog/spdlog.h>

namespace gitwebdiff {

RepoState::RepoState(RepoDescriptor descriptor, std::vector<std::string> comparison_args)
    : descriptor_(std::move(descriptor)) {
  auto v = std::make_shared<RepoView>();
  v->comparison_args = std::move(comparison_args);
  view_ = std::move(v);
}

RepoState::~RepoState() { stop_process(); }

std::shared_ptr<const RepoView> RepoState::view() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return view_;
}

std::uint64_t RepoState::publish(std::vector<std::string> args, Snapshot snapshot,
                                 std::optional<Checksum> checksum) {
  auto next = std::make_shared<RepoView>();
  next->comparison_args = std::move(args);
  next->snapshot = snapshot ? std::move(snapshot) : empty_snapshot();
  next->initial_checksum = checksum;
  next->current_checksum = std::move(checksum);

  std::lock_guard<std::mutex> lk(view_mu_);
  next->generation = view_->generation + 1;
  view_ = next;
  return next->generation;
}

bool RepoState::update_current_checksum(std::uint64_t generation, Checksum checksum) {
  std::lock_guard<std::mutex> lk(view_mu_);
  if (view_->generation != generation)
    return false;
  if (view_->current_checksum == checksum)
    return true;
  auto next = std::make_shared<RepoView>(*view_);
  next->current_checksum = std::move(checksum);
  view_ = std::move(next);
  return true;
}

std::unique_lock<std::mutex> RepoState::try_begin_reload() {
  return std::unique_lock<std::mutex>(reload_mu_, std::try_to_lock);
}

bool RepoState::reload_in_flight() {
  std::unique_lock<std::mutex> probe(reload_mu_, std::try_to_lock);
  return !probe.owns_lock();
}

std::unique_ptr<DifftoolProcess> RepoState::take_process() {
  std::lock_guard<std::mutex> lk(process_mu_);
  return std::move(process_);
}

void RepoState::install_process(std::unique_ptr<DifftoolProcess> proc) {
  std::unique_ptr<DifftoolProcess> old;
  {
    std::lock_guard<std::mutex> lk(process_mu_);
    old = std::move(process_);
    process_ = std::move(proc);
  }
  if (old) {
    spdlog::warn("[repo={}] replacing a live helper pid={}", label(), old->pid());
    old->stop();
  }
}

bool RepoState::has_process() const {
  std::lock_guard<std::mutex> lk(process_mu_);
  return static_cast<bool>(process_);
}

void RepoState::stop_process() {
  auto proc = take_process();
  stop_difftool(proc);
}

} // namespace gitwebdiff
