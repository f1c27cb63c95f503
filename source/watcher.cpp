#include <gitwebdiff/watcher.hpp>

#include <spdlog/spdlog.h>

namespace gitwebdiff {

ChangeWatcher::ChangeWatcher(RepoRegistry &registry, DiffChecksummer checksummer,
                             std::chrono::seconds interval)
    : registry_(registry), checksummer_(std::move(checksummer)), interval_(interval) {}

ChangeWatcher::~ChangeWatcher() { stop(); }

void ChangeWatcher::start() {
  if (!enabled() || thread_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = false;
  }
  spdlog::info("[watch] polling every {}s", interval_.count());
  thread_ = std::thread([this] { run_loop(); });
}

void ChangeWatcher::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

std::size_t ChangeWatcher::poll_once() {
  auto gen = registry_.generation();
  std::size_t stored = 0;
  for (std::size_t i = 0; i < gen->states.size(); ++i) {
    auto &st = *gen->states[i];
    auto before = st.view();
    auto sum = checksummer_.compute(st.descriptor().path, before->comparison_args);
    if (!sum) {
      spdlog::debug("[watch] repo {} ({}): checksum unavailable, retrying next cycle", i,
                    st.label());
      continue;
    }
    if (!st.update_current_checksum(before->generation, *sum)) {
      spdlog::debug("[watch] repo {} ({}): refreshed while hashing, result dropped", i,
                    st.label());
      continue;
    }
    ++stored;
    bool was_changed = before->checksums_differ();
    bool now_changed = before->initial_checksum && *before->initial_checksum != *sum;
    if (now_changed && !was_changed)
      spdlog::info("[watch] repo {} ({}): diff changed ({} -> {})", i, st.label(),
                   short_sum(before->initial_checksum), short_sum(sum));
  }
  return stored;
}

void ChangeWatcher::run_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stopping_) {
    if (cv_.wait_for(lk, interval_, [this] { return stopping_; }))
      break;
    lk.unlock();
    try {
      poll_once();
    } catch (const std::exception &e) {
      spdlog::warn("[watch] poll failed: {}", e.what());
    }
    lk.lock();
  }
  spdlog::debug("[watch] loop stopped");
}

std::optional<ChangeStatus> ChangeWatcher::query(std::size_t idx) const {
  auto v = registry_.view(idx);
  if (!v)
    return std::nullopt;
  if (!enabled())
    return ChangeStatus{false, false};
  return ChangeStatus{true, v->checksums_differ()};
}

} // namespace gitwebdiff
