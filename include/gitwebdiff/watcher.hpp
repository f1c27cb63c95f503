#pragma once
#include "checksum.hpp"
#include "registry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>

namespace gitwebdiff {

struct ChangeStatus {
  bool watch_enabled = false;
  bool changed = false;
};

// Periodically rehashes `git diff <args>` for every repository and stores it
// as the current checksum. Never touches snapshots or initial checksums.
class ChangeWatcher {
public:
  ChangeWatcher(RepoRegistry &registry, DiffChecksummer checksummer,
                std::chrono::seconds interval);
  ~ChangeWatcher();

  ChangeWatcher(const ChangeWatcher &) = delete;
  ChangeWatcher &operator=(const ChangeWatcher &) = delete;

  bool enabled() const { return interval_.count() > 0; }

  void start();
  void stop();

  // One pass over all repositories; returns how many checksums were stored.
  std::size_t poll_once();

  std::optional<ChangeStatus> query(std::size_t idx) const;

private:
  void run_loop();

  RepoRegistry &registry_;
  DiffChecksummer checksummer_;
  const std::chrono::seconds interval_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace gitwebdiff
