#pragma once
#include "registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace gitwebdiff {

class LifecycleSupervisor {
public:
  using ShutdownFn = std::function<void()>;

  LifecycleSupervisor(RepoRegistry &registry, int timeout_minutes);
  ~LifecycleSupervisor();

  LifecycleSupervisor(const LifecycleSupervisor &) = delete;
  LifecycleSupervisor &operator=(const LifecycleSupervisor &) = delete;

  // SIGINT/SIGTERM set a process-wide flag; SIGPIPE is ignored.
  static void install_signal_handlers();
  static bool signal_received();

  // The timeout counts from here.
  void start(ShutdownFn on_shutdown);
  void stop();

  // Drain helpers and run the shutdown callback (at most once).
  void request_shutdown(const std::string &reason);

  // Close the registry to new work and stop every helper process.
  // Waits for a refresh or replace in flight. Safe to call repeatedly.
  void drain();
  bool drained() const { return drained_.load(); }

private:
  void monitor();

  RepoRegistry &registry_;
  const std::chrono::minutes timeout_;
  std::chrono::steady_clock::time_point started_at_;

  ShutdownFn on_shutdown_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> drained_{false};
  std::mutex drain_mu_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace gitwebdiff
