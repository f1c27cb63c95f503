#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gitwebdiff {

// Fixed set of workers draining a FIFO queue. The destructor runs every
// queued job before joining.
class ThreadPool {
public:
  explicit ThreadPool(unsigned n);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void submit(std::function<void()> fn);
  std::size_t size() const { return workers_.size(); }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> q_;
  std::mutex m_;
  std::condition_variable cv_;
  bool stop_ = false;
};

} // namespace gitwebdiff
