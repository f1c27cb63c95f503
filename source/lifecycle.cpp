#include <gitwebdiff/lifecycle.hpp>

#include <csignal>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gitwebdiff {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void on_signal(int sig) { g_signal = sig; }

constexpr auto kPollPeriod = std::chrono::milliseconds(200);

} // namespace

void LifecycleSupervisor::install_signal_handlers() {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

bool LifecycleSupervisor::signal_received() { return g_signal != 0; }

LifecycleSupervisor::LifecycleSupervisor(RepoRegistry &registry, int timeout_minutes)
    : registry_(registry), timeout_(timeout_minutes > 0 ? timeout_minutes : 0),
      started_at_(std::chrono::steady_clock::now()) {}

LifecycleSupervisor::~LifecycleSupervisor() { stop(); }

void LifecycleSupervisor::start(ShutdownFn on_shutdown) {
  if (thread_.joinable())
    return;
  on_shutdown_ = std::move(on_shutdown);
  started_at_ = std::chrono::steady_clock::now();
  if (timeout_.count() > 0)
    spdlog::info("[lifecycle] server will shut down after {} minutes", timeout_.count());
  thread_ = std::thread([this] { monitor(); });
}

void LifecycleSupervisor::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
    thread_.join();
}

void LifecycleSupervisor::drain() {
  std::lock_guard<std::mutex> lk(drain_mu_);
  if (drained_.load())
    return;
  spdlog::info("[lifecycle] cleaning up difftool processes...");
  registry_.close();
  drained_.store(true);
}

void LifecycleSupervisor::request_shutdown(const std::string &reason) {
  if (shutdown_requested_.exchange(true))
    return;
  spdlog::info("[lifecycle] shutting down: {}", reason);
  drain();
  if (on_shutdown_)
    on_shutdown_();
}

void LifecycleSupervisor::monitor() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stopping_) {
    if (cv_.wait_for(lk, kPollPeriod, [this] { return stopping_; }))
      break;

    if (g_signal != 0) {
      int sig = g_signal;
      lk.unlock();
      request_shutdown(fmt::format("received signal {}", sig));
      return;
    }

    if (timeout_.count() > 0 &&
        std::chrono::steady_clock::now() - started_at_ >= timeout_) {
      lk.unlock();
      spdlog::info("[lifecycle] timeout of {} minutes reached, exiting", timeout_.count());
      drain();
      spdlog::shutdown();
      std::_Exit(0);
    }
  }
}

} // namespace gitwebdiff
