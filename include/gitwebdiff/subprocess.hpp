#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace gitwebdiff {

struct CmdResult {
  int exit_code{-1};
  std::string out;
  std::string err;
  bool timed_out{false};
};

// Runs argv in cwd and captures both streams. On timeout the child is
// SIGKILLed and reaped; exit_code is then -1 and timed_out is set.
CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd,
                      std::chrono::milliseconds timeout);

int make_cloexec_pipe(int pfd[2]);

bool pid_alive(int pid);

// 0..255 for a normal exit, 128+N for a signal.
int decode_wait_status(int status);

} // namespace gitwebdiff
