#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitwebdiff {

enum class StartStatus {
  Started,
  NoDifferences,
  ProbeFailed,
  ProtocolViolation,
  MissingDirectories,
  SpawnFailed
};

std::string to_string(StartStatus s);

struct DifftoolOptions {
  // Exit code contract: 0 = identical, 1 = differs, >= 2 = error.
  std::vector<std::string> probe_cmd{"git", "diff", "--quiet"};
  // Comparison args are appended. Must print "<left>\n<right>\n" and stay alive.
  std::vector<std::string> helper_cmd;

  std::chrono::milliseconds probe_timeout{30000};
  std::chrono::milliseconds handshake_timeout{30000};
  std::chrono::milliseconds stop_grace{5000};

  std::filesystem::path logs_dir; // empty: helper stderr goes to /dev/null
  bool cleanup_temp_dirs = true;

  static DifftoolOptions with_wrapper(const std::filesystem::path &wrapper);
};

// Owning handle to one live helper process (and its process group).
// The temporary trees stay valid for as long as the handle is running.
class DifftoolProcess {
public:
  DifftoolProcess(int pid, std::string tag, std::chrono::milliseconds grace,
                  bool cleanup_temp_dirs);
  ~DifftoolProcess();

  DifftoolProcess(const DifftoolProcess &) = delete;
  DifftoolProcess &operator=(const DifftoolProcess &) = delete;
  // The moved-from handle owns nothing; assigning over a live handle stops it.
  DifftoolProcess(DifftoolProcess &&other) noexcept;
  DifftoolProcess &operator=(DifftoolProcess &&other);

  // SIGTERM to the group, grace period, SIGKILL, reap. Idempotent.
  void stop();

  bool running();
  int pid() const { return pid_; }
  std::optional<int> exit_code() const { return exit_code_; }

  const std::filesystem::path &left_dir() const { return left_; }
  const std::filesystem::path &right_dir() const { return right_; }
  void set_dirs(std::filesystem::path left, std::filesystem::path right);

private:
  bool reap(bool block);
  bool leader_exited();
  void remove_temp_root();

  int pid_{-1};
  std::string tag_;
  std::chrono::milliseconds grace_;
  bool cleanup_temp_dirs_;
  std::optional<int> exit_code_;
  std::filesystem::path left_;
  std::filesystem::path right_;
};

// Null-safe stop of an optional handle; the handle is released afterwards.
void stop_difftool(std::unique_ptr<DifftoolProcess> &handle);

struct StartResult {
  StartStatus status{StartStatus::SpawnFailed};
  std::unique_ptr<DifftoolProcess> process;
  std::string detail;

  bool ok() const {
    return status == StartStatus::Started || status == StartStatus::NoDifferences;
  }
};

class DifftoolLauncher {
public:
  explicit DifftoolLauncher(DifftoolOptions opts);

  StartResult start(const std::vector<std::string> &comparison_args,
                    const std::filesystem::path &working_dir,
                    const std::string &tag) const;

  const DifftoolOptions &options() const { return opts_; }

private:
  std::unique_ptr<DifftoolProcess> spawn(const std::vector<std::string> &argv,
                                         const std::filesystem::path &cwd,
                                         const std::string &tag, int *stdout_fd,
                                         std::string *err) const;

  DifftoolOptions opts_;
};

std::string default_wrapper_script();

// Writes the built-in wrapper into run_dir and returns its path.
std::filesystem::path install_wrapper(const std::filesystem::path &run_dir);

} // namespace gitwebdiff
