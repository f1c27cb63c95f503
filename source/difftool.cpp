#include <gitwebdiff/difftool.hpp>
#include <gitwebdiff/io.hpp>
#include <gitwebdiff/subprocess.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace gitwebdiff {

std::string to_string(StartStatus s) {
  switch (s) {
  case StartStatus::Started: return "started";
  case StartStatus::NoDifferences: return "no differences";
  case StartStatus::ProbeFailed: return "probe failed";
  case StartStatus::ProtocolViolation: return "protocol violation";
  case StartStatus::MissingDirectories: return "missing directories";
  case StartStatus::SpawnFailed: return "spawn failed";
  }
  return "unknown";
}

DifftoolOptions DifftoolOptions::with_wrapper(const fs::path &wrapper) {
  DifftoolOptions o;
  o.helper_cmd = {"git", "difftool", "-d", "-x", wrapper.string()};
  return o;
}

std::string default_wrapper_script() {
  return "#!/bin/sh\n"
         "# git difftool -d -x <this>: hand the two trees over on stdout and\n"
         "# keep them alive until the server terminates us.\n"
         "printf '%s\\n%s\\n' \"$1\" \"$2\"\n"
         "exec sleep 2147483647\n";
}

fs::path install_wrapper(const fs::path &run_dir) {
  fs::path p = run_dir / "difftool-wrapper.sh";
  io::write_executable(p, default_wrapper_script());
  return p;
}

// ------------------------ DifftoolProcess ------------------------

DifftoolProcess::DifftoolProcess(int pid, std::string tag,
                                 std::chrono::milliseconds grace,
                                 bool cleanup_temp_dirs)
    : pid_(pid), tag_(std::move(tag)), grace_(grace),
      cleanup_temp_dirs_(cleanup_temp_dirs) {}

DifftoolProcess::~DifftoolProcess() { stop(); }

DifftoolProcess::DifftoolProcess(DifftoolProcess &&other) noexcept
    : pid_(other.pid_), tag_(std::move(other.tag_)), grace_(other.grace_),
      cleanup_temp_dirs_(other.cleanup_temp_dirs_), exit_code_(other.exit_code_),
      left_(std::move(other.left_)), right_(std::move(other.right_)) {
  other.pid_ = -1;
  other.left_.clear();
  other.right_.clear();
}

DifftoolProcess &DifftoolProcess::operator=(DifftoolProcess &&other) {
  if (this == &other)
    return *this;
  stop();
  pid_ = other.pid_;
  tag_ = std::move(other.tag_);
  grace_ = other.grace_;
  cleanup_temp_dirs_ = other.cleanup_temp_dirs_;
  exit_code_ = other.exit_code_;
  left_ = std::move(other.left_);
  right_ = std::move(other.right_);
  other.pid_ = -1;
  other.left_.clear();
  other.right_.clear();
  return *this;
}

void DifftoolProcess::set_dirs(fs::path left, fs::path right) {
  left_ = std::move(left);
  right_ = std::move(right);
}

bool DifftoolProcess::reap(bool block) {
  if (pid_ <= 0)
    return true;
  int status = 0;
  for (;;) {
    pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_) {
      exit_code_ = decode_wait_status(status);
      return true;
    }
    if (r == 0)
      return false;
    if (errno == EINTR)
      continue;
    // ECHILD: somebody else reaped it
    return true;
  }
}

// Leader exited (or is gone) without reaping it: an unreaped leader keeps
// its pid, and so the group id, from being reused.
bool DifftoolProcess::leader_exited() {
  if (pid_ <= 0 || exit_code_)
    return true;
  for (;;) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0)
      return info.si_pid == pid_;
    if (errno == EINTR)
      continue;
    // ECHILD: reaped elsewhere, the group id may already be recycled
    exit_code_ = -1;
    return true;
  }
}

bool DifftoolProcess::running() {
  if (pid_ <= 0 || exit_code_)
    return false;
  return !leader_exited();
}

void DifftoolProcess::stop() {
  if (pid_ <= 0)
    return;

  if (!exit_code_) {
    if (!leader_exited()) {
      spdlog::info("[difftool] [repo={}] stopping pid={} (SIGTERM, grace={}ms)",
                   tag_, pid_, grace_.count());
      if (::kill(-pid_, SIGTERM) != 0)
        ::kill(pid_, SIGTERM);

      auto deadline = std::chrono::steady_clock::now() + grace_;
      bool exited = false;
      while (std::chrono::steady_clock::now() < deadline) {
        if (leader_exited()) {
          exited = true;
          break;
        }
        std::this_thread::sleep_for(20ms);
      }
      if (!exited) {
        spdlog::warn("[difftool] [repo={}] force kill pid={}", tag_, pid_);
        if (::kill(-pid_, SIGKILL) != 0)
          ::kill(pid_, SIGKILL);
      }
    }
    // leftovers of the group (the wrapper outliving git, or vice versa);
    // only while the leader is still unreaped
    if (!exit_code_) {
      ::kill(-pid_, SIGKILL);
      reap(true);
    }
  }

  spdlog::debug("[difftool] [repo={}] pid={} exited code={}", tag_, pid_,
                exit_code_.value_or(-1));
  pid_ = -1;
  remove_temp_root();
}

void DifftoolProcess::remove_temp_root() {
  if (!cleanup_temp_dirs_ || left_.empty() || right_.empty())
    return;
  auto root = left_.parent_path();
  if (root != right_.parent_path())
    return;
  if (root.filename().string().rfind("git-difftool", 0) != 0)
    return;
  std::error_code ec;
  if (fs::exists(root, ec)) {
    fs::remove_all(root, ec);
    if (ec)
      spdlog::warn("[difftool] [repo={}] cannot remove {}: {}", tag_,
                   root.string(), ec.message());
  }
}

void stop_difftool(std::unique_ptr<DifftoolProcess> &handle) {
  if (!handle)
    return;
  handle->stop();
  handle.reset();
}

// ------------------------ DifftoolLauncher ------------------------

DifftoolLauncher::DifftoolLauncher(DifftoolOptions opts) : opts_(std::move(opts)) {}

static std::string join_args(const std::vector<std::string> &args) {
  std::string s;
  for (const auto &a : args) {
    if (!s.empty())
      s += ' ';
    s += a;
  }
  return s;
}

static std::string trim_dir_line(std::string s) {
  while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
    s.pop_back();
  while (s.size() > 1 && s.back() == '/')
    s.pop_back();
  std::size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

// Reads up to two lines from fd until the deadline. Returns how many complete
// lines were read.
static int read_two_lines(int fd, std::chrono::milliseconds timeout,
                          std::array<std::string, 2> &lines, bool *timed_out) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string pending;
  int got = 0;
  *timed_out = false;
  char buf[1024];

  while (got < 2) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      *timed_out = true;
      break;
    }
    pollfd p{fd, POLLIN, 0};
    int rc = ::poll(&p, 1, static_cast<int>(left.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0) {
      *timed_out = true;
      break;
    }
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break; // EOF: helper exited or closed stdout
    pending.append(buf, static_cast<size_t>(n));
    std::size_t nl;
    while (got < 2 && (nl = pending.find('\n')) != std::string::npos) {
      lines[got++] = pending.substr(0, nl);
      pending.erase(0, nl + 1);
    }
  }
  return got;
}

std::unique_ptr<DifftoolProcess>
DifftoolLauncher::spawn(const std::vector<std::string> &argv, const fs::path &cwd,
                        const std::string &tag, int *stdout_fd,
                        std::string *err) const {
  int errfd = -1;
  if (!opts_.logs_dir.empty()) {
    try {
      io::ensure_dir(opts_.logs_dir);
      auto errp = opts_.logs_dir / (tag + ".difftool.err");
      io::rotate_logs(errp, io::log_max_bytes_from_env(), 3);
      errfd = io::open_append(errp);
    } catch (const std::exception &e) {
      spdlog::warn("[difftool] [repo={}] helper log unavailable: {}", tag, e.what());
      errfd = -1;
    }
  }
  if (errfd < 0)
    errfd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);

  int outp[2], execp[2];
  if (make_cloexec_pipe(outp) != 0) {
    *err = std::string("pipe failed: ") + std::strerror(errno);
    if (errfd >= 0) ::close(errfd);
    return nullptr;
  }
  if (make_cloexec_pipe(execp) != 0) {
    *err = std::string("pipe failed: ") + std::strerror(errno);
    ::close(outp[0]); ::close(outp[1]);
    if (errfd >= 0) ::close(errfd);
    return nullptr;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    *err = std::string("fork failed: ") + std::strerror(errno);
    ::close(outp[0]); ::close(outp[1]);
    ::close(execp[0]); ::close(execp[1]);
    if (errfd >= 0) ::close(errfd);
    return nullptr;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int e = 0;
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      e = errno;
      (void)!::write(execp[1], &e, sizeof(e));
      _exit(127);
    }
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(outp[1], STDOUT_FILENO);
    if (errfd >= 0)
      ::dup2(errfd, STDERR_FILENO);

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto &s : argv)
      cargv.push_back(const_cast<char *>(s.c_str()));
    cargv.push_back(nullptr);

    ::execvp(cargv[0], cargv.data());
    e = errno;
    (void)!::write(execp[1], &e, sizeof(e));
    _exit(127);
  }

  ::setpgid(pid, pid); // races with the child's own call; either one wins
  ::close(outp[1]);
  ::close(execp[1]);
  if (errfd >= 0)
    ::close(errfd);

  auto proc = std::make_unique<DifftoolProcess>(pid, tag, opts_.stop_grace,
                                                opts_.cleanup_temp_dirs);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(execp[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(execp[0]);

  if (n > 0) {
    *err = fmt::format("exec {} failed: {}", argv[0], std::strerror(child_errno));
    ::close(outp[0]);
    proc->stop();
    return nullptr;
  }

  *stdout_fd = outp[0];
  return proc;
}

StartResult DifftoolLauncher::start(const std::vector<std::string> &comparison_args,
                                    const fs::path &working_dir,
                                    const std::string &tag) const {
  StartResult r;

  // 1. pre-flight: is there anything to show at all?
  std::vector<std::string> probe = opts_.probe_cmd;
  probe.insert(probe.end(), comparison_args.begin(), comparison_args.end());
  spdlog::debug("[difftool] [repo={}] probe: {}", tag, join_args(probe));

  auto pr = run_command(probe, working_dir, opts_.probe_timeout);
  if (pr.timed_out) {
    r.status = StartStatus::ProbeFailed;
    r.detail = fmt::format("'{}' timed out after {}ms", join_args(probe),
                           opts_.probe_timeout.count());
    spdlog::error("[difftool] [repo={}] {}", tag, r.detail);
    return r;
  }
  if (pr.exit_code == 0) {
    spdlog::info("[difftool] [repo={}] no differences in {}", tag, working_dir.string());
    r.status = StartStatus::NoDifferences;
    return r;
  }
  if (pr.exit_code != 1) {
    r.status = StartStatus::ProbeFailed;
    r.detail = fmt::format("'{}' exited with {} in {}: {}", join_args(probe),
                           pr.exit_code, working_dir.string(), pr.err);
    spdlog::error("[difftool] [repo={}] {}", tag, r.detail);
    return r;
  }

  // 2. long-lived helper
  if (opts_.helper_cmd.empty()) {
    r.status = StartStatus::SpawnFailed;
    r.detail = "no helper command configured";
    spdlog::error("[difftool] [repo={}] {}", tag, r.detail);
    return r;
  }
  std::vector<std::string> argv = opts_.helper_cmd;
  argv.insert(argv.end(), comparison_args.begin(), comparison_args.end());
  spdlog::info("[difftool] [repo={}] starting: {}", tag, join_args(argv));

  int out_fd = -1;
  std::string err;
  auto proc = spawn(argv, working_dir, tag, &out_fd, &err);
  if (!proc) {
    r.status = StartStatus::SpawnFailed;
    r.detail = err;
    spdlog::error("[difftool] [repo={}] {}", tag, err);
    return r;
  }

  // 3. two-line handshake
  std::array<std::string, 2> lines;
  bool timed_out = false;
  int got = read_two_lines(out_fd, opts_.handshake_timeout, lines, &timed_out);
  ::close(out_fd);

  std::string left = got > 0 ? trim_dir_line(lines[0]) : std::string{};
  std::string right = got > 1 ? trim_dir_line(lines[1]) : std::string{};
  if (left.empty() || right.empty()) {
    r.status = StartStatus::ProtocolViolation;
    r.detail = fmt::format("expected two directory lines, got left='{}' right='{}'{}",
                           left, right, timed_out ? " (timed out)" : "");
    spdlog::error("[difftool] [repo={}] {}; command: {}; cwd: {}", tag, r.detail,
                  join_args(argv), working_dir.string());
    proc->stop();
    return r;
  }

  std::error_code ec;
  if (!fs::is_directory(left, ec) || !fs::is_directory(right, ec)) {
    r.status = StartStatus::MissingDirectories;
    r.detail = fmt::format("temp directories don't exist: {}, {}", left, right);
    spdlog::error("[difftool] [repo={}] {}", tag, r.detail);
    proc->stop();
    return r;
  }

  proc->set_dirs(left, right);
  spdlog::info("[difftool] [repo={}] pid={} temp dirs: {}, {}", tag, proc->pid(),
               left, right);
  r.status = StartStatus::Started;
  r.process = std::move(proc);
  return r;
}

} // namespace gitwebdiff
