#include <gitwebdiff/subprocess.hpp>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitwebdiff {

int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

bool pid_alive(int pid) {
  if (pid <= 0)
    return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

int decode_wait_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

CmdResult run_command(const std::vector<std::string> &args, const fs::path &cwd,
                      std::chrono::milliseconds timeout) {
  CmdResult res{};
  if (args.empty()) {
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (make_cloexec_pipe(out_pipe) != 0) {
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  if (make_cloexec_pipe(err_pipe) != 0) {
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return res;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    res.err = std::string("fork failed: ") + std::strerror(errno);
    ::close(out_pipe[0]); ::close(out_pipe[1]);
    ::close(err_pipe[0]); ::close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      _exit(127);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    std::vector<char *> argv_c;
    argv_c.reserve(args.size() + 1);
    for (auto &s : args)
      argv_c.push_back(const_cast<char *>(s.c_str()));
    argv_c.push_back(nullptr);

    ::execvp(argv_c[0], argv_c.data());
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  std::array<char, 4096> buf{};
  int open_fds = 2;

  while (open_fds > 0) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      res.timed_out = true;
      break;
    }
    int rc = ::poll(fds.data(), fds.size(), static_cast<int>(left.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0) {
      res.timed_out = true;
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        (i == 0 ? res.out : res.err).append(buf.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }

  for (auto &p : fds)
    if (p.fd >= 0)
      ::close(p.fd);

  if (res.timed_out)
    ::kill(pid, SIGKILL);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      res.exit_code = -1;
      return res;
    }
  }
  res.exit_code = res.timed_out ? -1 : decode_wait_status(status);
  return res;
}

} // namespace gitwebdiff
