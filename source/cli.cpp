#include <gitwebdiff/cli.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fmt/format.h>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitwebdiff {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool parse_int(const char *s, long min, long max, long &out) {
  if (!s || !*s)
    return false;
  errno = 0;
  char *end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (errno != 0 || *end != '\0' || v < min || v > max)
    return false;
  out = v;
  return true;
}

static fs::path default_run_dir() {
  const char *tmp = std::getenv("TMPDIR");
  fs::path base = (tmp && *tmp) ? fs::path(tmp) : fs::temp_directory_path();
  return base / fmt::format("git-webdiff-{}", ::getpid());
}

std::string usage_text(const char *prog) {
  return fmt::format(
      "Usage: {} [options] [git_args ...]\n"
      "\n"
      "Options:\n"
      "  --host HOST                 bind address (default localhost)\n"
      "  -p, --port PORT             port, 0 picks a free one (default 0)\n"
      "  --root-path PATH            URL prefix to strip from requests\n"
      "  --timeout MINUTES           shut down after MINUTES, 0 disables\n"
      "  --no-timeout                same as --timeout 0\n"
      "  --watch SECONDS             change poll interval, 0 disables (default 10)\n"
      "  --no-watch                  same as --watch 0\n"
      "  --git-repo [LABEL:]PATH     repository to serve (repeatable)\n"
      "  --manage-repos              enable repository management endpoints\n"
      "  --no-manage-repos           disable repository management endpoints\n"
      "  --difftool-wrapper PATH     use an existing difftool wrapper script\n"
      "  --run-dir PATH              runtime directory for generated files\n"
      "  --logs-dir PATH             directory for difftool stderr logs\n"
      "  --log-file PATH             write the server log to a rotating file\n"
      "  --log-rotate-max BYTES      rotate the log file at BYTES (default 10485760)\n"
      "  --log-rotate-files N        rotated files to keep (default 3)\n"
      "  -v, --verbose               debug logging\n"
      "  -h, --help                  show this help\n"
      "  --version                   show version\n"
      "  --                          pass the remaining arguments to git\n",
      prog);
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  Config c{};
  std::vector<std::string> repo_args;

  auto need = [&](int i, std::string_view opt) -> bool {
    if (has_arg(i, argc))
      return true;
    r.error = fmt::format("{}: value required", opt);
    return false;
  };
  auto number = [&](const char *s, std::string_view opt, long min, long max,
                    long &out) -> bool {
    if (parse_int(s, min, max, out))
      return true;
    r.error = fmt::format("{}: invalid number '{}'", opt, s ? s : "");
    return false;
  };

  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    long n = 0;
    if (a == "--") {
      for (int k = i; k < argc; k++)
        c.git_args.emplace_back(argv[k]);
      break;
    } else if (a == "-h" || a == "--help") {
      c.help = true;
    } else if (a == "--version") {
      c.version = true;
    } else if (a == "--host") {
      if (!need(i, a))
        return r;
      c.host = argv[++i];
    } else if (a == "-p" || a == "--port") {
      if (!need(i, a) || !number(argv[i + 1], a, 0, 65535, n))
        return r;
      ++i;
      c.port = static_cast<int>(n);
    } else if (a == "--root-path") {
      if (!need(i, a))
        return r;
      c.root_path = argv[++i];
      while (!c.root_path.empty() && c.root_path.back() == '/')
        c.root_path.pop_back();
    } else if (a == "--timeout") {
      if (!need(i, a) || !number(argv[i + 1], a, 0, INT_MAX, n))
        return r;
      ++i;
      c.timeout_minutes = static_cast<int>(n);
    } else if (a == "--no-timeout") {
      c.timeout_minutes = 0;
    } else if (a == "--watch") {
      if (!need(i, a) || !number(argv[i + 1], a, 0, INT_MAX, n))
        return r;
      ++i;
      c.watch_seconds = static_cast<int>(n);
    } else if (a == "--no-watch") {
      c.watch_seconds = 0;
    } else if (a == "--git-repo") {
      if (!need(i, a))
        return r;
      repo_args.emplace_back(argv[++i]);
    } else if (a == "--manage-repos") {
      c.manage_repos = true;
      c.manage_repos_explicit = true;
    } else if (a == "--no-manage-repos") {
      c.manage_repos = false;
      c.manage_repos_explicit = true;
    } else if (a == "--difftool-wrapper") {
      if (!need(i, a))
        return r;
      c.difftool_wrapper = fs::absolute(argv[++i]);
    } else if (a == "--run-dir") {
      if (!need(i, a))
        return r;
      c.run_dir = fs::absolute(argv[++i]);
    } else if (a == "--logs-dir") {
      if (!need(i, a))
        return r;
      c.logs_dir = fs::absolute(argv[++i]);
    } else if (a == "--log-file") {
      if (!need(i, a))
        return r;
      c.log_file = argv[++i];
    } else if (a == "--log-rotate-max") {
      if (!need(i, a) || !number(argv[i + 1], a, 1, LONG_MAX, n))
        return r;
      ++i;
      c.log_rotate_max = static_cast<std::size_t>(n);
    } else if (a == "--log-rotate-files") {
      if (!need(i, a) || !number(argv[i + 1], a, 1, 1000, n))
        return r;
      ++i;
      c.log_rotate_files = static_cast<std::size_t>(n);
    } else if (a == "-v" || a == "--verbose") {
      c.verbose = true;
    } else {
      c.git_args.emplace_back(argv[i]);
    }
  }

  if (c.help || c.version) {
    r.config = c;
    return r;
  }

  if (!c.manage_repos_explicit)
    c.manage_repos = (c.host == "localhost" || c.host == "127.0.0.1");

  if (c.run_dir.empty())
    c.run_dir = default_run_dir();

  std::vector<RepoDescriptor> repos;
  if (repo_args.empty()) {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
      r.error = fmt::format("cannot determine current directory: {}", ec.message());
      return r;
    }
    repos.push_back(parse_repo_arg(cwd.string()));
  } else {
    for (const auto &ra : repo_args)
      repos.push_back(parse_repo_arg(ra));
  }
  c.repos = ensure_unique_labels(repos);

  std::string err;
  if (!validate_repo_list(c.repos, &err)) {
    r.error = err;
    return r;
  }

  r.config = c;
  return r;
}

} // namespace gitwebdiff
