#include <gitwebdiff/api.hpp>
#include <gitwebdiff/checksum.hpp>
#include <gitwebdiff/cli.hpp>
#include <gitwebdiff/difftool.hpp>
#include <gitwebdiff/io.hpp>
#include <gitwebdiff/lifecycle.hpp>
#include <gitwebdiff/refresh.hpp>
#include <gitwebdiff/registry.hpp>
#include <gitwebdiff/server.hpp>
#include <gitwebdiff/snapshot.hpp>
#include <gitwebdiff/watcher.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <fmt/ranges.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

using namespace gitwebdiff;
namespace fs = std::filesystem;

static void setup_logging(const Config &cfg) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      auto logger = std::make_shared<spdlog::logger>("git-webdiff", sink);
      spdlog::set_default_logger(logger);
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {}: {}; logging to stderr",
                   cfg.log_file->string(), e.what());
    }
  }
  const char *dbg = std::getenv("GITWEBDIFF_DEBUG");
  if (cfg.verbose || (dbg && *dbg))
    spdlog::set_level(spdlog::level::debug);
}

static void remove_run_dir(const fs::path &dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec)
    spdlog::debug("could not remove {}: {}", dir.string(), ec.message());
}

int main(int argc, char **argv) {
  auto parsed = parse_cli(argc, argv);
  if (!parsed.config) {
    std::cerr << "error: " << parsed.error << "\n\n" << usage_text(argv[0]);
    return 2;
  }
  const Config &cfg = *parsed.config;
  if (cfg.help) {
    std::cout << usage_text(argv[0]);
    return 0;
  }
  if (cfg.version) {
    std::cout << "git-webdiff " << kVersion << "\n";
    return 0;
  }

  setup_logging(cfg);
  spdlog::info("git-webdiff {} starting; repos={} git_args=[{}]", kVersion, cfg.repos.size(),
               fmt::join(cfg.git_args, " "));
  if (cfg.manage_repos && cfg.host != "localhost" && cfg.host != "127.0.0.1")
    spdlog::warn("repository management is enabled on non-local host {}", cfg.host);

  fs::path wrapper;
  bool own_run_dir = false;
  try {
    if (cfg.difftool_wrapper) {
      wrapper = *cfg.difftool_wrapper;
    } else {
      io::ensure_dir(cfg.run_dir);
      own_run_dir = true;
      wrapper = install_wrapper(cfg.run_dir);
    }
    if (cfg.logs_dir)
      io::ensure_dir(*cfg.logs_dir);
  } catch (const std::exception &e) {
    spdlog::error("failed to prepare runtime files: {}", e.what());
    return 1;
  }
  spdlog::debug("difftool wrapper: {}", wrapper.string());

  auto opts = DifftoolOptions::with_wrapper(wrapper);
  if (cfg.logs_dir)
    opts.logs_dir = *cfg.logs_dir;

  RefreshOrchestrator orchestrator(DifftoolLauncher(opts),
                                   std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoRegistry registry(orchestrator, cfg.git_args);
  LifecycleSupervisor supervisor(registry, cfg.timeout_minutes);

  // helpers run in their own process groups: a signal must never skip the drain
  LifecycleSupervisor::install_signal_handlers();
  auto init = registry.replace_all(cfg.repos);
  if (LifecycleSupervisor::signal_received()) {
    spdlog::info("signal received while loading repositories");
    supervisor.drain();
    if (own_run_dir)
      remove_run_dir(cfg.run_dir);
    return 0;
  }
  if (!init.success) {
    spdlog::error("failed to load repositories: {}", init.message);
    supervisor.drain();
    if (own_run_dir)
      remove_run_dir(cfg.run_dir);
    return 1;
  }

  ChangeWatcher watcher(registry, orchestrator.checksummer(),
                        std::chrono::seconds(cfg.watch_seconds));
  Api api(registry, watcher, ApiOptions{cfg.root_path, cfg.manage_repos});

  std::unique_ptr<http::Server> server;
  try {
    server = std::make_unique<http::Server>(
        cfg.host, static_cast<unsigned short>(cfg.port),
        [&api](const http::Request &r) { return api.handle(r); });
  } catch (const std::exception &e) {
    spdlog::error("cannot listen on {}:{}: {}", cfg.host, cfg.port, e.what());
    supervisor.drain();
    if (own_run_dir)
      remove_run_dir(cfg.run_dir);
    return 1;
  }
  spdlog::info("serving on http://{}:{}{}/", cfg.host, server->port(), cfg.root_path);

  watcher.start();
  supervisor.start([&server] { server->stop(); });

  server->run();

  watcher.stop();
  supervisor.stop();
  supervisor.drain();
  server.reset();
  if (own_run_dir)
    remove_run_dir(cfg.run_dir);
  spdlog::info("git-webdiff stopped");
  return 0;
}
