#include <catch2/catch_all.hpp>
#include <gitwebdiff/refresh.hpp>
#include <gitwebdiff/registry.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace gitwebdiff;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("gitwebdiff_refresh_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void sh(const std::string& cmd, const fs::path& wd){
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

static fs::path make_repo(const char* name){
  auto repo = mkd(name);
  sh("git init -q", repo);
  sh("git config user.email test@example.com", repo);
  sh("git config user.name tester", repo);
  sh("git config commit.gpgsign false", repo);
  std::ofstream(repo / "a.txt") << "one\n";
  std::ofstream(repo / "b.txt") << "bee\n";
  sh("git add . && git commit -q -m init", repo);
  return repo;
}

static DifftoolOptions git_options(const char* name){
  auto opts = DifftoolOptions::with_wrapper(install_wrapper(mkd(name)));
  opts.stop_grace = 2s;
  return opts;
}

// Blocks inside compute until released; counts calls.
class GatedComputer : public SnapshotComputer {
public:
  std::vector<FilePair> compute(const fs::path& l, const fs::path& r) const override {
    calls++;
    entered = true;
    while (!released.load())
      std::this_thread::sleep_for(10ms);
    return DirDiffComputer().compute(l, r);
  }
  mutable std::atomic<int> calls{0};
  mutable std::atomic<bool> entered{false};
  std::atomic<bool> released{false};
};

class ToggleComputer : public SnapshotComputer {
public:
  std::vector<FilePair> compute(const fs::path& l, const fs::path& r) const override {
    if (fail.load())
      throw std::runtime_error("corrupt tree");
    return DirDiffComputer().compute(l, r);
  }
  std::atomic<bool> fail{false};
};

TEST_CASE("one modified file gives fileCount 1 and a fresh baseline") {
  auto repo = make_repo("one");
  std::ofstream(repo / "a.txt") << "two\n";

  RefreshOrchestrator orch(DifftoolLauncher(git_options("one_run")),
                           std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoState st({"one", repo}, {});

  auto r = orch.refresh(st);
  REQUIRE(r.success);
  REQUIRE(r.error == RefreshError::None);
  REQUIRE(r.file_count == 1);
  REQUIRE(r.message == "Reloaded 1 files");

  auto v = st.view();
  REQUIRE(v->generation == 1);
  REQUIRE(v->snapshot->size() == 1);
  REQUIRE((*v->snapshot)[0].a == "a.txt");
  REQUIRE(v->initial_checksum);
  REQUIRE(v->initial_checksum == v->current_checksum);
  REQUIRE_FALSE(v->checksums_differ());
  REQUIRE(st.has_process());
  st.stop_process();
  REQUIRE_FALSE(st.has_process());
}

TEST_CASE("NoDifferences publishes an empty snapshot with equal checksums") {
  auto repo = make_repo("nodiff");
  RefreshOrchestrator orch(DifftoolLauncher(git_options("nodiff_run")),
                           std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoState st({"nodiff", repo}, {});

  auto r = orch.refresh(st);
  REQUIRE(r.success);
  REQUIRE(r.file_count == 0);
  REQUIRE(r.message == "Reloaded (0 files - no differences)");
  auto v = st.view();
  REQUIRE(v->generation == 1);
  REQUIRE(v->snapshot->empty());
  REQUIRE(v->initial_checksum);
  REQUIRE(v->initial_checksum == v->current_checksum);
  REQUIRE_FALSE(st.has_process());
}

TEST_CASE("refreshing twice with the same args reports no change") {
  auto repo = make_repo("idem");
  std::ofstream(repo / "b.txt") << "changed\n";
  RefreshOrchestrator orch(DifftoolLauncher(git_options("idem_run")),
                           std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoState st({"idem", repo}, {});

  REQUIRE(orch.refresh(st).success);
  int first_pid = -1;
  {
    auto p = st.take_process();
    REQUIRE(p);
    first_pid = p->pid();
    st.install_process(std::move(p));
  }
  auto r2 = orch.refresh(st);
  REQUIRE(r2.success);
  REQUIRE(r2.file_count == 1);
  REQUIRE_FALSE(st.view()->checksums_differ());
  REQUIRE(st.view()->generation == 2);

  auto p = st.take_process();
  REQUIRE(p);
  REQUIRE(p->pid() != first_pid);
  p->stop();
}

TEST_CASE("new args replace the comparison args") {
  auto repo = make_repo("args");
  std::ofstream(repo / "a.txt") << "x\n";
  sh("git commit -q -am second", repo);
  RefreshOrchestrator orch(DifftoolLauncher(git_options("args_run")),
                           std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoState st({"args", repo}, {});

  auto clean = orch.refresh(st);
  REQUIRE(clean.success);
  REQUIRE(clean.file_count == 0);

  auto r = orch.refresh(st, std::vector<std::string>{"HEAD~1", "HEAD"});
  REQUIRE(r.success);
  REQUIRE(r.file_count == 1);
  REQUIRE(st.comparison_args() == std::vector<std::string>{"HEAD~1", "HEAD"});
  st.stop_process();
}

TEST_CASE("concurrent refreshes: exactly one runs, the others are rejected") {
  auto repo = make_repo("conc");
  std::ofstream(repo / "a.txt") << "two\n";
  auto gated = std::make_shared<GatedComputer>();
  RefreshOrchestrator orch(DifftoolLauncher(git_options("conc_run")), gated,
                           DiffChecksummer());
  RepoState st({"conc", repo}, {});

  auto first = std::async(std::launch::async, [&] { return orch.refresh(st); });
  while (!gated->entered.load())
    std::this_thread::sleep_for(10ms);
  REQUIRE(st.reload_in_flight());

  std::vector<std::future<RefreshResult>> others;
  for (int i = 0; i < 4; i++)
    others.push_back(std::async(std::launch::async, [&] { return orch.refresh(st); }));
  for (auto& f : others) {
    auto r = f.get();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.error == RefreshError::AlreadyInProgress);
  }

  gated->released = true;
  auto r = first.get();
  REQUIRE(r.success);
  REQUIRE(gated->calls.load() == 1);
  REQUIRE_FALSE(st.reload_in_flight());
  st.stop_process();
}

TEST_CASE("a failing snapshot computation keeps the previous snapshot") {
  auto repo = make_repo("compute");
  std::ofstream(repo / "a.txt") << "two\n";
  auto toggle = std::make_shared<ToggleComputer>();
  RefreshOrchestrator orch(DifftoolLauncher(git_options("compute_run")), toggle,
                           DiffChecksummer());
  RepoState st({"compute", repo}, {});

  REQUIRE(orch.refresh(st).success);
  auto before = st.view();

  toggle->fail = true;
  std::ofstream(repo / "b.txt") << "also changed\n";
  auto r = orch.refresh(st);
  REQUIRE_FALSE(r.success);
  REQUIRE(r.error == RefreshError::ComputeFailed);

  auto after = st.view();
  REQUIRE(after == before);
  REQUIRE(after->snapshot->size() == 1);
  REQUIRE_FALSE(st.has_process());

  toggle->fail = false;
  auto again = orch.refresh(st);
  REQUIRE(again.success);
  REQUIRE(again.file_count == 2);
  st.stop_process();
}

TEST_CASE("a helper without directory lines degrades to an empty snapshot") {
  auto repo = make_repo("proto");
  std::ofstream(repo / "a.txt") << "two\n";
  DifftoolOptions o;
  o.helper_cmd = {"/bin/sh", "-c", "printf 'just-one-line\\n'", "helper"};
  o.handshake_timeout = 2s;
  RefreshOrchestrator orch(DifftoolLauncher(o), std::make_shared<DirDiffComputer>(),
                           DiffChecksummer());
  RepoState st({"proto", repo}, {});

  auto r = orch.refresh(st);
  REQUIRE_FALSE(r.success);
  REQUIRE(r.error == RefreshError::ProtocolViolation);
  REQUIRE(r.file_count == 0);
  auto v = st.view();
  REQUIRE(v->generation == 1);
  REQUIRE(v->snapshot->empty());
  REQUIRE(v->initial_checksum);
  REQUIRE(v->initial_checksum == v->current_checksum);
  REQUIRE_FALSE(st.has_process());
}

TEST_CASE("a start failure after a good refresh drops the old snapshot") {
  auto repo = make_repo("restart");
  std::ofstream(repo / "a.txt") << "two\n";
  RefreshOrchestrator orch(DifftoolLauncher(git_options("restart_run")),
                           std::make_shared<DirDiffComputer>(), DiffChecksummer());
  RepoState st({"restart", repo}, {});

  REQUIRE(orch.refresh(st).success);
  auto old = st.snapshot();
  REQUIRE(old->size() == 1);

  auto r = orch.refresh(st, std::vector<std::string>{"no-such-revision"});
  REQUIRE_FALSE(r.success);
  REQUIRE(r.error == RefreshError::ProbeFailed);
  REQUIRE(st.snapshot()->empty());
  REQUIRE(st.comparison_args() == std::vector<std::string>{"no-such-revision"});
  REQUIRE(st.view()->generation == 2);
  REQUIRE_FALSE(st.view()->checksums_differ());
  REQUIRE_FALSE(st.has_process());
  for (const auto& p : *old)
    REQUIRE_FALSE(fs::exists(p.a_path));
}

TEST_CASE("an out-of-range index is InvalidRepo") {
  DifftoolOptions o;
  RefreshOrchestrator orch(DifftoolLauncher(o), std::make_shared<DirDiffComputer>(),
                           DiffChecksummer());
  RepoRegistry reg(orch, {});
  auto r = reg.refresh(3);
  REQUIRE_FALSE(r.success);
  REQUIRE(r.error == RefreshError::InvalidRepo);
  REQUIRE(reg.snapshot(3)->empty());
  REQUIRE(reg.view(3) == nullptr);
}

TEST_CASE("start status maps onto refresh errors") {
  REQUIRE(from_start_status(StartStatus::ProbeFailed) == RefreshError::ProbeFailed);
  REQUIRE(from_start_status(StartStatus::MissingDirectories) ==
          RefreshError::MissingDirectories);
  REQUIRE(from_start_status(StartStatus::NoDifferences) == RefreshError::None);
  REQUIRE(to_string(RefreshError::AlreadyInProgress) == "reload already in progress");
}
