#include <catch2/catch_all.hpp>
#include <gitwebdiff/subprocess.hpp>
#include <chrono>
#include <filesystem>

using namespace gitwebdiff;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("gitwebdiff_proc_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("run_command captures stdout, stderr and exit code") {
  auto r = run_command({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, {}, 5s);
  REQUIRE_FALSE(r.timed_out);
  REQUIRE(r.exit_code == 3);
  REQUIRE(r.out == "out\n");
  REQUIRE(r.err == "err\n");
}

TEST_CASE("run_command runs in the given directory") {
  auto d = mkd("cwd");
  auto r = run_command({"/bin/sh", "-c", "pwd -P"}, d, 5s);
  REQUIRE(r.exit_code == 0);
  REQUIRE(fs::equivalent(fs::path(r.out.substr(0, r.out.size() - 1)), d));
}

TEST_CASE("run_command kills the child on timeout") {
  auto t0 = std::chrono::steady_clock::now();
  auto r = run_command({"/bin/sh", "-c", "sleep 30"}, {}, 300ms);
  auto took = std::chrono::steady_clock::now() - t0;
  REQUIRE(r.timed_out);
  REQUIRE(r.exit_code == -1);
  REQUIRE(took < 10s);
}

TEST_CASE("run_command reports 127 for a missing executable") {
  auto r = run_command({"/nonexistent/definitely-not-here"}, {}, 5s);
  REQUIRE(r.exit_code == 127);
  REQUIRE_FALSE(r.timed_out);
}

TEST_CASE("stdin is /dev/null") {
  auto r = run_command({"/bin/sh", "-c", "cat; echo done"}, {}, 5s);
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.out == "done\n");
}

TEST_CASE("decode_wait_status and pid_alive") {
  REQUIRE_FALSE(pid_alive(-1));
  REQUIRE_FALSE(pid_alive(0));
  auto r = run_command({"/bin/sh", "-c", "kill -TERM $$"}, {}, 5s);
  REQUIRE(r.exit_code == 128 + 15);
}
