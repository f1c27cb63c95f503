#include <catch2/catch_all.hpp>
#include <gitwebdiff/cli.hpp>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

using namespace gitwebdiff;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("gitwebdiff_cli_")+name);
  fs::remove_all(d);
  fs::create_directories(d / ".git");
  return d;
}

static ParseResult parse(std::initializer_list<std::string> args){
  std::vector<std::string> store{"git-webdiff"};
  store.insert(store.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& s : store) argv.push_back(s.data());
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(store.size()), argv.data());
}

TEST_CASE("defaults") {
  auto repo = mkd("defaults");
  auto r = parse({"--git-repo", repo.string()});
  REQUIRE(r.error.empty());
  REQUIRE(r.config);
  const auto& c = *r.config;
  REQUIRE(c.host == "localhost");
  REQUIRE(c.port == 0);
  REQUIRE(c.watch_seconds == 10);
  REQUIRE(c.timeout_minutes == 0);
  REQUIRE(c.manage_repos);
  REQUIRE(c.git_args.empty());
  REQUIRE(c.repos.size() == 1);
  REQUIRE(c.repos[0].label == "gitwebdiff_cli_defaults");
  REQUIRE(c.repos[0].path == repo);
  REQUIRE(c.run_dir.filename().string().rfind("git-webdiff-", 0) == 0);
  REQUIRE_FALSE(c.logs_dir);
}

TEST_CASE("git arguments: unknown words and everything after --") {
  auto repo = mkd("gitargs");
  auto r = parse({"HEAD~3", "--git-repo", repo.string(), "--no-watch", "--", "--stat", "-p"});
  REQUIRE(r.config);
  REQUIRE(r.config->watch_seconds == 0);
  REQUIRE(r.config->git_args == std::vector<std::string>{"HEAD~3", "--", "--stat", "-p"});
}

TEST_CASE("numeric options are validated") {
  auto repo = mkd("numbers");
  auto r = parse({"--git-repo", repo.string(), "--port", "http"});
  REQUIRE_FALSE(r.config);
  REQUIRE(r.error.find("--port") != std::string::npos);

  r = parse({"--git-repo", repo.string(), "-p", "70000"});
  REQUIRE_FALSE(r.config);

  r = parse({"--git-repo", repo.string(), "--watch"});
  REQUIRE_FALSE(r.config);
  REQUIRE(r.error == "--watch: value required");

  r = parse({"--git-repo", repo.string(), "-p", "8123", "--timeout", "15", "--watch", "2"});
  REQUIRE(r.config);
  REQUIRE(r.config->port == 8123);
  REQUIRE(r.config->timeout_minutes == 15);
  REQUIRE(r.config->watch_seconds == 2);

  r = parse({"--git-repo", repo.string(), "--timeout", "15", "--no-timeout"});
  REQUIRE(r.config->timeout_minutes == 0);
}

TEST_CASE("repository labels are made unique and validated") {
  auto one = mkd("same") / "proj";
  auto two = mkd("other") / "proj";
  fs::create_directories(one / ".git");
  fs::create_directories(two / ".git");
  auto r = parse({"--git-repo", one.string(), "--git-repo", two.string(),
                  "--git-repo", "docs:" + two.parent_path().string()});
  REQUIRE(r.config);
  REQUIRE(r.config->repos.size() == 3);
  REQUIRE(r.config->repos[0].label == "proj");
  REQUIRE(r.config->repos[1].label == "proj-1");
  REQUIRE(r.config->repos[2].label == "docs");

  auto bad = parse({"--git-repo", "/nonexistent/gitwebdiff/repo"});
  REQUIRE_FALSE(bad.config);
  REQUIRE(bad.error == "Invalid repo 'repo': Path does not exist");
}

TEST_CASE("repository management defaults to local hosts only") {
  auto repo = mkd("manage");
  REQUIRE(parse({"--git-repo", repo.string(), "--host", "127.0.0.1"}).config->manage_repos);
  REQUIRE_FALSE(parse({"--git-repo", repo.string(), "--host", "0.0.0.0"}).config->manage_repos);
  REQUIRE(parse({"--git-repo", repo.string(), "--host", "0.0.0.0", "--manage-repos"})
              .config->manage_repos);
  REQUIRE_FALSE(parse({"--git-repo", repo.string(), "--no-manage-repos"}).config->manage_repos);
}

TEST_CASE("logging and runtime paths") {
  auto repo = mkd("paths");
  auto r = parse({"--git-repo", repo.string(), "-v", "--log-file", "/tmp/gwd.log",
                  "--log-rotate-max", "4096", "--log-rotate-files", "5",
                  "--run-dir", "/tmp/gwd-run", "--logs-dir", "/tmp/gwd-logs",
                  "--root-path", "/diff/"});
  REQUIRE(r.config);
  const auto& c = *r.config;
  REQUIRE(c.verbose);
  REQUIRE(c.log_file == fs::path("/tmp/gwd.log"));
  REQUIRE(c.log_rotate_max == 4096);
  REQUIRE(c.log_rotate_files == 5);
  REQUIRE(c.run_dir == fs::path("/tmp/gwd-run"));
  REQUIRE(c.logs_dir == fs::path("/tmp/gwd-logs"));
  REQUIRE(c.root_path == "/diff");
}

TEST_CASE("help and version skip repository checks") {
  auto h = parse({"--help", "--git-repo", "/nonexistent"});
  REQUIRE(h.config);
  REQUIRE(h.config->help);
  auto v = parse({"--version"});
  REQUIRE(v.config);
  REQUIRE(v.config->version);
  REQUIRE(usage_text("git-webdiff").find("--git-repo") != std::string::npos);
}
