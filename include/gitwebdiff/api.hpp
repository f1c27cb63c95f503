#pragma once
#include "http.hpp"
#include "registry.hpp"
#include "watcher.hpp"

#include <cstddef>
#include <string>

namespace gitwebdiff {

struct ApiOptions {
  std::string root_path; // stripped from every request path
  bool manage_repos = false;
};

class Api {
public:
  Api(RepoRegistry &registry, const ChangeWatcher &watcher, ApiOptions opts);

  http::Response handle(const http::Request &r);

private:
  http::Response route(const http::Request &r);
  http::Response handle_repos();
  http::Response handle_diff(std::size_t idx);
  http::Response handle_diff_changed(std::size_t idx);
  http::Response handle_reload(std::size_t idx, const std::string &body);
  http::Response handle_validate(const std::string &body);
  http::Response handle_update(const std::string &body);

  std::string repos_json() const;

  RepoRegistry &registry_;
  const ChangeWatcher &watcher_;
  ApiOptions opts_;
};

} // namespace gitwebdiff
