#include <gitwebdiff/api.hpp>
#include <gitwebdiff/util.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <vector>

using json = nlohmann::json;

namespace gitwebdiff {

namespace {

const char *kManageDisabled = "Repository management not enabled (use --manage-repos flag)";

http::Response json_response(int status, std::string body) {
  http::Response resp;
  resp.status = status;
  resp.headers["Content-Type"] = "application/json";
  resp.body = std::move(body);
  return resp;
}

http::Response error_response(int status, const std::string &msg) {
  return json_response(status, fmt::format("{{\"error\":{}}}", util::json_quote(msg)));
}

// "/api/diff/3" with prefix "/api/diff/" -> idx 3.
bool match_index(const std::string &path, const char *prefix, std::string &tail) {
  std::string p(prefix);
  if (path.size() <= p.size() || path.compare(0, p.size(), p) != 0)
    return false;
  tail = path.substr(p.size());
  return true;
}

std::string pair_json(const FilePair &fp) {
  return fmt::format("{{\"idx\":{},\"a\":{},\"b\":{},\"type\":\"{}\",\"size_a\":{},"
                     "\"size_b\":{},\"is_image_diff\":{}}}",
                     fp.idx, util::json_quote(fp.a), util::json_quote(fp.b),
                     to_string(fp.type), fp.size_a, fp.size_b, util::json_bool(fp.is_image_diff));
}

bool parse_body(const std::string &body, json &out, std::string *err) {
  try {
    out = body.empty() ? json::object() : json::parse(body);
  } catch (const json::parse_error &e) {
    *err = fmt::format("Malformed JSON: {}", e.what());
    return false;
  }
  if (!out.is_object()) {
    *err = "Request body must be a JSON object";
    return false;
  }
  return true;
}

} // namespace

Api::Api(RepoRegistry &registry, const ChangeWatcher &watcher, ApiOptions opts)
    : registry_(registry), watcher_(watcher), opts_(std::move(opts)) {}

http::Response Api::handle(const http::Request &r) {
  try {
    return route(r);
  } catch (const json::type_error &e) {
    return error_response(400, fmt::format("Invalid request body: {}", e.what()));
  }
}

http::Response Api::route(const http::Request &r) {
  std::string path = r.path;
  if (!opts_.root_path.empty() && path.compare(0, opts_.root_path.size(), opts_.root_path) == 0)
    path = path.substr(opts_.root_path.size());
  if (path.empty())
    path = "/";

  std::string tail;
  std::size_t idx = 0;

  if (r.method == "GET" && path == "/api/repos")
    return handle_repos();

  if (r.method == "GET" && match_index(path, "/api/diff/", tail)) {
    if (!util::parse_index(tail, idx))
      return error_response(404, fmt::format("Invalid repo index: {}", tail));
    return handle_diff(idx);
  }
  if (r.method == "GET" && match_index(path, "/api/diff-changed/", tail)) {
    if (!util::parse_index(tail, idx))
      return error_response(404, fmt::format("Invalid repo index: {}", tail));
    return handle_diff_changed(idx);
  }
  if (r.method == "POST" && match_index(path, "/api/server-reload/", tail)) {
    if (!util::parse_index(tail, idx))
      return error_response(404, fmt::format("Invalid repo index: {}", tail));
    return handle_reload(idx, r.body);
  }
  if (r.method == "POST" && path == "/api/repos/validate")
    return handle_validate(r.body);
  if (r.method == "POST" && path == "/api/repos/update")
    return handle_update(r.body);

  return error_response(404, "not found");
}

std::string Api::repos_json() const {
  auto repos = registry_.descriptors();
  std::string out = "[";
  for (std::size_t i = 0; i < repos.size(); ++i) {
    if (i)
      out += ",";
    out += fmt::format("{{\"idx\":{},\"label\":{},\"path\":{}}}", i,
                       util::json_quote(repos[i].label),
                       util::json_quote(repos[i].path.string()));
  }
  return out + "]";
}

http::Response Api::handle_repos() {
  return json_response(200, fmt::format("{{\"repos\":{},\"watch_enabled\":{},"
                                        "\"manage_repos_enabled\":{}}}",
                                        repos_json(), util::json_bool(watcher_.enabled()),
                                        util::json_bool(opts_.manage_repos)));
}

http::Response Api::handle_diff(std::size_t idx) {
  auto st = registry_.state(idx);
  if (!st)
    return error_response(404, fmt::format("Invalid repo index: {}", idx));
  auto v = st->view();
  std::string pairs = "[";
  for (std::size_t i = 0; i < v->snapshot->size(); ++i) {
    if (i)
      pairs += ",";
    pairs += pair_json((*v->snapshot)[i]);
  }
  pairs += "]";
  return json_response(200, fmt::format("{{\"label\":{},\"git_args\":{},\"pairs\":{}}}",
                                        util::json_quote(st->label()),
                                        util::json_string_array(v->comparison_args), pairs));
}

http::Response Api::handle_diff_changed(std::size_t idx) {
  auto status = watcher_.query(idx);
  if (!status)
    return error_response(404, fmt::format("Invalid repo index: {}", idx));
  auto resp = json_response(200, fmt::format("{{\"watch_enabled\":{},\"changed\":{}}}",
                                             util::json_bool(status->watch_enabled),
                                             util::json_bool(status->changed)));
  resp.headers["Cache-Control"] = "no-store, no-cache, must-revalidate, max-age=0";
  resp.headers["Pragma"] = "no-cache";
  resp.headers["Expires"] = "0";
  return resp;
}

http::Response Api::handle_reload(std::size_t idx, const std::string &body) {
  json j;
  std::string err;
  if (!parse_body(body, j, &err))
    return json_response(400, fmt::format("{{\"success\":false,\"error\":{}}}",
                                          util::json_quote(err)));

  std::optional<std::vector<std::string>> args;
  if (j.contains("git_args")) {
    const auto &ga = j["git_args"];
    if (!ga.is_array())
      return json_response(400, "{\"success\":false,\"error\":\"git_args must be an array\"}");
    std::vector<std::string> v;
    for (const auto &a : ga) {
      if (!a.is_string())
        return json_response(
            400, "{\"success\":false,\"error\":\"git_args must contain strings\"}");
      v.push_back(a.get<std::string>());
    }
    args = std::move(v);
  }

  auto r = registry_.refresh(idx, args);
  if (r.success)
    return json_response(200, fmt::format("{{\"success\":true,\"message\":{}}}",
                                          util::json_quote(r.message)));
  int status = 500;
  if (r.error == RefreshError::InvalidRepo)
    status = 404;
  else if (r.error == RefreshError::AlreadyInProgress)
    status = 409;
  else if (r.error == RefreshError::Closed)
    status = 503;
  return json_response(status, fmt::format("{{\"success\":false,\"error\":{}}}",
                                           util::json_quote(r.message)));
}

http::Response Api::handle_validate(const std::string &body) {
  if (!opts_.manage_repos)
    return json_response(403, fmt::format("{{\"valid\":false,\"error\":{}}}",
                                          util::json_quote(kManageDisabled)));
  json j;
  std::string err;
  if (!parse_body(body, j, &err))
    return json_response(400, fmt::format("{{\"valid\":false,\"error\":{}}}",
                                          util::json_quote(err)));

  std::string label = j.value("label", std::string());
  std::string path = j.value("path", std::string());
  if (!validate_single_repo(label, path, &err))
    return json_response(200, fmt::format("{{\"valid\":false,\"error\":{}}}",
                                          util::json_quote(err)));
  auto abs = std::filesystem::absolute(path).lexically_normal();
  return json_response(200, fmt::format("{{\"valid\":true,\"label\":{},\"path\":{}}}",
                                        util::json_quote(label),
                                        util::json_quote(abs.string())));
}

http::Response Api::handle_update(const std::string &body) {
  if (!opts_.manage_repos)
    return json_response(403, fmt::format("{{\"success\":false,\"error\":{}}}",
                                          util::json_quote(kManageDisabled)));
  json j;
  std::string err;
  if (!parse_body(body, j, &err))
    return json_response(400, fmt::format("{{\"success\":false,\"error\":{}}}",
                                          util::json_quote(err)));

  std::vector<RepoDescriptor> repos;
  if (j.contains("repos")) {
    if (!j["repos"].is_array())
      return json_response(400, "{\"success\":false,\"error\":\"repos must be an array\"}");
    for (const auto &e : j["repos"]) {
      if (!e.is_object())
        return json_response(400,
                             "{\"success\":false,\"error\":\"repos entries must be objects\"}");
      repos.push_back({e.value("label", std::string()), e.value("path", std::string())});
    }
  }

  auto r = registry_.replace_all(repos);
  if (!r.success) {
    int status = 400;
    if (r.error == ReplaceError::CriticalRollbackFailure)
      status = 500;
    else if (r.error == ReplaceError::Closed)
      status = 503;
    return json_response(status, fmt::format("{{\"success\":false,\"error\":{}}}",
                                             util::json_quote(r.message)));
  }
  return json_response(200, fmt::format("{{\"success\":true,\"repos\":{}}}", repos_json()));
}

} // namespace gitwebdiff
