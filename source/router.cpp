#include <gitagent/json.hpp>
#include <gitagent/repos.hpp>
#include <gitagent/router.hpp>
#include <gitagent/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace gitagent {

static Response json_response(int status, std::string body) {
  Response resp;
  resp.status = status;
  resp.headers["Content-Type"] = "application/json";
  resp.body = std::move(body);
  return resp;
}

static Response json_error(int status, const std::string &msg) {
  return json_response(status, fmt::format("{{\"error\":{}}}", json_quote(msg)));
}

static Response no_session() { return json_error(400, "Repository not set"); }

static std::string query_param(const Request &r, const std::string &name) {
  for (auto &kv : parse_query(r.query))
    if (kv.first == name)
      return kv.second;
  return {};
}

static Response git_failure(const std::string &what, const std::string &err) {
  spdlog::warn("[http] {}: {}", what, trim(err));
  return json_error(500, what);
}

static std::string output_json(const std::string &out) {
  return fmt::format("{{\"output\":{}}}", json_quote(trim(out)));
}

Router::Router(SessionManager &sessions, std::shared_ptr<Analyzer> analyzer,
               std::vector<fs::path> search_roots)
    : sessions_(sessions), analyzer_(std::move(analyzer)),
      search_roots_(std::move(search_roots)) {}

Response Router::handle(const Request &r) {
  spdlog::debug("[http] {} {}", r.method, r.path);
  if (r.method == "OPTIONS") {
    Response pre;
    pre.status = 204;
    pre.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    pre.headers["Access-Control-Allow-Headers"] = "Content-Type";
    return pre;
  }
  if (r.method == "POST" && r.path == "/api/set-repo")
    return handle_set_repo(r);
  if (r.method == "GET" && r.path == "/api/status")
    return handle_status();
  if (r.method == "POST" && (r.path == "/api/poll" || r.path == "/poll"))
    return handle_poll(r);
  if (r.method == "GET" && r.path == "/api/files")
    return handle_files();
  if (r.method == "GET" && r.path == "/api/file")
    return handle_file_get(r);
  if (r.method == "POST" && r.path == "/api/file")
    return handle_file_post(r);
  if (r.method == "GET" && r.path == "/api/diff")
    return handle_diff(r);
  if (r.method == "GET" && r.path == "/api/branch")
    return handle_branch();
  if (r.method == "GET" && r.path == "/api/branches")
    return handle_branches();
  if (r.method == "POST" && r.path == "/api/branch/switch")
    return handle_branch_switch(r);
  if (r.method == "POST" && r.path == "/api/branch/create")
    return handle_branch_create(r);
  if (r.method == "POST" && r.path == "/api/commit")
    return handle_commit(r);
  if (r.method == "POST" && r.path == "/api/push")
    return handle_push();
  if (r.method == "POST" && r.path == "/api/pull")
    return handle_pull();
  if (r.method == "GET" && r.path == "/api/commits")
    return handle_commits();
  if (r.method == "POST" && r.path == "/api/file/stage")
    return handle_stage(r, true);
  if (r.method == "POST" && r.path == "/api/file/unstage")
    return handle_stage(r, false);
  if (r.method == "POST" && r.path == "/api/file/revert")
    return handle_revert(r);
  if (r.method == "GET" && r.path == "/api/repos")
    return handle_repos();
  if (r.method == "POST" && r.path == "/api/chat")
    return handle_chat(r);
  return json_error(404, "not found");
}

Response Router::handle_set_repo(const Request &r) {
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto path = json_get_string(body, "path");
  std::string err;
  if (!path || !sessions_.select(*path, &err))
    return json_error(400, "Invalid path");
  auto s = sessions_.current();
  return json_response(200,
                       fmt::format("{{\"message\":\"Repository set\",\"path\":{}}}",
                                   json_quote(s->root().string())));
}

Response Router::handle_status() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string err;
  auto out = s->repo().status_short(&err);
  if (!out)
    return json_response(500, "{\"status\":\"Error getting status\"}");
  return json_response(200,
                       fmt::format("{{\"status\":{}}}", json_quote(trim(*out))));
}

Response Router::handle_poll(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();

  bool force = json_get_bool(r.body, "force").value_or(false);
  auto d = s->cache().poll(force);

  std::optional<std::string> summary;
  std::optional<std::string> dsl;
  if (d.should_analyze && analyzer_) {
    std::string err;
    auto a = analyzer_->analyze(d.status, &err);
    if (a) {
      summary = a->summary;
      dsl = a->dsl;
    } else {
      summary = err;
    }
  }

  return json_response(
      200, fmt::format("{{\"has_changed\":{},\"files_changed\":{},"
                       "\"status\":{},\"summary\":{},\"dsl_suggestion\":{}}}",
                       d.has_changed, d.files_changed, json_quote(d.status),
                       json_quote_or_null(summary), json_quote_or_null(dsl)));
}

Response Router::handle_files() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto &cache = s->cache();
  std::string err;
  auto files = TreeLister{}.list_files(cache.root(), cache.ignore(), &err);
  if (!files)
    return json_error(500, err);
  return json_response(200,
                       fmt::format("{{\"files\":{}}}", json_array(*files)));
}

std::optional<fs::path> Router::resolve_inside(const Session &s,
                                               const std::string &rel) const {
  std::error_code ec;
  fs::path root = fs::weakly_canonical(s.root(), ec);
  if (ec)
    return std::nullopt;
  fs::path full = fs::weakly_canonical(root / rel, ec);
  if (ec)
    return std::nullopt;
  fs::path inner = full.lexically_relative(root);
  if (inner.empty() || *inner.begin() == "..")
    return std::nullopt;
  return full;
}

Response Router::handle_file_get(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string rel = query_param(r, "path");
  if (rel.empty())
    return json_error(400, "Path required");
  auto full = resolve_inside(*s, rel);
  if (!full)
    return json_error(400, "Invalid path");
  std::error_code ec;
  if (!fs::is_regular_file(*full, ec))
    return json_error(404, "File not found");

  std::ifstream in(*full, std::ios::binary);
  if (!in)
    return json_error(500, "cannot open " + rel);
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return json_response(200,
                       fmt::format("{{\"content\":{}}}", json_quote(data)));
}

Response Router::handle_file_post(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto rel = json_get_string(body, "path");
  auto content = json_get_string(body, "content");
  if (!rel || rel->empty() || !content)
    return json_error(400, "Path and content required");
  auto full = resolve_inside(*s, *rel);
  if (!full)
    return json_error(400, "Invalid path");

  std::ofstream out(*full, std::ios::binary | std::ios::trunc);
  if (!out)
    return json_error(500, "cannot write " + *rel);
  out << *content;
  out.close();
  if (!out)
    return json_error(500, "cannot write " + *rel);
  spdlog::info("[http] saved {}", full->string());
  return json_response(200, "{\"message\":\"File saved\"}");
}

Response Router::handle_diff(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string rel = query_param(r, "path");
  if (rel.empty())
    return json_error(400, "Path required");
  auto out = s->repo().diff_head(rel);
  return json_response(
      200, fmt::format("{{\"diff\":{}}}", json_quote(out.value_or(""))));
}

Response Router::handle_branch() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string err;
  auto b = s->repo().current_branch(&err);
  if (!b)
    return json_error(500, trim(err));
  return json_response(200, fmt::format("{{\"branch\":{}}}", json_quote(*b)));
}

Response Router::handle_branches() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string err;
  auto b = s->repo().branches(&err);
  if (!b)
    return git_failure("Failed to list branches", err);
  return json_response(
      200, fmt::format("{{\"local\":{},\"remote\":{},\"current\":{}}}",
                       json_array(b->local), json_array(b->remote),
                       json_quote(b->current)));
}

Response Router::handle_branch_switch(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto name = json_get_string(body, "branch");
  if (!name || name->empty())
    return json_error(400, "Branch name required");
  if (!valid_branch_name(*name))
    return json_error(400, "Invalid branch name");

  auto &repo = s->repo();
  std::string err;
  auto b = repo.branches(&err);
  if (!b)
    return git_failure("Failed to list branches", err);

  std::optional<std::string> out;
  if (std::find(b->local.begin(), b->local.end(), *name) != b->local.end()) {
    out = repo.checkout(*name, &err);
  } else if (std::find(b->remote.begin(), b->remote.end(), *name) !=
             b->remote.end()) {
    out = repo.checkout_tracking(*name, "origin/" + *name, &err);
  } else {
    return json_error(404, fmt::format("Branch '{}' not found", *name));
  }
  if (!out)
    return git_failure(fmt::format("Failed to switch to branch '{}'", *name),
                       err);

  spdlog::info("[http] switched {} to {}", s->root().string(), *name);
  auto now = repo.current_branch().value_or(*name);
  return json_response(200, fmt::format("{{\"output\":{},\"branch\":{}}}",
                                        json_quote(trim(*out)),
                                        json_quote(now)));
}

Response Router::handle_branch_create(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto name = json_get_string(body, "branch");
  bool switch_to = json_get_bool(body, "switch").value_or(true);
  if (!name || name->empty())
    return json_error(400, "Branch name required");
  if (!valid_branch_name(*name))
    return json_error(400, "Invalid branch name");

  auto &repo = s->repo();
  std::string err;
  auto b = repo.branches(&err);
  if (b && std::find(b->local.begin(), b->local.end(), *name) != b->local.end())
    return json_error(400, fmt::format("Branch '{}' already exists", *name));

  auto out = repo.create_branch(*name, switch_to, &err);
  if (!out)
    return git_failure(fmt::format("Failed to create branch '{}'", *name), err);
  auto now = repo.current_branch().value_or(*name);
  return json_response(
      200, fmt::format("{{\"output\":{},\"branch\":{},\"created\":{}}}",
                       json_quote(trim(*out)), json_quote(now),
                       json_quote(*name)));
}

Response Router::handle_commit(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto message = json_get_string(body, "message");
  if (!message || trim(*message).empty())
    return json_error(400, "Commit message required");
  std::string err;
  auto out = s->repo().commit_all(*message, &err);
  if (!out)
    return git_failure("Commit failed", err);
  return json_response(200, output_json(*out));
}

Response Router::handle_push() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string err;
  auto out = s->repo().push(&err);
  if (!out)
    return git_failure("Push failed", err);
  return json_response(200, output_json(*out));
}

Response Router::handle_pull() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  std::string err;
  auto out = s->repo().pull(&err);
  if (!out)
    return git_failure("Pull failed", err);
  return json_response(200, output_json(*out));
}

Response Router::handle_commits() {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  // an unborn branch has no commits yet
  auto c = s->repo().commit_counts().value_or(CommitCounts{});
  return json_response(
      200, fmt::format("{{\"total\":{},\"unpushed\":{},\"behind\":{}}}",
                       c.total, c.unpushed, c.behind));
}

Response Router::handle_stage(const Request &r, bool stage) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto rel = json_get_string(body, "path");
  if (!rel || rel->empty())
    return json_error(400, "File path required");
  if (!resolve_inside(*s, *rel))
    return json_error(400, "Invalid path");

  std::string err;
  auto out = stage ? s->repo().stage(*rel, &err) : s->repo().unstage(*rel, &err);
  if (!out)
    return git_failure(fmt::format("Failed to {} file '{}'",
                                   stage ? "stage" : "unstage", *rel),
                       err);
  return json_response(
      200, fmt::format("{{\"message\":{},\"output\":{}}}",
                       json_quote(fmt::format("{} '{}'",
                                              stage ? "Staged" : "Unstaged",
                                              *rel)),
                       json_quote(trim(*out))));
}

Response Router::handle_revert(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto rel = json_get_string(body, "path");
  if (!rel || rel->empty())
    return json_error(400, "File path required");
  auto full = resolve_inside(*s, *rel);
  if (!full)
    return json_error(400, "Invalid path");

  auto &repo = s->repo();
  std::string err;
  auto status = repo.status_porcelain(&err);
  if (!status)
    return git_failure("Failed to read status", err);
  auto code = porcelain_code(*status, *rel).value_or("");

  // New files are removed; tracked files get their HEAD version back.
  bool untracked = code == "??";
  bool added = !code.empty() && (code[0] == 'A' || code[1] == 'A');
  if (!untracked && !added && !repo.in_head(*rel))
    added = true;
  if (untracked || added) {
    if (added && !repo.unstage(*rel, &err))
      spdlog::debug("[http] unstage of {} before removal: {}", *rel,
                    trim(err));
    std::error_code ec;
    if (!fs::remove(*full, ec)) {
      if (ec)
        return json_error(500, fmt::format("Failed to revert file: {}",
                                           ec.message()));
      return json_error(404, fmt::format("File '{}' not found", *rel));
    }
    return json_response(
        200, fmt::format("{{\"message\":{}}}",
                         json_quote(fmt::format("Removed {} file '{}'",
                                                untracked ? "untracked" : "new",
                                                *rel))));
  }

  if (!repo.unstage(*rel, &err))
    spdlog::debug("[http] unstage of {} before restore: {}", *rel, trim(err));
  auto out = repo.restore_head(*rel, &err);
  if (!out)
    return git_failure(fmt::format("Failed to revert file '{}'", *rel), err);
  return json_response(
      200, fmt::format("{{\"message\":{},\"output\":{}}}",
                       json_quote(fmt::format("Reverted '{}' to HEAD version",
                                              *rel)),
                       json_quote(trim(*out))));
}

Response Router::handle_repos() {
  auto repos = find_repositories(search_roots_);
  nlohmann::ordered_json flat = nlohmann::ordered_json::array();
  nlohmann::ordered_json by_org = nlohmann::ordered_json::object();
  for (auto &e : repos) {
    nlohmann::ordered_json j = {{"name", e.name},
                                {"path", e.path.string()},
                                {"organization", e.organization}};
    flat.push_back(j);
    by_org[e.organization].push_back(std::move(j));
  }
  nlohmann::ordered_json out = {{"repos", std::move(flat)},
                                {"by_organization", std::move(by_org)}};
  return json_response(200, out.dump());
}

Response Router::handle_chat(const Request &r) {
  auto s = sessions_.current();
  if (!s)
    return no_session();
  auto body = json_parse_object(r.body).value_or(nlohmann::json::object());
  auto message = json_get_string(body, "message");
  if (!message || message->empty())
    return json_error(400, "No message provided");
  if (!analyzer_)
    return json_error(500, "analyzer command is not configured");

  auto &repo = s->repo();
  std::string status = trim(repo.status_short().value_or(""));
  std::string log = trim(repo.log_oneline(10).value_or(""));
  std::string err;
  auto reply = analyzer_->chat(*message, status.empty() ? "No changes." : status,
                               log.empty() ? "No recent commits." : log, &err);
  if (!reply)
    return json_error(500, err);
  return json_response(200,
                       fmt::format("{{\"response\":{},\"dsl\":{}}}",
                                   json_quote(reply->response),
                                   json_quote_or_null(reply->dsl)));
}

} // namespace gitagent
