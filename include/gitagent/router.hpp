#pragma once
#include <gitagent/analyzer.hpp>
#include <gitagent/http.hpp>
#include <gitagent/session.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitagent {

class Router {
public:
  // `analyzer` may be null; poll responses then never carry a summary and
  // chat answers 500. `search_roots` are scanned by /api/repos.
  Router(SessionManager &sessions, std::shared_ptr<Analyzer> analyzer,
         std::vector<std::filesystem::path> search_roots = {});

  Response handle(const Request &r);

private:
  Response handle_set_repo(const Request &r);
  Response handle_status();
  Response handle_poll(const Request &r);
  Response handle_files();
  Response handle_file_get(const Request &r);
  Response handle_file_post(const Request &r);
  Response handle_diff(const Request &r);
  Response handle_branch();
  Response handle_branches();
  Response handle_branch_switch(const Request &r);
  Response handle_branch_create(const Request &r);
  Response handle_commit(const Request &r);
  Response handle_push();
  Response handle_pull();
  Response handle_commits();
  Response handle_stage(const Request &r, bool stage);
  Response handle_revert(const Request &r);
  Response handle_repos();
  Response handle_chat(const Request &r);

  std::optional<std::filesystem::path>
  resolve_inside(const Session &s, const std::string &rel) const;

  SessionManager &sessions_;
  std::shared_ptr<Analyzer> analyzer_;
  std::vector<std::filesystem::path> search_roots_;
};

} // namespace gitagent
