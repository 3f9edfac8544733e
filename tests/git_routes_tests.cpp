#include <catch2/catch_all.hpp>
#include <gitagent/git.hpp>
#include <gitagent/json.hpp>
#include <gitagent/repos.hpp>
#include <gitagent/router.hpp>
#include <gitagent/util.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace gitagent;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static fs::path mkd(const std::string &name) {
  auto p = fs::temp_directory_path() / ("gitagent_gitroutes_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

static void git(const fs::path &d, std::vector<std::string> args) {
  args.insert(args.begin(), "git");
  auto r = run_command(args, d);
  INFO(r.err);
  REQUIRE(r.exit_code == 0);
}

static void write(const fs::path &p, const std::string &text) {
  std::ofstream f(p);
  f << text;
}

static std::string read(const fs::path &p) {
  std::ifstream in(p);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

// Working tree on branch main with one commit holding a.txt.
static fs::path make_repo(const std::string &name) {
  auto d = mkd(name);
  git(d, {"init", "-q"});
  git(d, {"symbolic-ref", "HEAD", "refs/heads/main"});
  git(d, {"config", "user.email", "agent@example.com"});
  git(d, {"config", "user.name", "Agent"});
  write(d / "a.txt", "one\n");
  git(d, {"add", "a.txt"});
  git(d, {"commit", "-q", "-m", "init"});
  return d;
}

namespace {

struct ChatAnalyzer : Analyzer {
  std::string answer;
  std::string last_prompt;
  std::optional<std::string> complete(const std::string &prompt,
                                      std::string *) override {
    last_prompt = prompt;
    return answer;
  }
};

struct Fixture {
  std::shared_ptr<ChatAnalyzer> analyzer = std::make_shared<ChatAnalyzer>();
  SessionManager sessions;
  Router router;

  explicit Fixture(std::vector<fs::path> roots = {})
      : sessions(options()), router(sessions, analyzer, std::move(roots)) {}

  static SessionOptions options() {
    SessionOptions o;
    o.debounce = 100ms;
    return o;
  }

  Response call(const std::string &method, const std::string &path,
                const std::string &body = {}) {
    Request r;
    r.method = method;
    r.path = path;
    r.body = body;
    return router.handle(r);
  }

  void select(const fs::path &d) {
    REQUIRE(call("POST", "/api/set-repo",
                 "{\"path\":" + json_quote(d.string()) + "}")
                .status == 200);
  }
};

} // namespace

TEST_CASE("commit stages everything and is counted") {
  auto d = make_repo("commit");
  Fixture f;
  f.select(d);

  REQUIRE(f.call("POST", "/api/commit", "{}").status == 400);
  REQUIRE(f.call("POST", "/api/commit", "{\"message\":\"  \"}").status == 400);

  write(d / "b.txt", "two\n");
  auto r = f.call("POST", "/api/commit", "{\"message\":\"add b\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "output")->find("add b") != std::string::npos);

  auto c = f.call("GET", "/api/commits");
  REQUIRE(c.status == 200);
  auto j = nlohmann::json::parse(c.body);
  REQUIRE(j["total"] == 2);
  // no upstream: everything is unpushed
  REQUIRE(j["unpushed"] == 2);
  REQUIRE(j["behind"] == 0);

  auto s = f.sessions.current();
  REQUIRE(trim(s->repo().status_porcelain().value_or("x")).empty());
}

TEST_CASE("commit counts of a repository without commits") {
  auto d = mkd("unborn");
  git(d, {"init", "-q"});
  Fixture f;
  f.select(d);
  auto j = nlohmann::json::parse(f.call("GET", "/api/commits").body);
  REQUIRE(j["total"] == 0);
  REQUIRE(j["unpushed"] == 0);
}

TEST_CASE("push and pull without a remote fail cleanly") {
  auto d = make_repo("noremote");
  Fixture f;
  f.select(d);
  auto r = f.call("POST", "/api/push");
  REQUIRE(r.status == 500);
  REQUIRE(json_get_string(r.body, "error") == std::string("Push failed"));
  REQUIRE(f.call("POST", "/api/pull").status == 500);
}

TEST_CASE("branches can be created, listed and switched") {
  auto d = make_repo("branches");
  Fixture f;
  f.select(d);

  auto r = f.call("POST", "/api/branch/create",
                  "{\"branch\":\"feature\",\"switch\":false}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "branch") == std::string("main"));
  REQUIRE(json_get_string(r.body, "created") == std::string("feature"));

  REQUIRE(f.call("POST", "/api/branch/create", "{\"branch\":\"feature\"}")
              .status == 400);
  REQUIRE(f.call("POST", "/api/branch/create", "{\"branch\":\"-f\"}").status ==
          400);
  REQUIRE(f.call("POST", "/api/branch/create", "{}").status == 400);

  auto l = nlohmann::json::parse(f.call("GET", "/api/branches").body);
  REQUIRE(l["current"] == "main");
  REQUIRE(l["local"] == nlohmann::json::array({"main", "feature"}));
  REQUIRE(l["remote"].empty());

  r = f.call("POST", "/api/branch/switch", "{\"branch\":\"feature\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "branch") == std::string("feature"));
  auto b = nlohmann::json::parse(f.call("GET", "/api/branch").body);
  REQUIRE(b["branch"] == "feature");

  r = f.call("POST", "/api/branch/switch", "{\"branch\":\"nope\"}");
  REQUIRE(r.status == 404);
  REQUIRE(json_get_string(r.body, "error") ==
          std::string("Branch 'nope' not found"));

  r = f.call("POST", "/api/branch/create", "{\"branch\":\"topic\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "branch") == std::string("topic"));
}

TEST_CASE("switching branches is seen by the next poll") {
  auto d = make_repo("switchpoll");
  git(d, {"checkout", "-q", "-b", "feature"});
  write(d / "only_on_feature.txt", "f\n");
  git(d, {"add", "."});
  git(d, {"commit", "-q", "-m", "feature file"});
  git(d, {"checkout", "-q", "main"});

  Fixture f;
  f.select(d);
  auto &cache = f.sessions.current()->cache();
  cache.poll(false);
  REQUIRE_FALSE(cache.poll(false).has_changed);

  REQUIRE(f.call("POST", "/api/branch/switch", "{\"branch\":\"feature\"}")
              .status == 200);
  std::this_thread::sleep_for(600ms);

  auto p = cache.poll(false);
  REQUIRE(p.has_changed);
  REQUIRE(p.files_changed);
  REQUIRE(p.status.empty());
  auto files = cache.files_snapshot();
  REQUIRE(files);
  REQUIRE(std::find(files->paths.begin(), files->paths.end(),
                    "only_on_feature.txt") != files->paths.end());
}

TEST_CASE("stage and unstage a file") {
  auto d = make_repo("stage");
  Fixture f;
  f.select(d);
  write(d / "a.txt", "changed\n");
  auto &repo = f.sessions.current()->repo();

  auto r = f.call("POST", "/api/file/stage", "{\"path\":\"a.txt\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "message") == std::string("Staged 'a.txt'"));
  REQUIRE(porcelain_code(*repo.status_porcelain(), "a.txt") ==
          std::string("M "));

  r = f.call("POST", "/api/file/unstage", "{\"path\":\"a.txt\"}");
  REQUIRE(r.status == 200);
  REQUIRE(porcelain_code(*repo.status_porcelain(), "a.txt") ==
          std::string(" M"));

  REQUIRE(f.call("POST", "/api/file/stage", "{}").status == 400);
  REQUIRE(f.call("POST", "/api/file/stage", "{\"path\":\"../x\"}").status ==
          400);
}

TEST_CASE("revert restores tracked files and removes new ones") {
  auto d = make_repo("revert");
  Fixture f;
  f.select(d);

  write(d / "a.txt", "edited\n");
  auto r = f.call("POST", "/api/file/revert", "{\"path\":\"a.txt\"}");
  REQUIRE(r.status == 200);
  REQUIRE(read(d / "a.txt") == "one\n");

  write(d / "scratch.txt", "tmp\n");
  r = f.call("POST", "/api/file/revert", "{\"path\":\"scratch.txt\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "message") ==
          std::string("Removed untracked file 'scratch.txt'"));
  REQUIRE_FALSE(fs::exists(d / "scratch.txt"));

  write(d / "staged.txt", "new\n");
  git(d, {"add", "staged.txt"});
  r = f.call("POST", "/api/file/revert", "{\"path\":\"staged.txt\"}");
  REQUIRE(r.status == 200);
  REQUIRE_FALSE(fs::exists(d / "staged.txt"));
  auto &repo = f.sessions.current()->repo();
  REQUIRE_FALSE(porcelain_code(*repo.status_porcelain(), "staged.txt"));

  REQUIRE(f.call("POST", "/api/file/revert", "{\"path\":\"missing.txt\"}")
              .status == 404);
}

TEST_CASE("chat passes status and log to the analyzer") {
  auto d = make_repo("chat");
  Fixture f;
  f.select(d);
  write(d / "b.txt", "x\n");

  REQUIRE(f.call("POST", "/api/chat", "{}").status == 400);

  f.analyzer->answer = R"({"response": "Commit it.", "dsl": "commit \"b\""})";
  auto r = f.call("POST", "/api/chat", "{\"message\":\"what now?\"}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "response") == std::string("Commit it."));
  REQUIRE(json_get_string(r.body, "dsl") == std::string("commit \"b\""));
  REQUIRE(f.analyzer->last_prompt.find("?? b.txt") != std::string::npos);
  REQUIRE(f.analyzer->last_prompt.find("init") != std::string::npos);
  REQUIRE(f.analyzer->last_prompt.find("what now?") != std::string::npos);

  f.analyzer->answer = "Nothing to do.";
  r = f.call("POST", "/api/chat", "{\"message\":\"hi\"}");
  REQUIRE(json_get_string(r.body, "response") == std::string("Nothing to do."));
  REQUIRE(r.body.find("\"dsl\":null") != std::string::npos);
}

TEST_CASE("repository discovery groups by GitHub owner") {
  auto root = mkd("search");
  for (auto *name : {"Zeta", "alpha", "beta"}) {
    fs::create_directories(root / name);
    git(root / name, {"init", "-q"});
  }
  git(root / "alpha",
      {"remote", "add", "origin", "git@github.com:acme/alpha.git"});
  git(root / "Zeta",
      {"remote", "add", "origin", "https://github.com/acme/Zeta.git"});
  fs::create_directories(root / ".hidden");
  git(root / ".hidden", {"init", "-q"});
  fs::create_directories(root / "group" / "deep" / "too_deep");
  git(root / "group" / "deep" / "too_deep", {"init", "-q"});

  Fixture f({root});
  auto r = f.call("GET", "/api/repos");
  REQUIRE(r.status == 200);
  auto j = nlohmann::json::parse(r.body);
  REQUIRE(j["repos"].size() == 3);
  REQUIRE(j["by_organization"]["acme"].size() == 2);
  REQUIRE(j["by_organization"]["acme"][0]["name"] == "alpha");
  REQUIRE(j["by_organization"]["acme"][1]["name"] == "Zeta");
  REQUIRE(j["by_organization"]["Other"][0]["name"] == "beta");
}

TEST_CASE("github owner parsing") {
  REQUIRE(github_owner("https://github.com/acme/tool.git") == "acme");
  REQUIRE(github_owner("git@github.com:someone/x") == "someone");
  REQUIRE(github_owner("https://gitlab.com/acme/tool.git").empty());
  REQUIRE(github_owner("https://github.com/acme").empty());
}

TEST_CASE("branch header parsing") {
  CommitCounts c;
  parse_branch_header("## main...origin/main [ahead 3, behind 2]", 10, c);
  REQUIRE(c.unpushed == 3);
  REQUIRE(c.behind == 2);
  parse_branch_header("## main...origin/main", 10, c);
  REQUIRE(c.unpushed == 0);
  REQUIRE(c.behind == 0);
  parse_branch_header("## main", 10, c);
  REQUIRE(c.unpushed == 10);
}
