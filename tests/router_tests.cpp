#include <catch2/catch_all.hpp>
#include <gitagent/json.hpp>
#include <gitagent/router.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

using namespace gitagent;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static fs::path mkd(const std::string &name) {
  auto p = fs::temp_directory_path() / ("gitagent_router_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

namespace {

struct SharedScanner : StatusScanner {
  std::mutex m;
  std::string text;
  std::optional<std::string> scan(std::string *) override {
    std::lock_guard<std::mutex> lk(m);
    return text;
  }
};

struct FakeAnalyzer : Analyzer {
  int calls = 0;
  bool fail = false;
  std::string answer = R"(```json
{"summary": "changes detected", "dsl": "commit \"wip\""}
```)";
  std::string last_prompt;

  std::optional<std::string> complete(const std::string &prompt,
                                      std::string *err) override {
    calls++;
    last_prompt = prompt;
    if (fail) {
      *err = "analyzer exited with status 1";
      return std::nullopt;
    }
    return answer;
  }
};

struct Fixture {
  std::shared_ptr<SharedScanner> scanner = std::make_shared<SharedScanner>();
  std::shared_ptr<FakeAnalyzer> analyzer = std::make_shared<FakeAnalyzer>();
  SessionManager sessions;
  Router router;

  Fixture()
      : sessions(options(),
                 [this](const GitRepo &) { return scanner; }),
        router(sessions, analyzer) {}

  static SessionOptions options() {
    SessionOptions o;
    o.debounce = 100ms;
    return o;
  }

  Response call(const std::string &method, const std::string &path,
                const std::string &body = {}, const std::string &query = {}) {
    Request r;
    r.method = method;
    r.path = path;
    r.body = body;
    r.query = query;
    return router.handle(r);
  }

  void select(const fs::path &d) {
    auto resp = call("POST", "/api/set-repo",
                     "{\"path\":" + json_quote(d.string()) + "}");
    REQUIRE(resp.status == 200);
  }
};

} // namespace

TEST_CASE("routes answer 400 before a repository is chosen") {
  Fixture f;
  for (auto *p : {"/api/status", "/api/files", "/api/branch", "/api/file",
                  "/api/diff"})
    REQUIRE(f.call("GET", p).status == 400);
  auto r = f.call("POST", "/api/poll");
  REQUIRE(r.status == 400);
  REQUIRE(json_get_string(r.body, "error") == std::string("Repository not set"));
}

TEST_CASE("set-repo validates the path") {
  Fixture f;
  REQUIRE(f.call("POST", "/api/set-repo", "{}").status == 400);
  auto r = f.call("POST", "/api/set-repo", "{\"path\":\"/nonexistent/x\"}");
  REQUIRE(r.status == 400);
  REQUIRE(json_get_string(r.body, "error") == std::string("Invalid path"));

  auto d = mkd("setrepo");
  r = f.call("POST", "/api/set-repo", "{\"path\":" + json_quote(d.string()) + "}");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_string(r.body, "message") == std::string("Repository set"));
  REQUIRE(r.headers["Content-Type"] == "application/json");
}

TEST_CASE("poll reports the change protocol") {
  Fixture f;
  auto d = mkd("poll");
  f.select(d);

  auto r = f.call("POST", "/api/poll");
  REQUIRE(r.status == 200);
  REQUIRE(json_get_bool(r.body, "has_changed") == true);
  REQUIRE(json_get_string(r.body, "status") == std::string(""));
  // nothing to analyze on a clean tree
  REQUIRE(r.body.find("\"summary\":null") != std::string::npos);
  REQUIRE(r.body.find("\"dsl_suggestion\":null") != std::string::npos);

  r = f.call("POST", "/poll", "{\"force\":false}");
  REQUIRE(json_get_bool(r.body, "has_changed") == false);
  REQUIRE(json_get_bool(r.body, "files_changed") == false);
  REQUIRE(f.analyzer->calls == 0);

  {
    std::lock_guard<std::mutex> lk(f.scanner->m);
    f.scanner->text = " M a.txt";
  }
  r = f.call("POST", "/api/poll");
  REQUIRE(json_get_bool(r.body, "has_changed") == true);
  REQUIRE(json_get_string(r.body, "status") == std::string(" M a.txt"));
  REQUIRE(json_get_string(r.body, "summary") ==
          std::string("changes detected"));
  REQUIRE(f.analyzer->last_prompt.find(" M a.txt") != std::string::npos);
  REQUIRE(json_get_string(r.body, "dsl_suggestion") ==
          std::string("commit \"wip\""));
  REQUIRE(f.analyzer->calls == 1);

  r = f.call("POST", "/api/poll", "{\"force\":true}");
  REQUIRE(json_get_bool(r.body, "has_changed") == true);
  REQUIRE(f.analyzer->calls == 2);
}

TEST_CASE("analyzer failure becomes the summary") {
  Fixture f;
  f.analyzer->fail = true;
  f.scanner->text = "?? b.txt";
  f.select(mkd("fail"));
  auto r = f.call("POST", "/api/poll");
  REQUIRE(json_get_string(r.body, "summary") ==
          std::string("analyzer exited with status 1"));
  REQUIRE(r.body.find("\"dsl_suggestion\":null") != std::string::npos);
}

TEST_CASE("unparseable analyzer answers are reported as such") {
  Fixture f;
  f.analyzer->answer = "I think you changed some files.";
  f.scanner->text = "?? b.txt";
  f.select(mkd("garbled"));
  auto r = f.call("POST", "/api/poll");
  REQUIRE(json_get_string(r.body, "summary") ==
          std::string("Could not parse analyzer response."));
}

TEST_CASE("file routes stay inside the working tree") {
  Fixture f;
  auto d = mkd("files");
  fs::create_directories(d / "src");
  fs::create_directories(d / "node_modules" / "dep");
  std::ofstream(d / "node_modules" / "dep" / "x.js") << "x";
  f.select(d);

  auto w = f.call("POST", "/api/file",
                  "{\"path\":\"src/main.cpp\",\"content\":\"int main() {}\\n\"}");
  REQUIRE(w.status == 200);

  auto g = f.call("GET", "/api/file", {}, "path=src%2Fmain.cpp");
  REQUIRE(g.status == 200);
  REQUIRE(json_get_string(g.body, "content") == std::string("int main() {}\n"));

  auto l = f.call("GET", "/api/files");
  REQUIRE(l.status == 200);
  REQUIRE(l.body == "{\"files\":[\"src/main.cpp\"]}");

  REQUIRE(f.call("GET", "/api/file", {}, "path=../escape.txt").status == 400);
  REQUIRE(f.call("POST", "/api/file",
                 "{\"path\":\"../../escape.txt\",\"content\":\"x\"}")
              .status == 400);
  REQUIRE(f.call("GET", "/api/file", {}, "path=missing.txt").status == 404);
  REQUIRE(f.call("GET", "/api/file").status == 400);
  REQUIRE(f.call("POST", "/api/file", "{\"path\":\"a\"}").status == 400);
}

TEST_CASE("unknown routes are 404") {
  Fixture f;
  REQUIRE(f.call("GET", "/api/nope").status == 404);
  REQUIRE(f.call("GET", "/api/poll").status == 404);
}

TEST_CASE("preflight requests are answered") {
  Fixture f;
  auto r = f.call("OPTIONS", "/api/poll");
  REQUIRE(r.status == 204);
  REQUIRE(r.headers["Access-Control-Allow-Methods"] == "GET, POST, OPTIONS");
}
