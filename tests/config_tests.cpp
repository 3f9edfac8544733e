#include <catch2/catch_all.hpp>
#include <gitagent/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace gitagent;

static ParseResult parse(std::vector<std::string> args,
                         const char *env = nullptr) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data(), env);
}

TEST_CASE("defaults") {
  auto r = parse({"gitagentd"});
  REQUIRE(r.cfg.has_value());
  REQUIRE(r.cfg->addr == "127.0.0.1");
  REQUIRE(r.cfg->port == 5000);
  REQUIRE(r.cfg->debounce_ms == 200);
  REQUIRE(r.cfg->backend == SourceKind::Native);
  REQUIRE(r.cfg->analyzer_cmd.empty());

  auto o = r.cfg->session_options();
  REQUIRE(o.debounce == std::chrono::milliseconds(200));
  REQUIRE(o.ignore.count(".git") == 1);
  REQUIRE(o.ignore.count("node_modules") == 1);
}

TEST_CASE("flags are applied") {
  auto r = parse({"gitagentd", "--port", "8081", "--repo", "/tmp/x",
                  "--debounce-ms", "50", "--backend", "scan",
                  "--ignore-dir", "build", "--analyzer-cmd", "llm --json",
                  "--workers", "2", "--verbose"});
  REQUIRE(r.error.empty());
  REQUIRE(r.cfg->port == 8081);
  REQUIRE(r.cfg->repo == std::filesystem::path("/tmp/x"));
  REQUIRE(r.cfg->backend == SourceKind::Scan);
  REQUIRE(r.cfg->analyzer_cmd == std::vector<std::string>{"llm", "--json"});
  REQUIRE(r.cfg->workers == 2);
  REQUIRE(r.cfg->verbose);

  auto o = r.cfg->session_options();
  REQUIRE(o.debounce == std::chrono::milliseconds(50));
  REQUIRE(o.watch.kind == SourceKind::Scan);
  // an explicit ignore list still never watches .git
  REQUIRE(o.ignore.count("build") == 1);
  REQUIRE(o.ignore.count(".git") == 1);
  REQUIRE(o.ignore.count("node_modules") == 0);
}

TEST_CASE("environment analyzer is overridden by the flag") {
  auto r = parse({"gitagentd"}, "wrap-llm  --fast");
  REQUIRE(r.cfg->analyzer_cmd == std::vector<std::string>{"wrap-llm", "--fast"});
  auto r2 = parse({"gitagentd", "--analyzer-cmd", "other"}, "wrap-llm");
  REQUIRE(r2.cfg->analyzer_cmd == std::vector<std::string>{"other"});
}

TEST_CASE("bad values are reported") {
  REQUIRE_FALSE(parse({"gitagentd", "--port", "http"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--port", "70000"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--debounce-ms", "-1"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--backend", "fanotify"}).cfg);
  auto r = parse({"gitagentd", "--bogus"});
  REQUIRE_FALSE(r.cfg);
  REQUIRE(r.error.find("--bogus") != std::string::npos);
}

TEST_CASE("out-of-range and partial numbers are rejected") {
  REQUIRE_FALSE(parse({"gitagentd", "--port", "99999999999999999999"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--workers", "4294967296"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--debounce-ms", "12abc"}).cfg);
  REQUIRE_FALSE(parse({"gitagentd", "--port", ""}).cfg);
  REQUIRE(parse({"gitagentd", "--port", "8080"}).cfg->port == 8080);
}

TEST_CASE("repository search roots accumulate") {
  auto r = parse({"gitagentd", "--repo-search", "/a", "--repo-search", "/b"});
  REQUIRE(r.cfg);
  REQUIRE(r.cfg->repo_search ==
          std::vector<std::filesystem::path>{"/a", "/b"});
}
