#include <catch2/catch_all.hpp>
#include <gitagent/session.hpp>
#include <gitagent/util.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using namespace gitagent;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static fs::path mkd(const std::string &name) {
  auto p = fs::temp_directory_path() / ("gitagent_session_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

namespace {

struct FixedScanner : StatusScanner {
  std::optional<std::string> scan(std::string *) override { return ""; }
};

SessionOptions fast_options() {
  SessionOptions o;
  o.debounce = 100ms;
  o.watch.join_timeout = 1000ms;
  return o;
}

Session::ScannerFactory fixed_scanner() {
  return [](const GitRepo &) { return std::make_shared<FixedScanner>(); };
}

} // namespace

TEST_CASE("select rejects paths that are not directories") {
  SessionManager m(fast_options(), fixed_scanner());
  std::string err;
  REQUIRE_FALSE(m.select("/nonexistent/gitagent/repo", &err));
  REQUIRE(err == "Invalid path");
  REQUIRE_FALSE(m.select("", &err));
  REQUIRE(m.current() == nullptr);
}

TEST_CASE("select primes the cache and watches the tree") {
  auto d = mkd("prime");
  std::ofstream(d / "a.txt") << "1";
  SessionManager m(fast_options(), fixed_scanner());
  std::string err;
  REQUIRE(m.select(d, &err));

  auto s = m.current();
  REQUIRE(s != nullptr);
  REQUIRE(s->root() == d.lexically_normal());
  REQUIRE(s->watcher().is_watching());
  auto files = s->cache().files_snapshot();
  REQUIRE(files.has_value());
  REQUIRE(files->paths == std::vector<std::string>{"a.txt"});
}

TEST_CASE("reselection stops the previous watcher first") {
  auto a = mkd("first");
  auto b = mkd("second");
  SessionManager m(fast_options(), fixed_scanner());
  std::string err;
  REQUIRE(m.select(a, &err));
  auto old = m.current();
  REQUIRE(old->watcher().is_watching());

  REQUIRE(m.select(b, &err));
  REQUIRE_FALSE(old->watcher().is_watching());
  REQUIRE(m.current()->root() == b.lexically_normal());
  REQUIRE(m.current()->watcher().is_watching());

  // edits in the abandoned tree no longer reach anyone
  std::ofstream(a / "late.txt") << "x";
  std::this_thread::sleep_for(300ms);
  REQUIRE_FALSE(old->watcher().consume_change());
  REQUIRE(old->watcher().callback_count() == 1);

  m.shutdown();
  REQUIRE(m.current() == nullptr);
}

TEST_CASE("git working tree end to end") {
  auto d = mkd("git");
  auto init = run_command({"git", "init", "-q"}, d);
  REQUIRE(init.exit_code == 0);

  SessionManager m(fast_options());
  std::string err;
  REQUIRE(m.select(d, &err));
  auto s = m.current();

  auto first = s->cache().poll(false);
  REQUIRE(first.has_changed);
  REQUIRE(first.status.empty());

  auto quiet = s->cache().poll(false);
  REQUIRE_FALSE(quiet.has_changed);
  REQUIRE_FALSE(quiet.files_changed);
  REQUIRE(quiet.status.empty());

  std::ofstream(d / "a.txt") << "hello\n";
  std::this_thread::sleep_for(600ms);

  auto d1 = s->cache().poll(false);
  REQUIRE(d1.has_changed);
  REQUIRE(d1.files_changed);
  REQUIRE(d1.status == "?? a.txt");
  REQUIRE(d1.should_analyze);

  auto d2 = s->cache().poll(false);
  REQUIRE_FALSE(d2.has_changed);
  REQUIRE(d2.status == "?? a.txt");
}
