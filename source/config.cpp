#include <gitagent/config.hpp>
#include <gitagent/util.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>

namespace gitagent {

void print_usage(const char *argv0) {
  fmt::print(
      "Usage:\n"
      "  {} [--addr 127.0.0.1] [--port 5000] [--repo DIR]\n"
      "     [--debounce-ms 200] [--backend native|scan] [--scan-interval-ms 500]\n"
      "     [--join-timeout-ms 2000] [--ignore-dir NAME ...]\n"
      "     [--repo-search DIR ...]\n"
      "     [--analyzer-cmd \"PROGRAM ARGS\"] [--workers 4]\n"
      "     [--log-file PATH] [--log-rotate-max BYTES] [--log-rotate-files N]\n"
      "     [--verbose] [--help] [--version]\n"
      "\n",
      argv0);
}

static bool to_int(std::string_view s, int &out) {
  if (s.empty())
    return false;
  int v = 0;
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || end != s.data() + s.size())
    return false;
  out = v;
  return true;
}

SessionOptions Config::session_options() const {
  SessionOptions o;
  o.debounce = std::chrono::milliseconds(debounce_ms);
  o.watch.kind = backend;
  o.watch.source.scan_interval = std::chrono::milliseconds(scan_interval_ms);
  o.watch.join_timeout = std::chrono::milliseconds(join_timeout_ms);
  if (!ignore_dirs.empty())
    o.ignore = IgnoreSet(ignore_dirs.begin(), ignore_dirs.end());
  return o;
}

ParseResult parse_cli(int argc, char **argv, const char *env_analyzer) {
  ParseResult r{};
  Config cfg;
  if (env_analyzer && *env_analyzer)
    cfg.analyzer_cmd = split_words(env_analyzer);

  auto int_arg = [&](int &i, const std::string &name, int lo,
                     int &dst) -> bool {
    if (i + 1 >= argc) {
      r.error = name + ": value required";
      return false;
    }
    int v = 0;
    if (!to_int(argv[++i], v) || v < lo) {
      r.error = fmt::format("{}: expected an integer >= {}, got '{}'", name,
                            lo, argv[i]);
      return false;
    }
    dst = v;
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool has = i + 1 < argc;
    if (a == "--addr" && has) {
      cfg.addr = argv[++i];
    } else if (a == "--port") {
      int p = 0;
      if (!int_arg(i, a, 1, p))
        return r;
      if (p > 65535) {
        r.error = "--port: out of range";
        return r;
      }
      cfg.port = static_cast<unsigned short>(p);
    } else if (a == "--repo" && has) {
      cfg.repo = std::filesystem::path(argv[++i]);
    } else if (a == "--debounce-ms") {
      if (!int_arg(i, a, 0, cfg.debounce_ms))
        return r;
    } else if (a == "--backend" && has) {
      std::string b = argv[++i];
      if (b == "native")
        cfg.backend = SourceKind::Native;
      else if (b == "scan")
        cfg.backend = SourceKind::Scan;
      else {
        r.error = "--backend: expected native or scan, got '" + b + "'";
        return r;
      }
    } else if (a == "--scan-interval-ms") {
      if (!int_arg(i, a, 10, cfg.scan_interval_ms))
        return r;
    } else if (a == "--join-timeout-ms") {
      if (!int_arg(i, a, 0, cfg.join_timeout_ms))
        return r;
    } else if (a == "--ignore-dir" && has) {
      cfg.ignore_dirs.push_back(argv[++i]);
    } else if (a == "--repo-search" && has) {
      cfg.repo_search.emplace_back(argv[++i]);
    } else if (a == "--analyzer-cmd" && has) {
      cfg.analyzer_cmd = split_words(argv[++i]);
    } else if (a == "--workers") {
      int w = 0;
      if (!int_arg(i, a, 1, w))
        return r;
      cfg.workers = static_cast<unsigned>(w);
    } else if (a == "--log-file" && has) {
      cfg.log_file = std::filesystem::path(argv[++i]);
    } else if (a == "--log-rotate-max") {
      int v = 0;
      if (!int_arg(i, a, 1, v))
        return r;
      cfg.log_rotate_max = static_cast<size_t>(v);
    } else if (a == "--log-rotate-files") {
      int v = 0;
      if (!int_arg(i, a, 1, v))
        return r;
      cfg.log_rotate_files = static_cast<size_t>(v);
    } else if (a == "--verbose" || a == "-v") {
      cfg.verbose = true;
    } else if (a == "--help" || a == "-h") {
      cfg.help = true;
    } else if (a == "--version") {
      cfg.version = true;
    } else {
      r.error = "unknown or incomplete argument: " + a;
      return r;
    }
  }

  if (!cfg.ignore_dirs.empty() &&
      std::find(cfg.ignore_dirs.begin(), cfg.ignore_dirs.end(), ".git") ==
          cfg.ignore_dirs.end())
    cfg.ignore_dirs.push_back(".git");

  r.cfg = std::move(cfg);
  return r;
}

} // namespace gitagent
