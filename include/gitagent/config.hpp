#pragma once
#include <gitagent/session.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitagent {

struct Config {
  std::string addr = "127.0.0.1";
  unsigned short port = 5000;
  std::optional<std::filesystem::path> repo;

  int debounce_ms = 200;
  SourceKind backend = SourceKind::Native;
  int scan_interval_ms = 500;
  int join_timeout_ms = 2000;
  std::vector<std::string> ignore_dirs;

  // Directories searched by /api/repos; empty means the defaults under $HOME.
  std::vector<std::filesystem::path> repo_search;

  std::vector<std::string> analyzer_cmd;
  unsigned workers = 4;

  std::optional<std::filesystem::path> log_file;
  size_t log_rotate_max = 10 * 1024 * 1024;
  size_t log_rotate_files = 3;
  bool verbose = false;

  bool help = false;
  bool version = false;

  SessionOptions session_options() const;
};

struct ParseResult {
  std::optional<Config> cfg;
  std::string error;
};

// `env_analyzer` is the value of GITAGENT_ANALYZER_CMD, if set; the flag wins.
ParseResult parse_cli(int argc, char **argv,
                      const char *env_analyzer = nullptr);

void print_usage(const char *argv0);

} // namespace gitagent
