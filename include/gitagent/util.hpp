#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gitagent {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
};

CmdResult run_command(const std::vector<std::string> &argv,
                      const std::filesystem::path &cwd);

std::string trim(const std::string &s);
std::string trim_right(const std::string &s);

// XXH3-64 of the bytes of `s`.
std::uint64_t content_hash(const std::string &s);
// XXH3-64 over `items` joined with '\0'.
std::uint64_t content_hash(const std::vector<std::string> &items);

std::vector<std::string> split_words(const std::string &s);

} // namespace gitagent
