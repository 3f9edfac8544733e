#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace gitagent {

struct RepoEntry {
  std::string name;
  std::filesystem::path path;
  // GitHub owner from the origin remote, "Other" when there is none.
  std::string organization;
};

// ~/Documents/GitHub, ~/Documents, ~/source, ~/repos and ~/Projects.
std::vector<std::filesystem::path>
default_search_roots(const std::filesystem::path &home);

// Owner part of a github.com remote URL (https or ssh form), "" otherwise.
std::string github_owner(const std::string &remote_url);

// Working trees found up to `max_depth` levels below each root. Hidden
// directories are skipped and nothing inside a working tree is searched.
// Sorted by organization, then by name, both case-insensitively.
std::vector<RepoEntry>
find_repositories(const std::vector<std::filesystem::path> &roots,
                  int max_depth = 2);

} // namespace gitagent
