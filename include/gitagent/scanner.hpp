#pragma once
#include <gitagent/git.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gitagent {

using IgnoreSet = std::unordered_set<std::string>;

// Directory names skipped by enumeration unless configured otherwise.
IgnoreSet default_ignore_dirs();

class StatusScanner {
public:
  virtual ~StatusScanner() = default;
  // Change listing of the working tree, "" when clean, nullopt when the
  // listing cannot be produced right now.
  virtual std::optional<std::string> scan(std::string *err) = 0;
};

class FileLister {
public:
  virtual ~FileLister() = default;
  // Paths relative to root, sorted; nullopt when enumeration failed.
  virtual std::optional<std::vector<std::string>>
  list_files(const std::filesystem::path &root, const IgnoreSet &ignore,
             std::string *err) = 0;
};

class GitStatusScanner : public StatusScanner {
public:
  explicit GitStatusScanner(GitRepo repo) : repo_(std::move(repo)) {}
  std::optional<std::string> scan(std::string *err) override;

private:
  GitRepo repo_;
};

class TreeLister : public FileLister {
public:
  std::optional<std::vector<std::string>>
  list_files(const std::filesystem::path &root, const IgnoreSet &ignore,
             std::string *err) override;
};

} // namespace gitagent
