#pragma once
#include <gitagent/cache.hpp>
#include <gitagent/git.hpp>
#include <gitagent/scanner.hpp>
#include <gitagent/watcher.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace gitagent {

struct SessionOptions {
  WatchOptions watch;
  std::chrono::milliseconds debounce{200};
  IgnoreSet ignore = default_ignore_dirs();
};

// One selected working tree: its watcher and the cache the watcher feeds.
class Session {
public:
  using ScannerFactory =
      std::function<std::shared_ptr<StatusScanner>(const GitRepo &)>;

  Session(std::filesystem::path root, SessionOptions opts,
          ScannerFactory make_scanner = {},
          std::shared_ptr<FileLister> lister = {});
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Primes the cache and starts watching. Returns whether a live watch runs.
  bool start();
  void stop();

  const std::filesystem::path &root() const { return root_; }
  GitRepo &repo() { return repo_; }
  ChangeCache &cache() { return *cache_; }
  DirectoryWatcher &watcher() { return *watcher_; }

private:
  std::filesystem::path root_;
  SessionOptions opts_;
  GitRepo repo_;
  std::shared_ptr<ChangeCache> cache_;
  std::unique_ptr<DirectoryWatcher> watcher_;
};

// Holds the single active session and replaces it on reselection: the old
// watcher is stopped before the new one starts.
class SessionManager {
public:
  explicit SessionManager(SessionOptions opts,
                          Session::ScannerFactory make_scanner = {});
  ~SessionManager();

  SessionManager(const SessionManager &) = delete;
  SessionManager &operator=(const SessionManager &) = delete;

  bool select(const std::filesystem::path &root, std::string *err);
  std::shared_ptr<Session> current() const;
  void shutdown();

private:
  SessionOptions opts_;
  Session::ScannerFactory make_scanner_;

  std::mutex select_m_;
  mutable std::mutex m_;
  std::shared_ptr<Session> current_;
};

} // namespace gitagent
