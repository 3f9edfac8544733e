#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gitagent {

enum class SourceKind {
  Native,
  Scan,
};

enum class WaitResult {
  Events,
  Cancelled,
  Error,
};

const char *to_string(SourceKind k);
const char *to_string(WaitResult r);

struct SourceOptions {
  // Directory names whose subtrees are never watched or fingerprinted.
  std::vector<std::string> ignore_dirs{".git"};
  std::chrono::milliseconds scan_interval{500};
};

// Source of raw "something under root changed" notifications.
//
// open() runs on the owner's thread and wait() on the watcher's loop thread.
// cancel() may be called from any thread and makes the current and every
// later wait() return Cancelled. close() releases the OS handles; it is
// normally called by the loop thread on exit, but the owner also calls it
// when the loop does not exit in time, so it must tolerate a concurrent
// wait(), which then returns Cancelled at its next wakeup.
class ChangeSource {
public:
  virtual ~ChangeSource() = default;

  virtual bool open(const std::filesystem::path &root, std::string *err) = 0;
  virtual WaitResult wait(std::string *err) = 0;
  virtual void cancel() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

std::unique_ptr<ChangeSource> make_change_source(SourceKind kind,
                                                 SourceOptions opts);

class InotifySource : public ChangeSource {
public:
  explicit InotifySource(SourceOptions opts);
  ~InotifySource() override;

  InotifySource(const InotifySource &) = delete;
  InotifySource &operator=(const InotifySource &) = delete;

  bool open(const std::filesystem::path &root, std::string *err) override;
  WaitResult wait(std::string *err) override;
  void cancel() override;
  void close() override;
  bool is_open() const override;

  size_t watch_count() const;

private:
  bool add_watch(const std::filesystem::path &p);
  void remove_watch(const std::filesystem::path &p);
  void add_tree(const std::filesystem::path &root);
  void release_watches();
  bool ignored(const std::filesystem::path &p) const;
  std::filesystem::path base_for_wd(int wd) const;

  SourceOptions opts_;
  std::unordered_set<std::string> ignore_;
  std::filesystem::path root_;
  int inotify_fd_{-1};
  int wake_fd_{-1};
  std::atomic<bool> cancelled_{false};

  mutable std::mutex watches_m_;
  std::unordered_map<int, std::filesystem::path> wd_to_path_;
  std::unordered_map<std::string, int> path_to_wd_;
};

// Timed re-scan fallback: fingerprints the tree every scan_interval.
class ScanSource : public ChangeSource {
public:
  explicit ScanSource(SourceOptions opts);

  bool open(const std::filesystem::path &root, std::string *err) override;
  WaitResult wait(std::string *err) override;
  void cancel() override;
  void close() override;
  bool is_open() const override;

private:
  bool fingerprint(std::uint64_t &out, std::string *err) const;

  SourceOptions opts_;
  std::unordered_set<std::string> ignore_;
  std::filesystem::path root_;
  std::uint64_t last_{0};
  std::atomic<bool> open_{false};

  std::mutex m_;
  std::condition_variable cv_;
  bool cancelled_{false};
};

} // namespace gitagent
