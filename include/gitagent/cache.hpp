#pragma once
#include <gitagent/scanner.hpp>
#include <gitagent/watcher.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gitagent {

struct StatusSnapshot {
  std::string text;
  std::uint64_t hash = 0;
};

struct FileListSnapshot {
  std::vector<std::string> paths;
  std::uint64_t hash = 0;
};

struct PollDecision {
  bool has_changed = false;
  bool files_changed = false;
  std::string status;
  // Whether downstream analysis of `status` is worth running.
  bool should_analyze = false;
};

// Latest status / file-list snapshots of one working tree plus the cursors
// that track what the poller has already been told. Every member is guarded
// by one mutex; refresh() from the watcher and poll() from request threads
// are serialized.
class ChangeCache {
public:
  ChangeCache(std::filesystem::path root, std::shared_ptr<StatusScanner> status,
              std::shared_ptr<FileLister> lister, IgnoreSet ignore);

  ChangeCache(const ChangeCache &) = delete;
  ChangeCache &operator=(const ChangeCache &) = delete;

  void attach(ChangeSignal *signal);

  bool update_status();
  bool update_files();
  // Watcher callback: status, then file list.
  void refresh();

  PollDecision poll(bool force);

  std::optional<StatusSnapshot> status_snapshot() const;
  std::optional<FileListSnapshot> files_snapshot() const;

  const std::filesystem::path &root() const { return root_; }
  const IgnoreSet &ignore() const { return ignore_; }

private:
  bool update_status_locked();
  bool update_files_locked();

  std::filesystem::path root_;
  std::shared_ptr<StatusScanner> status_scanner_;
  std::shared_ptr<FileLister> lister_;
  IgnoreSet ignore_;

  mutable std::mutex m_;
  ChangeSignal *signal_ = nullptr;
  std::optional<StatusSnapshot> status_;
  std::optional<FileListSnapshot> files_;
  std::optional<std::uint64_t> last_status_hash_;
  std::optional<std::uint64_t> last_files_hash_;
};

} // namespace gitagent
