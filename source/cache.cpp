#include <gitagent/cache.hpp>
#include <gitagent/util.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gitagent {

ChangeCache::ChangeCache(fs::path root, std::shared_ptr<StatusScanner> status,
                         std::shared_ptr<FileLister> lister, IgnoreSet ignore)
    : root_(std::move(root)), status_scanner_(std::move(status)),
      lister_(std::move(lister)), ignore_(std::move(ignore)) {}

void ChangeCache::attach(ChangeSignal *signal) {
  std::lock_guard<std::mutex> lk(m_);
  signal_ = signal;
}

bool ChangeCache::update_status_locked() {
  std::string err;
  auto out = status_scanner_->scan(&err);
  if (!out) {
    spdlog::warn("[cache] status scan of {} unavailable: {}; keeping {} "
                 "snapshot",
                 root_.string(), trim(err), status_ ? "previous" : "no");
    return false;
  }
  StatusSnapshot snap;
  snap.text = trim_right(*out);
  snap.hash = content_hash(snap.text);
  status_ = std::move(snap);
  return true;
}

bool ChangeCache::update_files_locked() {
  std::string err;
  auto files = lister_->list_files(root_, ignore_, &err);
  if (!files) {
    spdlog::warn("[cache] file listing of {} unavailable: {}", root_.string(),
                 err);
    return false;
  }
  FileListSnapshot snap;
  snap.hash = content_hash(*files);
  snap.paths = std::move(*files);
  files_ = std::move(snap);
  return true;
}

bool ChangeCache::update_status() {
  std::lock_guard<std::mutex> lk(m_);
  return update_status_locked();
}

bool ChangeCache::update_files() {
  std::lock_guard<std::mutex> lk(m_);
  return update_files_locked();
}

void ChangeCache::refresh() {
  std::lock_guard<std::mutex> lk(m_);
  update_status_locked();
  update_files_locked();
}

PollDecision ChangeCache::poll(bool force) {
  std::lock_guard<std::mutex> lk(m_);
  PollDecision d;

  bool watcher_triggered = signal_ ? signal_->consume_change() : false;
  bool scanned = false;
  if (force) {
    update_status_locked();
    scanned = true;
    watcher_triggered = true;
  }

  if (!(watcher_triggered && status_) && !scanned)
    update_status_locked();

  bool status_changed = false;
  if (status_) {
    std::uint64_t current = status_->hash;
    status_changed = !last_status_hash_ || current != *last_status_hash_;
    last_status_hash_ = current;
    d.status = status_->text;
  }
  d.has_changed = watcher_triggered || status_changed;

  if (watcher_triggered || !files_)
    update_files_locked();
  if (files_) {
    std::uint64_t current = files_->hash;
    d.files_changed = !last_files_hash_ || current != *last_files_hash_;
    last_files_hash_ = current;
  }

  d.should_analyze = (d.has_changed || force) && !trim(d.status).empty();

  spdlog::debug("[cache] poll force={} triggered={} changed={} files_changed={}",
                force, watcher_triggered, d.has_changed, d.files_changed);
  return d;
}

std::optional<StatusSnapshot> ChangeCache::status_snapshot() const {
  std::lock_guard<std::mutex> lk(m_);
  return status_;
}

std::optional<FileListSnapshot> ChangeCache::files_snapshot() const {
  std::lock_guard<std::mutex> lk(m_);
  return files_;
}

} // namespace gitagent
