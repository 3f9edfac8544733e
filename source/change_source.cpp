#include <gitagent/change_source.hpp>
#include <gitagent/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitagent {

const char *to_string(SourceKind k) {
  switch (k) {
  case SourceKind::Native: return "native";
  case SourceKind::Scan:   return "scan";
  }
  return "unknown";
}

const char *to_string(WaitResult r) {
  switch (r) {
  case WaitResult::Events:    return "events";
  case WaitResult::Cancelled: return "cancelled";
  case WaitResult::Error:     return "error";
  }
  return "unknown";
}

std::unique_ptr<ChangeSource> make_change_source(SourceKind kind,
                                                 SourceOptions opts) {
  switch (kind) {
  case SourceKind::Native:
    return std::make_unique<InotifySource>(std::move(opts));
  case SourceKind::Scan:
    return std::make_unique<ScanSource>(std::move(opts));
  }
  return nullptr;
}

static void set_err(std::string *err, std::string msg) {
  if (err)
    *err = std::move(msg);
}

// ---------------------------------------------------------------------------
// InotifySource

InotifySource::InotifySource(SourceOptions opts)
    : opts_(std::move(opts)),
      ignore_(opts_.ignore_dirs.begin(), opts_.ignore_dirs.end()) {}

InotifySource::~InotifySource() { close(); }

bool InotifySource::ignored(const fs::path &p) const {
  return ignore_.count(p.filename().string()) != 0;
}

bool InotifySource::add_watch(const fs::path &p) {
  std::error_code ec;
  if (!fs::is_directory(p, ec))
    return false;
  std::string key = p.lexically_normal().string();

  std::lock_guard<std::mutex> lk(watches_m_);
  if (inotify_fd_ < 0)
    return false;
  if (path_to_wd_.count(key))
    return true;

  int wd = ::inotify_add_watch(inotify_fd_, key.c_str(),
                               IN_CREATE | IN_MODIFY | IN_DELETE |
                                   IN_MOVED_FROM | IN_MOVED_TO |
                                   IN_CLOSE_WRITE | IN_ATTRIB | IN_ONLYDIR);
  if (wd < 0) {
    spdlog::warn("[watch] inotify_add_watch failed for {}: {}", key,
                 std::strerror(errno));
    return false;
  }
  wd_to_path_[wd] = key;
  path_to_wd_[key] = wd;
  spdlog::debug("[watch] watch added: {} (wd={})", key, wd);
  return true;
}

void InotifySource::remove_watch(const fs::path &p) {
  std::string key = p.lexically_normal().string();
  std::lock_guard<std::mutex> lk(watches_m_);
  auto it = path_to_wd_.find(key);
  if (it == path_to_wd_.end())
    return;
  int wd = it->second;
  if (inotify_fd_ >= 0)
    ::inotify_rm_watch(inotify_fd_, wd);
  wd_to_path_.erase(wd);
  path_to_wd_.erase(it);
  spdlog::debug("[watch] watch removed: {} (wd={})", key, wd);
}

void InotifySource::add_tree(const fs::path &root) {
  if (ignored(root) && root != root_)
    return;
  add_watch(root);
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(
           root, fs::directory_options::skip_permission_denied, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_directory(ec))
      continue;
    if (ignored(it->path())) {
      it.disable_recursion_pending();
      continue;
    }
    add_watch(it->path());
  }
  if (ec)
    spdlog::debug("[watch] tree walk under {} stopped: {}", root.string(),
                  ec.message());
}

fs::path InotifySource::base_for_wd(int wd) const {
  std::lock_guard<std::mutex> lk(watches_m_);
  auto it = wd_to_path_.find(wd);
  if (it == wd_to_path_.end())
    return root_;
  return it->second;
}

size_t InotifySource::watch_count() const {
  std::lock_guard<std::mutex> lk(watches_m_);
  return path_to_wd_.size();
}

bool InotifySource::is_open() const {
  std::lock_guard<std::mutex> lk(watches_m_);
  return inotify_fd_ >= 0;
}

bool InotifySource::open(const fs::path &root, std::string *err) {
  close();
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    set_err(err, fmt::format("not a directory: {}", root.string()));
    return false;
  }
  root_ = fs::absolute(root, ec).lexically_normal();
  if (ec)
    root_ = root;
  cancelled_.store(false);

  int ifd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (ifd < 0) {
    set_err(err, fmt::format("inotify_init1: {}", std::strerror(errno)));
    return false;
  }
  int efd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (efd < 0) {
    set_err(err, fmt::format("eventfd: {}", std::strerror(errno)));
    ::close(ifd);
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(watches_m_);
    inotify_fd_ = ifd;
    wake_fd_ = efd;
  }

  if (!add_watch(root_)) {
    set_err(err, fmt::format("cannot watch {}: {}", root_.string(),
                             std::strerror(errno)));
    close();
    return false;
  }
  add_tree(root_);

  spdlog::debug("[watch] inotify open on {} ({} directories)", root_.string(),
                watch_count());
  return true;
}

WaitResult InotifySource::wait(std::string *err) {
  alignas(inotify_event) std::array<char, 32 * 1024> buf{};

  for (;;) {
    if (cancelled_.load())
      return WaitResult::Cancelled;

    int ifd = -1;
    int efd = -1;
    {
      std::lock_guard<std::mutex> lk(watches_m_);
      ifd = inotify_fd_;
      efd = wake_fd_;
    }
    // close() from another thread counts as a cancel
    if (ifd < 0 || efd < 0)
      return WaitResult::Cancelled;

    pollfd fds[2] = {{ifd, POLLIN, 0}, {efd, POLLIN, 0}};
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      set_err(err, fmt::format("poll: {}", std::strerror(errno)));
      return WaitResult::Error;
    }
    if (cancelled_.load() || !is_open() || (fds[1].revents & POLLIN))
      return WaitResult::Cancelled;
    if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
      set_err(err, "inotify descriptor is no longer valid");
      return WaitResult::Error;
    }
    if (!(fds[0].revents & POLLIN))
      continue;

    ssize_t n = ::read(ifd, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        continue;
      set_err(err, fmt::format("inotify read: {}", std::strerror(errno)));
      return WaitResult::Error;
    }

    bool relevant = false;
    ssize_t off = 0;
    while (off < n) {
      auto *ev = reinterpret_cast<inotify_event *>(buf.data() + off);
      off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

      if (ev->mask & IN_Q_OVERFLOW) {
        spdlog::warn("[watch] inotify queue overflow, rescanning {}",
                     root_.string());
        add_tree(root_);
        relevant = true;
        continue;
      }
      if (ev->mask & IN_IGNORED) {
        std::lock_guard<std::mutex> lk(watches_m_);
        auto it = wd_to_path_.find(ev->wd);
        if (it != wd_to_path_.end()) {
          path_to_wd_.erase(it->second.string());
          wd_to_path_.erase(it);
        }
        continue;
      }

      fs::path base = base_for_wd(ev->wd);
      fs::path p = (ev->len && ev->name[0] != '\0') ? base / ev->name : base;
      bool is_dir = ev->mask & IN_ISDIR;
      if (is_dir && ev->len && ignore_.count(ev->name))
        continue;

      if (is_dir && (ev->mask & (IN_CREATE | IN_MOVED_TO)))
        add_tree(p);
      if (is_dir && (ev->mask & (IN_DELETE | IN_MOVED_FROM)))
        remove_watch(p);

      spdlog::trace("[watch] raw event mask={:#x} path={}", ev->mask,
                    p.string());
      relevant = true;
    }
    if (relevant)
      return WaitResult::Events;
  }
}

void InotifySource::release_watches() {
  if (inotify_fd_ >= 0) {
    for (auto &kv : wd_to_path_)
      ::inotify_rm_watch(inotify_fd_, kv.first);
  }
  wd_to_path_.clear();
  path_to_wd_.clear();
}

void InotifySource::cancel() {
  cancelled_.store(true);
  std::lock_guard<std::mutex> lk(watches_m_);
  if (wake_fd_ >= 0) {
    std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) != sizeof(one))
      spdlog::warn("[watch] eventfd wake failed: {}", std::strerror(errno));
  }
  // Removing every watch queues IN_IGNORED events, which also unblocks a
  // reader parked in poll() if the wake write did not get through.
  release_watches();
}

void InotifySource::close() {
  std::lock_guard<std::mutex> lk(watches_m_);
  release_watches();
  if (inotify_fd_ >= 0) {
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  if (wake_fd_ >= 0) {
    ::close(wake_fd_);
    wake_fd_ = -1;
  }
}

// ---------------------------------------------------------------------------
// ScanSource

ScanSource::ScanSource(SourceOptions opts)
    : opts_(std::move(opts)),
      ignore_(opts_.ignore_dirs.begin(), opts_.ignore_dirs.end()) {}

bool ScanSource::fingerprint(std::uint64_t &out, std::string *err) const {
  std::vector<std::string> entries;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(
           root_, fs::directory_options::skip_permission_denied, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code fec;
    if (it->is_directory(fec)) {
      if (ignore_.count(it->path().filename().string())) {
        it.disable_recursion_pending();
        continue;
      }
      entries.push_back(it->path().lexically_relative(root_).string() + "/");
      continue;
    }
    auto size = it->file_size(fec);
    if (fec)
      size = 0;
    auto mtime = it->last_write_time(fec);
    long long ticks = fec ? 0 : static_cast<long long>(mtime.time_since_epoch().count());
    entries.push_back(fmt::format("{}\t{}\t{}",
                                  it->path().lexically_relative(root_).string(),
                                  size, ticks));
  }
  if (ec) {
    set_err(err, fmt::format("scan of {} failed: {}", root_.string(),
                             ec.message()));
    return false;
  }
  std::sort(entries.begin(), entries.end());
  out = content_hash(entries);
  return true;
}

bool ScanSource::open(const fs::path &root, std::string *err) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    set_err(err, fmt::format("not a directory: {}", root.string()));
    return false;
  }
  root_ = root;
  {
    std::lock_guard<std::mutex> lk(m_);
    cancelled_ = false;
  }
  if (!fingerprint(last_, err))
    return false;
  open_.store(true);
  spdlog::debug("[watch] scan source open on {} (every {} ms)", root_.string(),
                opts_.scan_interval.count());
  return true;
}

WaitResult ScanSource::wait(std::string *err) {
  for (;;) {
    {
      std::unique_lock<std::mutex> lk(m_);
      if (cv_.wait_for(lk, opts_.scan_interval,
                       [&] { return cancelled_ || !open_.load(); }))
        return WaitResult::Cancelled;
    }
    std::uint64_t fp = 0;
    if (!fingerprint(fp, err))
      return WaitResult::Error;
    if (fp != last_) {
      last_ = fp;
      return WaitResult::Events;
    }
  }
}

void ScanSource::cancel() {
  {
    std::lock_guard<std::mutex> lk(m_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void ScanSource::close() {
  {
    std::lock_guard<std::mutex> lk(m_);
    open_.store(false);
  }
  cv_.notify_all();
}

bool ScanSource::is_open() const { return open_.load(); }

} // namespace gitagent
