#include <gitagent/session.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gitagent {

Session::Session(fs::path root, SessionOptions opts,
                 ScannerFactory make_scanner,
                 std::shared_ptr<FileLister> lister)
    : root_(std::move(root)), opts_(std::move(opts)), repo_(root_) {
  std::shared_ptr<StatusScanner> scanner =
      make_scanner ? make_scanner(repo_)
                   : std::make_shared<GitStatusScanner>(repo_);
  if (!lister)
    lister = std::make_shared<TreeLister>();

  opts_.watch.source.ignore_dirs.assign(opts_.ignore.begin(),
                                        opts_.ignore.end());
  cache_ = std::make_shared<ChangeCache>(root_, std::move(scanner),
                                         std::move(lister), opts_.ignore);
  watcher_ = std::make_unique<DirectoryWatcher>(opts_.watch);
  cache_->attach(watcher_.get());
}

Session::~Session() {
  stop();
  cache_->attach(nullptr);
}

bool Session::start() {
  auto cache = cache_;
  return watcher_->start(root_, [cache] { cache->refresh(); }, opts_.debounce);
}

void Session::stop() { watcher_->stop(); }

SessionManager::SessionManager(SessionOptions opts,
                               Session::ScannerFactory make_scanner)
    : opts_(std::move(opts)), make_scanner_(std::move(make_scanner)) {}

SessionManager::~SessionManager() { shutdown(); }

bool SessionManager::select(const fs::path &root, std::string *err) {
  std::error_code ec;
  if (root.empty() || !fs::is_directory(root, ec)) {
    if (err)
      *err = "Invalid path";
    return false;
  }
  fs::path abs = fs::absolute(root, ec);
  if (ec)
    abs = root;
  abs = abs.lexically_normal();

  std::lock_guard<std::mutex> sel(select_m_);
  std::shared_ptr<Session> old;
  {
    std::lock_guard<std::mutex> lk(m_);
    old = std::move(current_);
  }
  if (old) {
    spdlog::info("[session] closing {}", old->root().string());
    old->stop();
  }

  auto s = std::make_shared<Session>(abs, opts_, make_scanner_);
  if (!s->repo().is_repo())
    spdlog::warn("[session] {} is not a git working tree; status scans will "
                 "fail",
                 abs.string());
  bool live = s->start();
  spdlog::info("[session] selected {} ({})", abs.string(),
               live ? "watching" : "poll-only");
  {
    std::lock_guard<std::mutex> lk(m_);
    current_ = std::move(s);
  }
  return true;
}

std::shared_ptr<Session> SessionManager::current() const {
  std::lock_guard<std::mutex> lk(m_);
  return current_;
}

void SessionManager::shutdown() {
  std::lock_guard<std::mutex> sel(select_m_);
  std::shared_ptr<Session> old;
  {
    std::lock_guard<std::mutex> lk(m_);
    old = std::move(current_);
  }
  if (old)
    old->stop();
}

} // namespace gitagent
