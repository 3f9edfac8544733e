#include <gitagent/debounce.hpp>

#include <spdlog/spdlog.h>

namespace gitagent {

DebounceTimer::DebounceTimer(std::chrono::milliseconds interval, Task task)
    : interval_(interval), task_(std::move(task)) {}

DebounceTimer::~DebounceTimer() { stop(); }

void DebounceTimer::start() {
  std::lock_guard<std::mutex> lk(m_);
  if (running_)
    return;
  running_ = true;
  stopping_ = false;
  th_ = std::thread([this] { run(); });
}

void DebounceTimer::schedule() {
  {
    std::lock_guard<std::mutex> lk(m_);
    if (!running_ || stopping_)
      return;
    deadline_ = std::chrono::steady_clock::now() + interval_;
  }
  cv_.notify_all();
}

void DebounceTimer::cancel() {
  {
    std::lock_guard<std::mutex> lk(m_);
    deadline_.reset();
  }
  cv_.notify_all();
}

bool DebounceTimer::pending() const {
  std::lock_guard<std::mutex> lk(m_);
  return deadline_.has_value();
}

void DebounceTimer::stop() {
  {
    std::lock_guard<std::mutex> lk(m_);
    if (!running_)
      return;
    stopping_ = true;
    deadline_.reset();
  }
  cv_.notify_all();
  if (th_.joinable()) {
    if (th_.get_id() == std::this_thread::get_id()) {
      spdlog::warn("[watch] debounce timer stopped from its own task");
      th_.detach();
    } else {
      th_.join();
    }
  }
  std::lock_guard<std::mutex> lk(m_);
  running_ = false;
}

void DebounceTimer::run() {
  std::unique_lock<std::mutex> lk(m_);
  while (!stopping_) {
    if (!deadline_) {
      cv_.wait(lk, [&] { return stopping_ || deadline_.has_value(); });
      continue;
    }
    auto due = *deadline_;
    bool moved = cv_.wait_until(lk, due, [&] {
      return stopping_ || !deadline_ || *deadline_ != due;
    });
    if (moved)
      continue;

    deadline_.reset();
    lk.unlock();
    if (task_)
      task_();
    lk.lock();
  }
}

} // namespace gitagent
