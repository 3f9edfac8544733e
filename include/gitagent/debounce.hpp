#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace gitagent {

// Single-slot cancellable scheduler. schedule() replaces whatever deadline is
// pending with now + interval; the task runs on the timer thread once no
// schedule() arrived for a full interval. At most one deadline is ever live.
class DebounceTimer {
public:
  using Task = std::function<void()>;

  DebounceTimer(std::chrono::milliseconds interval, Task task);
  ~DebounceTimer();

  DebounceTimer(const DebounceTimer &) = delete;
  DebounceTimer &operator=(const DebounceTimer &) = delete;

  void start();
  void schedule();
  void cancel();
  // Drops the pending deadline and joins the timer thread. A task that is
  // already running finishes first.
  void stop();

  bool pending() const;
  std::chrono::milliseconds interval() const { return interval_; }

private:
  void run();

  std::chrono::milliseconds interval_;
  Task task_;

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  bool running_ = false;
  bool stopping_ = false;
  std::thread th_;
};

} // namespace gitagent
