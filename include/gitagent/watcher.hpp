#pragma once
#include <gitagent/change_source.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace gitagent {

// Consume-once "something changed" flag.
class ChangeSignal {
public:
  virtual ~ChangeSignal() = default;
  virtual bool consume_change() = 0;
};

struct WatchOptions {
  using SourceFactory =
      std::function<std::unique_ptr<ChangeSource>(SourceKind, SourceOptions)>;

  SourceKind kind = SourceKind::Native;
  SourceOptions source;
  std::chrono::milliseconds join_timeout{2000};
  // Defaults to make_change_source.
  SourceFactory make_source;
};

// Turns raw notifications for a directory tree into debounced refresh
// callbacks and an edge-triggered change flag.
class DirectoryWatcher : public ChangeSignal {
public:
  using Callback = std::function<void()>;

  explicit DirectoryWatcher(WatchOptions opts = {});
  ~DirectoryWatcher() override;

  DirectoryWatcher(const DirectoryWatcher &) = delete;
  DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

  // Returns true when a live watch is running. On false the callback has
  // still been invoked once so callers always start with a snapshot.
  bool start(const std::filesystem::path &root, Callback cb,
             std::chrono::milliseconds debounce);
  // Cancels the source and joins the loop thread for at most join_timeout.
  // On timeout the source is closed from here and the thread is detached.
  void stop();

  bool consume_change() override;

  bool is_watching() const;
  size_t callback_count() const;
  const std::filesystem::path &root() const { return root_; }

private:
  struct State;

  static void loop(std::shared_ptr<State> st, std::promise<void> done);

  std::shared_ptr<State> state() const;

  WatchOptions opts_;
  std::filesystem::path root_;

  // A loop thread that outlives its join timeout keeps the old State;
  // state_ is then replaced so the watcher can be started again.
  mutable std::mutex state_m_;
  std::shared_ptr<State> state_;

  std::mutex lifecycle_m_;
  std::thread loop_th_;
  std::future<void> loop_done_;
  bool watching_ = false;
};

} // namespace gitagent
