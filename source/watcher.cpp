#include <gitagent/debounce.hpp>
#include <gitagent/watcher.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace gitagent {

struct DirectoryWatcher::State {
  Callback callback;
  std::unique_ptr<ChangeSource> source;
  std::unique_ptr<DebounceTimer> timer;

  std::atomic<bool> stop_requested{false};
  std::atomic<bool> loop_alive{false};
  std::atomic<bool> changed{false};
  std::atomic<size_t> callbacks{0};

  void invoke(bool notify) {
    if (callback) {
      try {
        callback();
      } catch (const std::exception &e) {
        spdlog::error("[watch] refresh callback failed: {}", e.what());
      } catch (...) {
        spdlog::error("[watch] refresh callback failed: unknown exception");
      }
    }
    callbacks.fetch_add(1);
    if (notify)
      changed.store(true);
  }
};

DirectoryWatcher::DirectoryWatcher(WatchOptions opts)
    : opts_(std::move(opts)), state_(std::make_shared<State>()) {}

DirectoryWatcher::~DirectoryWatcher() { stop(); }

std::shared_ptr<DirectoryWatcher::State> DirectoryWatcher::state() const {
  std::lock_guard<std::mutex> lk(state_m_);
  return state_;
}

bool DirectoryWatcher::start(const fs::path &root, Callback cb,
                             std::chrono::milliseconds debounce) {
  std::lock_guard<std::mutex> lk(lifecycle_m_);
  if (watching_)
    return true;

  root_ = root;
  auto state = this->state();
  auto &st = *state;
  st.callback = std::move(cb);
  st.stop_requested.store(false);
  st.source = opts_.make_source ? opts_.make_source(opts_.kind, opts_.source)
                                : make_change_source(opts_.kind, opts_.source);

  std::string err;
  if (!st.source || !st.source->open(root_, &err)) {
    spdlog::warn("[watch] cannot watch {} ({}): {}; falling back to polling",
                 root_.string(), to_string(opts_.kind), err);
    st.source.reset();
    st.invoke(false);
    return false;
  }

  State *raw = state.get();
  st.timer = std::make_unique<DebounceTimer>(debounce,
                                             [raw] { raw->invoke(true); });
  st.timer->start();

  std::promise<void> done;
  loop_done_ = done.get_future();
  st.loop_alive.store(true);
  loop_th_ = std::thread(&DirectoryWatcher::loop, state, std::move(done));
  watching_ = true;

  spdlog::info("[watch] watching {} (backend={}, debounce={}ms)",
               root_.string(), to_string(opts_.kind), debounce.count());

  st.invoke(false);
  return true;
}

void DirectoryWatcher::loop(std::shared_ptr<State> st,
                            std::promise<void> done) {
  while (!st->stop_requested.load()) {
    std::string err;
    auto r = st->source->wait(&err);
    if (r == WaitResult::Events) {
      st->timer->schedule();
      continue;
    }
    if (r == WaitResult::Cancelled || st->stop_requested.load())
      break;
    spdlog::warn("[watch] wait failed: {}; retrying", err);
    std::this_thread::sleep_for(100ms);
  }
  st->source->close();
  st->loop_alive.store(false);
  done.set_value();
}

void DirectoryWatcher::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_m_);
  if (!watching_)
    return;
  watching_ = false;

  auto state = this->state();
  auto &st = *state;
  st.stop_requested.store(true);
  st.source->cancel();

  bool abandoned = false;
  if (loop_th_.joinable()) {
    if (loop_done_.wait_for(opts_.join_timeout) == std::future_status::ready) {
      loop_th_.join();
    } else {
      spdlog::warn("[watch] loop for {} did not exit within {} ms; closing the "
                   "source and detaching",
                   root_.string(), opts_.join_timeout.count());
      st.source->close();
      loop_th_.detach();
      abandoned = true;
    }
  }

  st.timer->cancel();
  st.timer->stop();

  if (abandoned) {
    auto fresh = std::make_shared<State>();
    fresh->callbacks.store(st.callbacks.load());
    std::lock_guard<std::mutex> slk(state_m_);
    state_ = std::move(fresh);
  }
  spdlog::info("[watch] stopped {}", root_.string());
}

bool DirectoryWatcher::consume_change() {
  return state()->changed.exchange(false);
}

bool DirectoryWatcher::is_watching() const {
  return state()->loop_alive.load();
}

size_t DirectoryWatcher::callback_count() const {
  return state()->callbacks.load();
}

} // namespace gitagent
