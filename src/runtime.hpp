#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

class PeriodicTask;

// io_context plus a worker pool. Every handler, the queue dispatcher and the
// TUI actions run as handlers on this context.
class Runtime {
public:
  explicit Runtime(std::size_t worker_count = 4);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  asio::io_context& io() { return io_; }

  template<typename Fn>
  void post(Fn&& fn) {
    asio::post(io_, std::forward<Fn>(fn));
  }

  std::shared_ptr<PeriodicTask> every(std::chrono::milliseconds interval,
                                      std::function<void()> fn);

private:
  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> workers_;
  std::size_t worker_count_;
  std::atomic<bool> running_{false};
};

// Re-arming steady_timer. The callback never runs concurrently with itself.
class PeriodicTask : public std::enable_shared_from_this<PeriodicTask> {
public:
  PeriodicTask(asio::io_context& io,
               std::chrono::milliseconds interval,
               std::function<void()> fn);

  void start();
  // Blocks until a callback already running has returned; none starts after.
  // Safe to call from inside the callback.
  void cancel();
  bool cancelled() const { return cancelled_.load(); }

private:
  void schedule_tick();

  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  std::function<void()> fn_;
  std::atomic<bool> cancelled_{false};
  std::recursive_mutex run_mutex_;
};

// SIGINT/SIGTERM observer for long-running CLI modes.
class InterruptSignal {
public:
  explicit InterruptSignal(Runtime& runtime);
  ~InterruptSignal();

  bool triggered() const { return triggered_.load(); }
  void trigger();
  // Blocks up to timeout; true once interrupted.
  bool wait_for(std::chrono::milliseconds timeout);

private:
  asio::signal_set signals_;
  std::atomic<bool> triggered_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};
