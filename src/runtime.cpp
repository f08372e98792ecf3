#include "runtime.hpp"

#include <csignal>

#include "log.hpp"

Runtime::Runtime(std::size_t worker_count)
  : worker_count_(worker_count == 0 ? 1 : worker_count) {}

Runtime::~Runtime() {
  stop();
}

void Runtime::start() {
  if(running_.exchange(true)) return;
  work_.emplace(asio::make_work_guard(io_));
  workers_.reserve(worker_count_);
  for(std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this](){
      for(;;) {
        try {
          io_.run();
          break;
        } catch(const std::exception& e) {
          log_error(component_logger("runtime").get(), "Unhandled exception in worker: {}", e.what());
        }
      }
    });
  }
}

void Runtime::stop() {
  if(!running_.exchange(false)) return;
  work_.reset();
  io_.stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();
  io_.restart();
}

std::shared_ptr<PeriodicTask> Runtime::every(std::chrono::milliseconds interval,
                                             std::function<void()> fn) {
  auto task = std::make_shared<PeriodicTask>(io_, interval, std::move(fn));
  task->start();
  return task;
}

PeriodicTask::PeriodicTask(asio::io_context& io,
                           std::chrono::milliseconds interval,
                           std::function<void()> fn)
  : strand_(asio::make_strand(io)),
    timer_(strand_),
    interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(20)),
    fn_(std::move(fn)) {}

void PeriodicTask::start() {
  auto self = shared_from_this();
  asio::post(strand_, [self](){ self->schedule_tick(); });
}

void PeriodicTask::schedule_tick() {
  if(cancelled_) return;
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const std::error_code& ec){
    if(ec) return;
    {
      std::lock_guard<std::recursive_mutex> lock(self->run_mutex_);
      if(self->cancelled_) return;
      try {
        if(self->fn_) self->fn_();
      } catch(const std::exception& e) {
        log_error(component_logger("runtime").get(), "Periodic task failed: {}", e.what());
      }
    }
    self->schedule_tick();
  });
}

void PeriodicTask::cancel() {
  if(cancelled_.exchange(true)) return;
  // Waits out a tick in progress.
  { std::lock_guard<std::recursive_mutex> lock(run_mutex_); }
  auto self = shared_from_this();
  asio::post(strand_, [self](){
    self->timer_.cancel();
  });
}

InterruptSignal::InterruptSignal(Runtime& runtime)
  : signals_(runtime.io(), SIGINT, SIGTERM) {
  signals_.async_wait([this](const std::error_code& ec, int){
    if(ec) return;
    trigger();
  });
}

InterruptSignal::~InterruptSignal() {
  std::error_code ec;
  signals_.cancel(ec);
}

void InterruptSignal::trigger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = true;
  }
  cv_.notify_all();
}

bool InterruptSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]{ return triggered_.load(); });
  return triggered_.load();
}
