#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Multi-producer queue. A non-zero capacity makes it bounded; a full bounded
// channel drops its oldest entry to admit the newest.
template<typename T>
class Channel {
public:
  explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

  bool send(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(closed_) return false;
      if(capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  std::optional<T> try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if(queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]{ return !queue_.empty() || closed_; });
    if(queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::vector<T> drain(std::size_t max_items = 0) {
    std::vector<T> out;
    std::lock_guard<std::mutex> lock(mutex_);
    while(!queue_.empty() && (max_items == 0 || out.size() < max_items)) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return out;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  std::size_t capacity_ = 0;
  std::size_t dropped_ = 0;
  bool closed_ = false;
};

// One producer, many observers: every subscriber gets its own copy.
template<typename T>
class Broadcaster {
public:
  std::shared_ptr<Channel<T>> subscribe(std::size_t capacity = 0) {
    auto channel = std::make_shared<Channel<T>>(capacity);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(channel);
    return channel;
  }

  void publish(const T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto it = subscribers_.begin(); it != subscribers_.end();) {
      auto channel = it->lock();
      if(!channel || !channel->send(value)) {
        it = subscribers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto& weak : subscribers_) {
      if(auto channel = weak.lock()) channel->close();
    }
    subscribers_.clear();
  }

private:
  std::mutex mutex_;
  std::vector<std::weak_ptr<Channel<T>>> subscribers_;
};

class CountingSemaphore {
public:
  explicit CountingSemaphore(std::size_t permits) : permits_(permits) {}

  void acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]{ return permits_ > 0; });
    --permits_;
  }

  bool try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if(permits_ == 0) return false;
    --permits_;
    return true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++permits_;
    }
    cv_.notify_one();
  }

  std::size_t available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permits_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t permits_;
};

// Holds one permit for the lifetime of the guard.
class SemaphorePermit {
public:
  explicit SemaphorePermit(CountingSemaphore& semaphore) : semaphore_(semaphore) {
    semaphore_.acquire();
  }
  ~SemaphorePermit() { semaphore_.release(); }
  SemaphorePermit(const SemaphorePermit&) = delete;
  SemaphorePermit& operator=(const SemaphorePermit&) = delete;

private:
  CountingSemaphore& semaphore_;
};
