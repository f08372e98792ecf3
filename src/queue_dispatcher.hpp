#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "log.hpp"
#include "runtime.hpp"

class TransferHandler;
class TransferQueue;

// Moves scheduled queue items into the transfer handler and records their
// outcome back in the queue.
class QueueDispatcher {
public:
  static constexpr std::chrono::milliseconds kPumpInterval{250};

  QueueDispatcher(Runtime& runtime, TransferQueue& queue, TransferHandler& transfer);
  ~QueueDispatcher();

  QueueDispatcher(const QueueDispatcher&) = delete;
  QueueDispatcher& operator=(const QueueDispatcher&) = delete;

  void start();
  void stop();

  // One scheduling round. Returns the number of transfers started.
  std::size_t pump();

  // Queue operations that also reach a running transfer.
  void cancel(const std::string& queue_id);
  void pause(const std::string& queue_id);
  void resume(const std::string& queue_id);

  std::size_t running() const;

private:
  void reap_finished();

  Runtime& runtime_;
  TransferQueue& queue_;
  TransferHandler& transfer_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::string> running_; // queue_id -> transfer operation id
  std::shared_ptr<PeriodicTask> task_;
};
