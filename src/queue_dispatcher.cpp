#include "queue_dispatcher.hpp"

#include <vector>

#include "errors.hpp"
#include "transfer_handler.hpp"
#include "transfer_queue.hpp"

QueueDispatcher::QueueDispatcher(Runtime& runtime, TransferQueue& queue, TransferHandler& transfer)
  : runtime_(runtime),
    queue_(queue),
    transfer_(transfer),
    logger_(component_logger("queue")) {}

QueueDispatcher::~QueueDispatcher() {
  stop();
}

void QueueDispatcher::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(task_) return;
  task_ = runtime_.every(kPumpInterval, [this]{
    try {
      pump();
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Queue dispatch failed: {}", e.what());
    }
  });
}

void QueueDispatcher::stop() {
  std::shared_ptr<PeriodicTask> task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task = std::move(task_);
  }
  if(task) task->cancel();
}

void QueueDispatcher::reap_finished() {
  std::vector<std::pair<std::string, std::string>> tracked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked.assign(running_.begin(), running_.end());
  }
  for(const auto& entry : tracked) {
    const auto& queue_id = entry.first;
    auto item = queue_.get(queue_id);
    auto status = transfer_.get_operation_status(entry.second);
    if(item && !is_terminal(item->state)) {
      if(!status) {
        queue_.mark_failed(queue_id, "transfer record lost");
      } else if(!status->state.is_terminal()) {
        continue;
      } else if(status->state.kind == OperationState::Kind::Completed) {
        queue_.mark_completed(queue_id);
      } else if(status->state.kind == OperationState::Kind::Failed) {
        queue_.mark_failed(queue_id, status->state.message);
      } else {
        queue_.cancel(queue_id);
      }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(queue_id);
  }
}

std::size_t QueueDispatcher::pump() {
  reap_finished();
  std::size_t started = 0;
  while(auto item = queue_.schedule_next_transfer()) {
    SendRequest request;
    request.files = item->request.files;
    request.peer = item->request.peer;
    request.compression = item->request.compression;
    request.encryption = item->request.encryption;
    try {
      auto handle = transfer_.send(request);
      try {
        queue_.mark_running(item->queue_id, handle.operation_id);
      } catch(const KizunaError& e) {
        log_warn(logger_.get(), "Queued transfer {} changed while starting: {}", item->queue_id, e.what());
        transfer_.cancel_operation(handle.operation_id);
        continue;
      }
      std::lock_guard<std::mutex> lock(mutex_);
      running_[item->queue_id] = handle.operation_id;
      ++started;
      log_info(logger_.get(), "Started queued transfer {} as {}", item->queue_id, handle.operation_id);
    } catch(const KizunaError& e) {
      log_warn(logger_.get(), "Queued transfer {} failed to start: {}", item->queue_id, e.what());
      queue_.mark_failed(item->queue_id, e.what());
    }
  }
  return started;
}

void QueueDispatcher::cancel(const std::string& queue_id) {
  queue_.cancel(queue_id);
  std::string transfer_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(queue_id);
    if(it == running_.end()) return;
    transfer_id = it->second;
    running_.erase(it);
  }
  transfer_.cancel_operation(transfer_id);
}

void QueueDispatcher::pause(const std::string& queue_id) {
  queue_.pause(queue_id);
  std::string transfer_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(queue_id);
    if(it == running_.end()) return;
    transfer_id = it->second;
  }
  transfer_.pause_operation(transfer_id);
}

void QueueDispatcher::resume(const std::string& queue_id) {
  std::string transfer_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(queue_id);
    if(it != running_.end()) transfer_id = it->second;
  }
  if(transfer_id.empty()) {
    queue_.resume(queue_id);
    return;
  }
  transfer_.resume_operation(transfer_id);
  queue_.resume_running(queue_id);
}

std::size_t QueueDispatcher::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_.size();
}
