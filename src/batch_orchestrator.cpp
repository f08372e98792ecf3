#include "batch_orchestrator.hpp"

#include <algorithm>
#include <iterator>

#include "channel.hpp"
#include "errors.hpp"
#include "transfer_handler.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{200};

KizunaError batch_not_found(const std::string& batch_id) {
  return KizunaError::integration(IntegrationDomain::BatchOperation, "Batch " + batch_id + " not found");
}

} // namespace

void to_json(nlohmann::json& j, const BatchOperationItem& item) {
  j = nlohmann::json{
    {"operation_id", item.operation_id},
    {"file", item.file.string()},
    {"peer", item.peer},
    {"status", describe(item.state)},
  };
  j["error"] = item.error ? nlohmann::json(*item.error) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const BatchResult& result) {
  j = nlohmann::json{
    {"batch_id", result.batch_id},
    {"total_operations", result.total_operations},
    {"successful", result.successful},
    {"failed", result.failed},
    {"cancelled", result.cancelled},
    {"operations", result.operations},
  };
}

BatchOrchestrator::BatchOrchestrator(TransferHandler& transfer, std::chrono::milliseconds retention)
  : transfer_(transfer),
    retention_(retention),
    logger_(component_logger("batch")) {}

BatchOrchestrator::~BatchOrchestrator() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto& entry : batches_) entry.second->cancel_requested = true;
    workers.swap(background_);
  }
  for(auto& worker : workers) {
    if(worker.thread.joinable()) worker.thread.join();
  }
}

void BatchOrchestrator::reap() {
  std::vector<Worker> done;
  auto now = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto finished = [](const std::shared_ptr<Batch>& batch){
      std::lock_guard<std::mutex> batch_lock(batch->mutex);
      return batch->finished;
    };
    for(auto it = background_.begin(); it != background_.end();) {
      if(finished(it->batch)) {
        done.push_back(std::move(*it));
        it = background_.erase(it);
      } else {
        ++it;
      }
    }
    for(auto it = batches_.begin(); it != batches_.end();) {
      bool expired = false;
      {
        std::lock_guard<std::mutex> batch_lock(it->second->mutex);
        expired = it->second->finished && it->second->status.completed_at &&
                  now - *it->second->status.completed_at >= retention_;
      }
      it = expired ? batches_.erase(it) : std::next(it);
    }
  }
  // finish() has already run, so these joins return promptly.
  for(auto& worker : done) {
    if(worker.thread.joinable()) worker.thread.join();
  }
}

std::size_t BatchOrchestrator::tracked_batches() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_.size();
}

std::size_t BatchOrchestrator::background_threads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return background_.size();
}

std::size_t BatchOrchestrator::effective_concurrency(const BatchRequest& request) {
  if(!request.parallel) return 1;
  if(!request.max_concurrent || *request.max_concurrent == 0) return kDefaultConcurrency;
  return *request.max_concurrent;
}

std::shared_ptr<BatchOrchestrator::Batch> BatchOrchestrator::create_batch(const BatchRequest& request) {
  auto batch = std::make_shared<Batch>();
  batch->status.batch_id = new_uuid();
  batch->status.started_at = std::chrono::system_clock::now();
  for(const auto& file : request.files) {
    for(const auto& peer : request.peers) {
      BatchOperationItem item;
      item.operation_id = new_uuid();
      item.file = file;
      item.peer = peer;
      item.state = OperationState::starting();
      batch->status.operations.push_back(std::move(item));
    }
  }
  if(batch->status.operations.empty()) {
    batch->status.completed_at = batch->status.started_at;
    batch->finished = true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  batches_[batch->status.batch_id] = batch;
  return batch;
}

std::shared_ptr<BatchOrchestrator::Batch> BatchOrchestrator::find(const std::string& batch_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = batches_.find(batch_id);
  if(it == batches_.end()) return nullptr;
  return it->second;
}

BatchResult BatchOrchestrator::execute_batch_transfer(const BatchRequest& request) {
  reap();
  auto batch = create_batch(request);
  run(batch, request);
  std::lock_guard<std::mutex> lock(batch->mutex);
  return summarize(batch->status);
}

std::string BatchOrchestrator::submit(const BatchRequest& request) {
  reap();
  auto batch = create_batch(request);
  auto id = batch->status.batch_id;
  std::lock_guard<std::mutex> lock(mutex_);
  background_.push_back(Worker{std::thread([this, batch, request]{ run(batch, request); }), batch});
  return id;
}

std::optional<BatchResult> BatchOrchestrator::wait(const std::string& batch_id,
                                                   std::optional<std::chrono::milliseconds> timeout) {
  auto batch = find(batch_id);
  if(!batch) throw batch_not_found(batch_id);
  std::unique_lock<std::mutex> lock(batch->mutex);
  auto finished = [&]{ return batch->finished; };
  if(timeout) {
    if(!batch->done.wait_for(lock, *timeout, finished)) return std::nullopt;
  } else {
    batch->done.wait(lock, finished);
  }
  return summarize(batch->status);
}

void BatchOrchestrator::run(const std::shared_ptr<Batch>& batch, const BatchRequest& request) {
  std::size_t total = 0;
  {
    std::lock_guard<std::mutex> lock(batch->mutex);
    total = batch->status.operations.size();
  }
  if(total == 0) return;

  auto concurrency = std::min(effective_concurrency(request), total);
  log_info(logger_.get(), "Batch {}: {} transfers, {} at a time",
           batch->status.batch_id, total, concurrency);

  CountingSemaphore permits(concurrency);
  std::atomic<std::size_t> next{0};
  auto worker = [&]{
    for(;;) {
      auto index = next.fetch_add(1);
      if(index >= total) return;
      SemaphorePermit permit(permits);
      run_item(batch, index, request);
    }
  };

  if(concurrency == 1) {
    worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(concurrency);
    for(std::size_t i = 0; i < concurrency; ++i) workers.emplace_back(worker);
    for(auto& thread : workers) thread.join();
  }
  finish(batch);
}

void BatchOrchestrator::run_item(const std::shared_ptr<Batch>& batch,
                                 std::size_t index,
                                 const BatchRequest& request) {
  std::filesystem::path file;
  std::string peer;
  {
    std::lock_guard<std::mutex> lock(batch->mutex);
    auto& item = batch->status.operations[index];
    if(item.state.is_terminal() || batch->cancel_requested) {
      if(!item.state.is_terminal()) item.state = OperationState::cancelled();
      return;
    }
    item.state = OperationState::in_progress();
    file = item.file;
    peer = item.peer;
  }

  OperationState final_state = OperationState::failed("unknown");
  std::optional<std::string> error;
  try {
    SendRequest send;
    send.files = {file};
    send.peer = peer;
    send.compression = request.compression;
    send.encryption = request.encryption;
    auto handle = transfer_.send(send);
    {
      std::lock_guard<std::mutex> lock(batch->mutex);
      batch->status.operations[index].transfer_id = handle.operation_id;
    }
    while(!transfer_.wait_for_terminal(handle.operation_id, kCancelPollInterval)) {
      if(batch->cancel_requested) {
        transfer_.cancel_operation(handle.operation_id);
        break;
      }
    }
    auto status = transfer_.get_operation_status(handle.operation_id);
    final_state = status ? status.value().state : OperationState::cancelled();
    if(!final_state.is_terminal()) final_state = OperationState::cancelled();
    if(final_state.kind == OperationState::Kind::Failed) error = final_state.message;
  } catch(const KizunaError& e) {
    final_state = OperationState::failed(e.what());
    error = e.what();
  }

  {
    std::lock_guard<std::mutex> lock(batch->mutex);
    auto& item = batch->status.operations[index];
    if(item.state.is_terminal()) return;
    item.state = final_state;
    item.error = error;
  }
  if(error) {
    log_warn(logger_.get(), "Batch item {} -> {} failed: {}", file.string(), peer, *error);
  } else {
    log_debug(logger_.get(), "Batch item {} -> {}: {}", file.string(), peer, describe(final_state));
  }
}

void BatchOrchestrator::finish(const std::shared_ptr<Batch>& batch) {
  BatchResult summary;
  {
    std::lock_guard<std::mutex> lock(batch->mutex);
    if(!batch->status.completed_at) batch->status.completed_at = std::chrono::system_clock::now();
    batch->finished = true;
    summary = summarize(batch->status);
  }
  batch->done.notify_all();
  log_info(logger_.get(), "Batch {} finished: {} successful, {} failed, {} cancelled",
           summary.batch_id, summary.successful, summary.failed, summary.cancelled);
}

BatchResult BatchOrchestrator::summarize(const BatchStatus& status) {
  BatchResult result;
  result.batch_id = status.batch_id;
  result.operations = status.operations;
  result.total_operations = status.operations.size();
  for(const auto& item : status.operations) {
    switch(item.state.kind) {
      case OperationState::Kind::Completed: ++result.successful; break;
      case OperationState::Kind::Failed: ++result.failed; break;
      case OperationState::Kind::Cancelled: ++result.cancelled; break;
      default: break;
    }
  }
  return result;
}

BatchStatus BatchOrchestrator::get_batch_status(const std::string& batch_id) const {
  auto batch = find(batch_id);
  if(!batch) throw batch_not_found(batch_id);
  std::lock_guard<std::mutex> lock(batch->mutex);
  return batch->status;
}

std::vector<BatchStatus> BatchOrchestrator::get_active_batches() const {
  std::vector<std::shared_ptr<Batch>> batches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& entry : batches_) batches.push_back(entry.second);
  }
  std::vector<BatchStatus> out;
  for(const auto& batch : batches) {
    std::lock_guard<std::mutex> lock(batch->mutex);
    out.push_back(batch->status);
  }
  return out;
}

BatchProgress BatchOrchestrator::get_batch_progress(const std::string& batch_id) const {
  auto status = get_batch_status(batch_id);
  auto summary = summarize(status);
  BatchProgress progress;
  progress.batch_id = batch_id;
  progress.total_operations = summary.total_operations;
  progress.completed_operations = summary.successful;
  progress.failed_operations = summary.failed;
  progress.cancelled_operations = summary.cancelled;
  progress.in_progress_operations = summary.total_operations - summary.successful - summary.failed - summary.cancelled;
  progress.overall_progress = summary.total_operations == 0
    ? 100.0
    : static_cast<double>(summary.successful) / static_cast<double>(summary.total_operations) * 100.0;
  return progress;
}

void BatchOrchestrator::cancel_batch(const std::string& batch_id) {
  auto batch = find(batch_id);
  if(!batch) throw batch_not_found(batch_id);
  std::vector<std::string> in_flight;
  {
    std::lock_guard<std::mutex> lock(batch->mutex);
    batch->cancel_requested = true;
    for(auto& item : batch->status.operations) {
      if(item.state.is_terminal()) continue;
      if(!item.transfer_id.empty()) in_flight.push_back(item.transfer_id);
      item.state = OperationState::cancelled();
    }
    if(!batch->status.completed_at) batch->status.completed_at = std::chrono::system_clock::now();
  }
  for(const auto& id : in_flight) {
    try {
      transfer_.cancel_operation(id);
    } catch(const KizunaError& e) {
      log_warn(logger_.get(), "Cancel of transfer {} failed: {}", id, e.what());
    }
  }
  log_info(logger_.get(), "Batch {} cancelled", batch_id);
}
