#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "types.hpp"

class TransferHandler;

struct BatchRequest {
  std::vector<std::filesystem::path> files;
  std::vector<std::string> peers;
  std::optional<bool> compression;
  std::optional<bool> encryption;
  bool parallel = false;
  std::optional<std::size_t> max_concurrent;
};

struct BatchOperationItem {
  std::string operation_id;
  std::filesystem::path file;
  std::string peer;
  OperationState state;
  std::optional<std::string> error;
  std::string transfer_id; // set once the transfer was started
};

struct BatchStatus {
  std::string batch_id;
  std::vector<BatchOperationItem> operations;
  SystemTime started_at;
  std::optional<SystemTime> completed_at;
};

struct BatchResult {
  std::string batch_id;
  std::vector<BatchOperationItem> operations;
  std::size_t total_operations = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t cancelled = 0;
};

struct BatchProgress {
  std::string batch_id;
  std::size_t total_operations = 0;
  std::size_t completed_operations = 0;
  std::size_t failed_operations = 0;
  std::size_t cancelled_operations = 0;
  std::size_t in_progress_operations = 0;
  double overall_progress = 0.0;
};

void to_json(nlohmann::json& j, const BatchOperationItem& item);
void to_json(nlohmann::json& j, const BatchResult& result);

// Fans (files x peers) out over the transfer handler. Each item runs until
// its transfer reaches a terminal state; at most max_concurrent items run at
// once when parallel.
class BatchOrchestrator {
public:
  static constexpr std::size_t kDefaultConcurrency = 4;
  // Finished batches stay queryable this long before a later submit drops them.
  static constexpr std::chrono::milliseconds kFinishedRetention{std::chrono::minutes(10)};

  explicit BatchOrchestrator(TransferHandler& transfer,
                             std::chrono::milliseconds retention = kFinishedRetention);
  ~BatchOrchestrator();

  BatchOrchestrator(const BatchOrchestrator&) = delete;
  BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

  // Blocks until every item is terminal.
  BatchResult execute_batch_transfer(const BatchRequest& request);
  // Runs the batch on a background thread and returns its id.
  std::string submit(const BatchRequest& request);
  // nullopt when the timeout passes first.
  std::optional<BatchResult> wait(const std::string& batch_id,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  BatchStatus get_batch_status(const std::string& batch_id) const;
  std::vector<BatchStatus> get_active_batches() const;
  BatchProgress get_batch_progress(const std::string& batch_id) const;
  void cancel_batch(const std::string& batch_id);

  static std::size_t effective_concurrency(const BatchRequest& request);

  std::size_t tracked_batches() const;
  std::size_t background_threads() const;

private:
  struct Batch {
    mutable std::mutex mutex;
    std::condition_variable done;
    BatchStatus status;
    std::atomic<bool> cancel_requested{false};
    bool finished = false;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<Batch> batch;
  };

  // Joins workers whose batch finished and forgets expired batches.
  void reap();
  std::shared_ptr<Batch> create_batch(const BatchRequest& request);
  std::shared_ptr<Batch> find(const std::string& batch_id) const;
  void run(const std::shared_ptr<Batch>& batch, const BatchRequest& request);
  void run_item(const std::shared_ptr<Batch>& batch, std::size_t index, const BatchRequest& request);
  void finish(const std::shared_ptr<Batch>& batch);
  static BatchResult summarize(const BatchStatus& status);

  TransferHandler& transfer_;
  std::chrono::milliseconds retention_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Batch>> batches_;
  std::vector<Worker> background_;
};
