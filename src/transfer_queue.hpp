#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "types.hpp"

enum class QueuePriority { Low = 0, Normal = 1, High = 2, Urgent = 3 };
enum class QueueState { Pending, Scheduled, Running, Paused, Completed, Failed, Cancelled };

const char* to_string(QueuePriority priority);
const char* to_string(QueueState state);
std::optional<QueuePriority> queue_priority_from_string(const std::string& value);
std::optional<QueueState> queue_state_from_string(const std::string& value);
bool is_terminal(QueueState state);

struct QueuedTransfer {
  std::vector<std::filesystem::path> files;
  std::string peer;
  std::optional<bool> compression;
  std::optional<bool> encryption;
};

struct ManifestEntry {
  std::filesystem::path path;
  uint64_t size = 0;
};

struct QueueItem {
  std::string queue_id;
  QueuedTransfer request;
  QueuePriority priority = QueuePriority::Normal;
  QueueState state = QueueState::Pending;
  SystemTime enqueued_at;
  uint64_t sequence = 0; // FIFO tie-break within one enqueue instant
  std::string peer_id;
  std::vector<ManifestEntry> manifest;
  std::optional<std::string> transfer_id;
  std::optional<std::string> error;
  SystemTime updated_at;

  uint64_t total_bytes() const;
};

void to_json(nlohmann::json& j, const QueueItem& item);
void from_json(const nlohmann::json& j, QueueItem& item);

struct QueueStatistics {
  std::size_t pending_count = 0;
  std::size_t active_count = 0;
  std::size_t available_slots = 0;
  std::size_t paused_count = 0;
  std::size_t completed_count = 0;
  std::size_t failed_count = 0;
  std::size_t cancelled_count = 0;
  std::size_t max_concurrent = 0;
};

void to_json(nlohmann::json& j, const QueueStatistics& stats);

// Persistent priority queue of transfers. Pending items are ordered by
// (priority desc, enqueued_at asc); every transition is written to one JSON
// file per item before the call returns.
class TransferQueue {
public:
  static constexpr std::size_t kDefaultConcurrency = 4;

  explicit TransferQueue(std::filesystem::path directory, std::size_t max_concurrent = kDefaultConcurrency);

  // Creates the directory and replays persisted items. Scheduled and Running
  // items come back as Pending.
  void initialize();

  std::string enqueue(const QueuedTransfer& request, QueuePriority priority, const std::string& peer_id = {});
  std::optional<QueueItem> get(const std::string& queue_id) const;
  std::vector<QueueItem> get_pending_items() const;
  std::vector<QueueItem> get_all_items() const;

  void cancel(const std::string& queue_id);
  void pause(const std::string& queue_id);
  void resume(const std::string& queue_id);
  void change_priority(const std::string& queue_id, QueuePriority priority);
  void remove(const std::string& queue_id);

  // Highest-ordered Pending item, moved to Scheduled, when capacity allows.
  std::optional<QueueItem> schedule_next_transfer();
  // Scheduled -> Running only.
  void mark_running(const std::string& queue_id, const std::string& transfer_id);
  // Paused -> Running for an item whose transfer was paused mid-flight.
  void resume_running(const std::string& queue_id);
  void mark_completed(const std::string& queue_id);
  void mark_failed(const std::string& queue_id, const std::string& reason);

  QueueStatistics statistics() const;
  std::size_t clear_cancelled_items();
  // Removes terminal items older than max_age.
  std::size_t cleanup_old_items(std::chrono::seconds max_age);

  void set_max_concurrent(std::size_t max_concurrent);
  std::size_t max_concurrent() const;
  std::size_t active_count() const;
  const std::filesystem::path& directory() const { return directory_; }

private:
  using Items = std::map<std::string, QueueItem>;

  QueueItem& require(const std::string& queue_id);
  void transition(QueueItem& item, QueueState next);
  std::size_t active_count_locked() const;
  std::vector<const QueueItem*> pending_locked() const;
  std::filesystem::path item_path(const std::string& queue_id) const;
  void persist(const QueueItem& item) const;
  void erase_file(const std::string& queue_id) const;

  std::filesystem::path directory_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  Items items_;
  std::size_t max_concurrent_;
  uint64_t next_sequence_ = 1;
  SystemTime last_enqueued_{};
};
