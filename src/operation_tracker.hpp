#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "channel.hpp"
#include "types.hpp"

// Current status of every operation a handler started, keyed by
// operation_id. Updates for unknown ids are dropped and terminal states are
// final. Every applied change is published to subscribers.
class OperationTracker {
public:
  using Mutator = std::function<void(OperationStatus&)>;

  void insert(OperationStatus status);
  bool contains(const std::string& operation_id) const;
  std::optional<OperationStatus> get(const std::string& operation_id) const;
  // Oldest first.
  std::vector<OperationStatus> snapshot() const;

  // Returns false when the id is unknown or already terminal.
  bool update(const std::string& operation_id, const Mutator& mutate);
  bool set_state(const std::string& operation_id, OperationState state);
  bool cancel(const std::string& operation_id);
  bool remove(const std::string& operation_id);

  std::size_t size() const;
  std::size_t count(OperationState::Kind kind) const;
  std::size_t active_count() const;

  // Blocks until the operation is terminal (true) or the timeout passes.
  bool wait_for_terminal(const std::string& operation_id, std::optional<std::chrono::milliseconds> timeout);

  std::shared_ptr<Channel<OperationStatus>> subscribe(std::size_t capacity = 0);

private:
  mutable std::shared_mutex mutex_;
  std::condition_variable_any changed_;
  std::unordered_map<std::string, OperationStatus> operations_;
  Broadcaster<OperationStatus> updates_;
};
