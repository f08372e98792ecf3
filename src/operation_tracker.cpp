#include "operation_tracker.hpp"

#include <algorithm>
#include <mutex>

void OperationTracker::insert(OperationStatus status) {
  OperationStatus published = status;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    operations_[status.operation_id] = std::move(status);
  }
  changed_.notify_all();
  updates_.publish(published);
}

bool OperationTracker::contains(const std::string& operation_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return operations_.count(operation_id) > 0;
}

std::optional<OperationStatus> OperationTracker::get(const std::string& operation_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = operations_.find(operation_id);
  if(it == operations_.end()) return std::nullopt;
  return it->second;
}

std::vector<OperationStatus> OperationTracker::snapshot() const {
  std::vector<OperationStatus> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(operations_.size());
    for(const auto& entry : operations_) out.push_back(entry.second);
  }
  std::stable_sort(out.begin(), out.end(), [](const OperationStatus& a, const OperationStatus& b){
    if(a.started_at != b.started_at) return a.started_at < b.started_at;
    return a.operation_id < b.operation_id;
  });
  return out;
}

bool OperationTracker::update(const std::string& operation_id, const Mutator& mutate) {
  OperationStatus published;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if(it == operations_.end()) return false;
    auto& stored = it->second;
    if(stored.state.is_terminal()) return false;

    OperationStatus next = stored;
    mutate(next);

    next.operation_id = stored.operation_id;
    next.kind = stored.kind;
    next.started_at = stored.started_at;
    if(stored.state.kind == OperationState::Kind::InProgress &&
       next.state.kind == OperationState::Kind::Starting) {
      next.state = stored.state;
    }
    // Only the stream kind may report a shrinking count (viewers).
    if(stored.kind != OperationKind::CameraStream &&
       next.state.kind == OperationState::Kind::InProgress &&
       stored.progress && next.progress &&
       next.progress->current < stored.progress->current) {
      next.progress->current = stored.progress->current;
    }
    stored = next;
    published = stored;
  }
  changed_.notify_all();
  updates_.publish(published);
  return true;
}

bool OperationTracker::set_state(const std::string& operation_id, OperationState state) {
  return update(operation_id, [&](OperationStatus& status){ status.state = std::move(state); });
}

bool OperationTracker::cancel(const std::string& operation_id) {
  return set_state(operation_id, OperationState::cancelled());
}

bool OperationTracker::remove(const std::string& operation_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return operations_.erase(operation_id) > 0;
}

std::size_t OperationTracker::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return operations_.size();
}

std::size_t OperationTracker::count(OperationState::Kind kind) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(operations_.begin(), operations_.end(),
    [kind](const auto& entry){ return entry.second.state.kind == kind; }));
}

std::size_t OperationTracker::active_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(operations_.begin(), operations_.end(),
    [](const auto& entry){ return !entry.second.state.is_terminal(); }));
}

bool OperationTracker::wait_for_terminal(const std::string& operation_id,
                                         std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto done = [&]{
    auto it = operations_.find(operation_id);
    return it == operations_.end() || it->second.state.is_terminal();
  };
  if(!timeout) {
    changed_.wait(lock, done);
    return true;
  }
  return changed_.wait_for(lock, *timeout, done);
}

std::shared_ptr<Channel<OperationStatus>> OperationTracker::subscribe(std::size_t capacity) {
  return updates_.subscribe(capacity);
}
