#include "transfer_queue.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kItemPrefix = "queue_";
constexpr const char* kItemSuffix = ".json";

KizunaError not_found(const std::string& queue_id) {
  return KizunaError::integration(IntegrationDomain::Transfer, "Queue item " + queue_id + " not found");
}

SystemTime truncate_to_millis(SystemTime tp) {
  return from_unix_millis(to_unix_millis(tp));
}

bool pending_before(const QueueItem& a, const QueueItem& b) {
  if(a.priority != b.priority) return a.priority > b.priority;
  if(a.enqueued_at != b.enqueued_at) return a.enqueued_at < b.enqueued_at;
  return a.sequence < b.sequence;
}

} // namespace

const char* to_string(QueuePriority priority) {
  switch(priority) {
    case QueuePriority::Low: return "low";
    case QueuePriority::Normal: return "normal";
    case QueuePriority::High: return "high";
    case QueuePriority::Urgent: return "urgent";
  }
  return "normal";
}

const char* to_string(QueueState state) {
  switch(state) {
    case QueueState::Pending: return "pending";
    case QueueState::Scheduled: return "scheduled";
    case QueueState::Running: return "running";
    case QueueState::Paused: return "paused";
    case QueueState::Completed: return "completed";
    case QueueState::Failed: return "failed";
    case QueueState::Cancelled: return "cancelled";
  }
  return "pending";
}

std::optional<QueuePriority> queue_priority_from_string(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "low") return QueuePriority::Low;
  if(v == "normal") return QueuePriority::Normal;
  if(v == "high") return QueuePriority::High;
  if(v == "urgent") return QueuePriority::Urgent;
  return std::nullopt;
}

std::optional<QueueState> queue_state_from_string(const std::string& value) {
  for(auto state : {QueueState::Pending, QueueState::Scheduled, QueueState::Running, QueueState::Paused,
                    QueueState::Completed, QueueState::Failed, QueueState::Cancelled}) {
    if(value == to_string(state)) return state;
  }
  return std::nullopt;
}

bool is_terminal(QueueState state) {
  return state == QueueState::Completed || state == QueueState::Failed || state == QueueState::Cancelled;
}

uint64_t QueueItem::total_bytes() const {
  uint64_t total = 0;
  for(const auto& entry : manifest) total += entry.size;
  return total;
}

void to_json(nlohmann::json& j, const QueueItem& item) {
  nlohmann::json files = nlohmann::json::array();
  for(const auto& file : item.request.files) files.push_back(file.string());
  nlohmann::json request{{"files", files}, {"peer", item.request.peer}};
  if(item.request.compression) request["compression"] = *item.request.compression;
  if(item.request.encryption) request["encryption"] = *item.request.encryption;

  nlohmann::json manifest = nlohmann::json::array();
  for(const auto& entry : item.manifest) {
    manifest.push_back({{"path", entry.path.string()}, {"size", entry.size}});
  }

  j = nlohmann::json{
    {"queue_id", item.queue_id},
    {"transfer_request", request},
    {"priority", to_string(item.priority)},
    {"state", to_string(item.state)},
    {"enqueued_at", format_rfc3339(item.enqueued_at)},
    {"enqueued_at_ms", to_unix_millis(item.enqueued_at)},
    {"sequence", item.sequence},
    {"peer_id", item.peer_id},
    {"manifest", manifest},
    {"updated_at_ms", to_unix_millis(item.updated_at)},
  };
  if(item.transfer_id) j["transfer_id"] = *item.transfer_id;
  if(item.error) j["error"] = *item.error;
}

void from_json(const nlohmann::json& j, QueueItem& item) {
  item.queue_id = j.at("queue_id").get<std::string>();
  const auto& request = j.at("transfer_request");
  item.request.files.clear();
  for(const auto& file : request.at("files")) item.request.files.emplace_back(file.get<std::string>());
  item.request.peer = request.value("peer", std::string());
  item.request.compression.reset();
  item.request.encryption.reset();
  if(request.contains("compression")) item.request.compression = request.at("compression").get<bool>();
  if(request.contains("encryption")) item.request.encryption = request.at("encryption").get<bool>();

  auto priority = queue_priority_from_string(j.at("priority").get<std::string>());
  auto state = queue_state_from_string(j.at("state").get<std::string>());
  if(!priority || !state) throw std::invalid_argument("unknown priority or state");
  item.priority = *priority;
  item.state = *state;
  item.enqueued_at = from_unix_millis(j.at("enqueued_at_ms").get<int64_t>());
  item.sequence = j.value("sequence", uint64_t{0});
  item.peer_id = j.value("peer_id", std::string());
  item.manifest.clear();
  for(const auto& entry : j.value("manifest", nlohmann::json::array())) {
    item.manifest.push_back({entry.at("path").get<std::string>(), entry.value("size", uint64_t{0})});
  }
  item.updated_at = from_unix_millis(j.value("updated_at_ms", to_unix_millis(item.enqueued_at)));
  item.transfer_id.reset();
  item.error.reset();
  if(j.contains("transfer_id")) item.transfer_id = j.at("transfer_id").get<std::string>();
  if(j.contains("error")) item.error = j.at("error").get<std::string>();
}

void to_json(nlohmann::json& j, const QueueStatistics& stats) {
  j = nlohmann::json{
    {"pending_count", stats.pending_count},
    {"active_count", stats.active_count},
    {"available_slots", stats.available_slots},
    {"paused_count", stats.paused_count},
    {"completed_count", stats.completed_count},
    {"failed_count", stats.failed_count},
    {"cancelled_count", stats.cancelled_count},
    {"max_concurrent", stats.max_concurrent},
  };
}

TransferQueue::TransferQueue(std::filesystem::path directory, std::size_t max_concurrent)
  : directory_(std::move(directory)),
    logger_(component_logger("queue")),
    max_concurrent_(max_concurrent) {}

void TransferQueue::initialize() {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if(ec) throw KizunaError::io("unable to create " + directory_.string() + ": " + ec.message());

  std::lock_guard<std::mutex> lock(mutex_);
  items_.clear();
  std::size_t reset = 0;
  for(const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
    const auto& path = entry.path();
    auto name = path.filename().string();
    if(path.extension() != kItemSuffix || name.rfind(kItemPrefix, 0) != 0) continue;
    try {
      std::ifstream in(path);
      QueueItem item = nlohmann::json::parse(in).get<QueueItem>();
      if(item.state == QueueState::Scheduled || item.state == QueueState::Running) {
        item.state = QueueState::Pending;
        item.transfer_id.reset();
        item.updated_at = std::chrono::system_clock::now();
        persist(item);
        ++reset;
      }
      next_sequence_ = std::max(next_sequence_, item.sequence + 1);
      last_enqueued_ = std::max(last_enqueued_, item.enqueued_at);
      items_[item.queue_id] = std::move(item);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Skipping unreadable queue item {}: {}", path.string(), e.what());
    }
  }
  if(ec) throw KizunaError::io("unable to read " + directory_.string() + ": " + ec.message());
  log_debug(logger_.get(), "Loaded {} queue items ({} reset to pending)", items_.size(), reset);
}

std::filesystem::path TransferQueue::item_path(const std::string& queue_id) const {
  return directory_ / (std::string(kItemPrefix) + queue_id + kItemSuffix);
}

void TransferQueue::persist(const QueueItem& item) const {
  auto path = item_path(item.queue_id);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) throw KizunaError::io("unable to write " + tmp.string());
    out << nlohmann::json(item).dump(2);
    out.flush();
    if(!out) throw KizunaError::io("unable to write " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if(ec) throw KizunaError::io("unable to write " + path.string() + ": " + ec.message());
}

void TransferQueue::erase_file(const std::string& queue_id) const {
  std::error_code ec;
  std::filesystem::remove(item_path(queue_id), ec);
  if(ec) throw KizunaError::io("unable to remove queue item " + queue_id + ": " + ec.message());
}

QueueItem& TransferQueue::require(const std::string& queue_id) {
  auto it = items_.find(queue_id);
  if(it == items_.end()) throw not_found(queue_id);
  return it->second;
}

void TransferQueue::transition(QueueItem& item, QueueState next) {
  auto previous = item;
  item.state = next;
  item.updated_at = std::chrono::system_clock::now();
  try {
    persist(item);
  } catch(...) {
    item = previous;
    throw;
  }
  log_debug(logger_.get(), "Queue item {}: {} -> {}", item.queue_id, to_string(previous.state), to_string(next));
}

std::string TransferQueue::enqueue(const QueuedTransfer& request, QueuePriority priority, const std::string& peer_id) {
  if(request.files.empty()) throw KizunaError::missing_argument("file (at least one file to send)");
  QueueItem item;
  for(const auto& file : request.files) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(file, ec);
    if(ec || !std::filesystem::is_regular_file(absolute, ec)) {
      throw KizunaError::io("file not found: " + file.string());
    }
    item.manifest.push_back({absolute, std::filesystem::file_size(absolute, ec)});
    item.request.files.push_back(absolute);
  }
  item.request.peer = request.peer;
  item.request.compression = request.compression;
  item.request.encryption = request.encryption;
  item.queue_id = new_uuid();
  item.priority = priority;
  item.state = QueueState::Pending;
  item.peer_id = peer_id.empty() ? request.peer : peer_id;

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = truncate_to_millis(std::chrono::system_clock::now());
  if(now <= last_enqueued_) now = last_enqueued_ + std::chrono::milliseconds(1);
  item.enqueued_at = now;
  item.updated_at = now;
  item.sequence = next_sequence_;
  persist(item);
  ++next_sequence_;
  last_enqueued_ = now;
  items_[item.queue_id] = item;
  log_info(logger_.get(), "Queued {} ({} files, {} priority) for {}",
           item.queue_id, item.manifest.size(), to_string(priority), item.request.peer);
  return item.queue_id;
}

std::optional<QueueItem> TransferQueue::get(const std::string& queue_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = items_.find(queue_id);
  if(it == items_.end()) return std::nullopt;
  return it->second;
}

std::vector<const QueueItem*> TransferQueue::pending_locked() const {
  std::vector<const QueueItem*> pending;
  for(const auto& entry : items_) {
    if(entry.second.state == QueueState::Pending) pending.push_back(&entry.second);
  }
  std::sort(pending.begin(), pending.end(),
            [](const QueueItem* a, const QueueItem* b){ return pending_before(*a, *b); });
  return pending;
}

std::vector<QueueItem> TransferQueue::get_pending_items() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<QueueItem> out;
  for(const auto* item : pending_locked()) out.push_back(*item);
  return out;
}

std::vector<QueueItem> TransferQueue::get_all_items() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<QueueItem> out;
  for(const auto& entry : items_) out.push_back(entry.second);
  std::sort(out.begin(), out.end(), [](const QueueItem& a, const QueueItem& b){
    if(a.enqueued_at != b.enqueued_at) return a.enqueued_at < b.enqueued_at;
    return a.sequence < b.sequence;
  });
  return out;
}

void TransferQueue::cancel(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(is_terminal(item.state)) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   "Queue item " + queue_id + " is already " + to_string(item.state));
  }
  transition(item, QueueState::Cancelled);
}

void TransferQueue::pause(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(item.state != QueueState::Pending && item.state != QueueState::Running) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   std::string("Cannot pause a ") + to_string(item.state) + " queue item");
  }
  transition(item, QueueState::Paused);
}

void TransferQueue::resume(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(item.state != QueueState::Paused) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   std::string("Cannot resume a ") + to_string(item.state) + " queue item");
  }
  item.transfer_id.reset();
  transition(item, QueueState::Pending);
}

void TransferQueue::change_priority(const std::string& queue_id, QueuePriority priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(is_terminal(item.state)) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   "Queue item " + queue_id + " is already " + to_string(item.state));
  }
  auto previous = item.priority;
  item.priority = priority;
  try {
    persist(item);
  } catch(...) {
    item.priority = previous;
    throw;
  }
}

void TransferQueue::remove(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  require(queue_id);
  erase_file(queue_id);
  items_.erase(queue_id);
}

std::size_t TransferQueue::active_count_locked() const {
  return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const auto& entry){
    return entry.second.state == QueueState::Scheduled || entry.second.state == QueueState::Running;
  }));
}

std::optional<QueueItem> TransferQueue::schedule_next_transfer() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(active_count_locked() >= max_concurrent_) return std::nullopt;
  auto pending = pending_locked();
  if(pending.empty()) return std::nullopt;
  auto& item = items_.at(pending.front()->queue_id);
  transition(item, QueueState::Scheduled);
  return item;
}

void TransferQueue::mark_running(const std::string& queue_id, const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(item.state != QueueState::Scheduled) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   std::string("Cannot start a ") + to_string(item.state) + " queue item");
  }
  item.transfer_id = transfer_id;
  transition(item, QueueState::Running);
}

void TransferQueue::resume_running(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(item.state != QueueState::Paused || !item.transfer_id) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   std::string("Cannot resume a ") + to_string(item.state) + " queue item in place");
  }
  transition(item, QueueState::Running);
}

void TransferQueue::mark_completed(const std::string& queue_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(is_terminal(item.state)) return;
  transition(item, QueueState::Completed);
}

void TransferQueue::mark_failed(const std::string& queue_id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& item = require(queue_id);
  if(is_terminal(item.state)) return;
  item.error = reason;
  transition(item, QueueState::Failed);
}

QueueStatistics TransferQueue::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStatistics stats;
  stats.max_concurrent = max_concurrent_;
  for(const auto& entry : items_) {
    switch(entry.second.state) {
      case QueueState::Pending: ++stats.pending_count; break;
      case QueueState::Scheduled:
      case QueueState::Running: ++stats.active_count; break;
      case QueueState::Paused: ++stats.paused_count; break;
      case QueueState::Completed: ++stats.completed_count; break;
      case QueueState::Failed: ++stats.failed_count; break;
      case QueueState::Cancelled: ++stats.cancelled_count; break;
    }
  }
  stats.available_slots = max_concurrent_ > stats.active_count ? max_concurrent_ - stats.active_count : 0;
  return stats;
}

std::size_t TransferQueue::clear_cancelled_items() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for(auto it = items_.begin(); it != items_.end();) {
    if(it->second.state == QueueState::Cancelled) {
      erase_file(it->first);
      it = items_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t TransferQueue::cleanup_old_items(std::chrono::seconds max_age) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cutoff = std::chrono::system_clock::now() - max_age;
  std::size_t removed = 0;
  for(auto it = items_.begin(); it != items_.end();) {
    if(is_terminal(it->second.state) && it->second.updated_at < cutoff) {
      erase_file(it->first);
      it = items_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if(removed > 0) log_info(logger_.get(), "Removed {} finished queue items", removed);
  return removed;
}

void TransferQueue::set_max_concurrent(std::size_t max_concurrent) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_concurrent_ = max_concurrent;
}

std::size_t TransferQueue::max_concurrent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_concurrent_;
}

std::size_t TransferQueue::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_count_locked();
}
