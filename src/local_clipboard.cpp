#include "local_clipboard.hpp"

#include <algorithm>
#include <iterator>

#include "errors.hpp"
#include "json_store.hpp"
#include "utils.hpp"

LocalClipboard::LocalClipboard(std::filesystem::path path)
  : path_(std::move(path)),
    logger_(component_logger("clipboard")) {}

void LocalClipboard::load() {
  if(loaded_) return;
  loaded_ = true;
  auto doc = read_json_file(path_);
  if(!doc) return;

  sharing_ = doc->value("sharing_enabled", false);
  content_ = doc->value("content", "");
  if(doc->contains("enabled_devices") && (*doc)["enabled_devices"].is_array()) {
    for(const auto& id : (*doc)["enabled_devices"]) {
      if(id.is_string()) devices_.insert(id.get<std::string>());
    }
  }
  if(doc->contains("history") && (*doc)["history"].is_array()) {
    for(const auto& item : (*doc)["history"]) {
      ClipboardEntry entry;
      entry.id = item.value("id", "");
      entry.content = item.value("content", "");
      entry.source_peer = item.value("source_peer", "");
      auto ts = parse_rfc3339(item.value("timestamp", ""));
      if(entry.id.empty() || !ts) {
        log_warn(logger_.get(), "Skipping malformed clipboard entry in {}", path_.string());
        continue;
      }
      entry.timestamp = *ts;
      history_.push_back(std::move(entry));
      if(history_.size() >= kMaxHistory) break;
    }
  }
}

void LocalClipboard::save() {
  nlohmann::json history = nlohmann::json::array();
  for(const auto& entry : history_) {
    history.push_back({{"id", entry.id},
                       {"content", entry.content},
                       {"source_peer", entry.source_peer},
                       {"timestamp", format_rfc3339(entry.timestamp)}});
  }
  nlohmann::json doc;
  doc["sharing_enabled"] = sharing_;
  doc["enabled_devices"] = std::vector<std::string>(devices_.begin(), devices_.end());
  doc["content"] = content_;
  doc["history"] = history;
  write_json_file(path_, doc);
}

void LocalClipboard::record(const std::string& content, const std::string& source_peer) {
  ClipboardEntry entry;
  entry.id = new_uuid();
  entry.content = content;
  entry.source_peer = source_peer;
  history_.push_front(std::move(entry));
  while(history_.size() > kMaxHistory) history_.pop_back();
}

bool LocalClipboard::is_sharing_enabled() {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  return sharing_;
}

void LocalClipboard::set_sharing_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  sharing_ = enabled;
  save();
}

void LocalClipboard::enable_device(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  devices_.insert(peer_id);
  save();
}

void LocalClipboard::disable_device(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  devices_.erase(peer_id);
  save();
}

std::vector<std::string> LocalClipboard::enabled_devices() {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  return {devices_.begin(), devices_.end()};
}

std::string LocalClipboard::get_content() {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  return content_;
}

void LocalClipboard::set_content(const std::string& content, const std::string& source_peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  if(content == content_) return;
  content_ = content;
  record(content, source_peer);
  save();
}

std::vector<ClipboardEntry> LocalClipboard::get_history(std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  auto count = std::min(limit, history_.size());
  return {history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(count)};
}

std::vector<ClipboardEntry> LocalClipboard::search_history(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  std::vector<ClipboardEntry> out;
  std::copy_if(history_.begin(), history_.end(), std::back_inserter(out),
               [&](const ClipboardEntry& entry){ return contains_icase(entry.content, query); });
  return out;
}

void LocalClipboard::restore(const std::string& entry_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  auto it = std::find_if(history_.begin(), history_.end(),
                         [&](const ClipboardEntry& entry){ return entry.id == entry_id; });
  if(it == history_.end()) {
    throw KizunaError::integration(IntegrationDomain::Clipboard, "History entry " + entry_id + " not found");
  }
  content_ = it->content;
  save();
}

void LocalClipboard::clear_history() {
  std::lock_guard<std::mutex> lock(mutex_);
  load();
  history_.clear();
  save();
}
