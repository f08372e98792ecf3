#include "history.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

namespace {

Logger* history_log() {
  static auto logger = component_logger("history");
  return logger.get();
}

std::string verb_of(const std::string& command) {
  auto trimmed = trim_copy(command);
  auto space = trimmed.find_first_of(" \t");
  return space == std::string::npos ? trimmed : trimmed.substr(0, space);
}

} // namespace

std::string HistoryEntry::format() const {
  auto line = "[" + format_local_time(timestamp) + "] " + command;
  if(exit_code) line += " (exit: " + std::to_string(*exit_code) + ")";
  return line;
}

void to_json(nlohmann::json& j, const HistoryEntry& entry) {
  j = nlohmann::json{{"command", entry.command}, {"timestamp", format_rfc3339(entry.timestamp)}};
  if(entry.exit_code) j["exit_code"] = *entry.exit_code;
  if(entry.duration_ms) j["duration_ms"] = *entry.duration_ms;
}

void from_json(const nlohmann::json& j, HistoryEntry& entry) {
  entry.command = j.at("command").get<std::string>();
  auto timestamp = parse_rfc3339(j.at("timestamp").get<std::string>());
  if(!timestamp) throw std::invalid_argument("bad timestamp");
  entry.timestamp = *timestamp;
  entry.exit_code.reset();
  entry.duration_ms.reset();
  if(j.contains("exit_code") && !j["exit_code"].is_null()) entry.exit_code = j["exit_code"].get<int>();
  if(j.contains("duration_ms") && !j["duration_ms"].is_null()) entry.duration_ms = j["duration_ms"].get<uint64_t>();
}

std::filesystem::path HistoryManager::default_path() {
  return user_config_dir() / "history";
}

HistoryManager::HistoryManager(std::filesystem::path path)
  : path_(std::move(path)) {}

void HistoryManager::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  std::ifstream in(path_);
  if(!in) return;
  std::string line;
  std::size_t skipped = 0;
  while(std::getline(in, line)) {
    if(trim_copy(line).empty()) continue;
    try {
      entries_.push_back(nlohmann::json::parse(line).get<HistoryEntry>());
    } catch(const std::exception&) {
      ++skipped;
    }
  }
  if(skipped > 0) log_warn(history_log(), "Skipped {} unreadable history lines in {}", skipped, path_.string());
  if(entries_.size() > kMaxEntries) {
    entries_.erase(entries_.begin(), entries_.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
  }
}

void HistoryManager::save() const {
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if(ec) throw KizunaError::io("unable to create " + path_.parent_path().string() + ": " + ec.message());
  std::ofstream out(path_, std::ios::trunc);
  if(!out) throw KizunaError::io("unable to write " + path_.string());
  auto start = entries_.size() > kMaxEntries ? entries_.size() - kMaxEntries : 0;
  for(std::size_t i = start; i < entries_.size(); ++i) {
    out << nlohmann::json(entries_[i]).dump() << "\n";
  }
  if(!out) throw KizunaError::io("unable to write " + path_.string());
}

void HistoryManager::append(HistoryEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(entry));
  if(entries_.size() > kMaxEntries) {
    entries_.erase(entries_.begin(), entries_.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
  }
  save();
}

void HistoryManager::add(const std::string& command) {
  HistoryEntry entry;
  entry.command = command;
  append(std::move(entry));
}

void HistoryManager::add_with_details(const std::string& command, int exit_code, uint64_t duration_ms) {
  HistoryEntry entry;
  entry.command = command;
  entry.exit_code = exit_code;
  entry.duration_ms = duration_ms;
  append(std::move(entry));
}

std::vector<HistoryEntry> HistoryManager::get_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::vector<HistoryEntry> HistoryManager::get_recent(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto start = entries_.size() > count ? entries_.size() - count : 0;
  return std::vector<HistoryEntry>(entries_.begin() + static_cast<std::ptrdiff_t>(start), entries_.end());
}

std::vector<HistoryEntry> HistoryManager::search(const std::string& query) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if(query.empty()) return entries_;
  auto needle = to_lower(query);
  std::vector<std::pair<std::size_t, const HistoryEntry*>> scored;
  for(const auto& entry : entries_) {
    auto command = to_lower(entry.command);
    if(command == needle) {
      scored.emplace_back(0, &entry);
    } else if(command.find(needle) != std::string::npos) {
      scored.emplace_back(1, &entry);
    } else {
      auto distance = levenshtein_distance(command, needle);
      if(distance <= 3) scored.emplace_back(distance + 2, &entry);
    }
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b){ return a.first < b.first; });
  std::vector<HistoryEntry> out;
  for(const auto& hit : scored) out.push_back(*hit.second);
  return out;
}

std::vector<std::string> HistoryManager::suggest(const std::string& prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  if(prefix.empty()) return out;
  auto needle = to_lower(prefix);
  std::set<std::string> seen;
  for(auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if(to_lower(it->command).rfind(needle, 0) != 0) continue;
    if(seen.insert(it->command).second) out.push_back(it->command);
  }
  return out;
}

void HistoryManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  save();
}

void HistoryManager::prune_old(int days) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * days);
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const HistoryEntry& entry){ return entry.timestamp <= cutoff; }),
                 entries_.end());
  save();
}

HistoryStatistics HistoryManager::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  HistoryStatistics stats;
  stats.total_commands = entries_.size();
  std::set<std::string> unique;
  std::map<std::string, std::size_t> verbs;
  std::size_t with_code = 0;
  std::size_t succeeded = 0;
  for(const auto& entry : entries_) {
    unique.insert(entry.command);
    ++verbs[verb_of(entry.command)];
    if(entry.exit_code) {
      ++with_code;
      if(*entry.exit_code == 0) ++succeeded;
    }
  }
  stats.unique_commands = unique.size();
  stats.success_rate = with_code == 0 ? 0.0 : static_cast<double>(succeeded) / static_cast<double>(with_code) * 100.0;
  stats.most_used.assign(verbs.begin(), verbs.end());
  std::stable_sort(stats.most_used.begin(), stats.most_used.end(),
                   [](const auto& a, const auto& b){ return a.second > b.second; });
  if(stats.most_used.size() > 10) stats.most_used.resize(10);
  return stats;
}
