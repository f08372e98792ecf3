#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "types.hpp"

struct HistoryEntry {
  std::string command;
  SystemTime timestamp = std::chrono::system_clock::now();
  std::optional<int> exit_code;
  std::optional<uint64_t> duration_ms;

  // [YYYY-mm-dd HH:MM:SS] command (exit: N)
  std::string format() const;
};

void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);

struct HistoryStatistics {
  std::size_t total_commands = 0;
  std::size_t unique_commands = 0;
  double success_rate = 0.0; // percent of entries with exit code 0
  std::vector<std::pair<std::string, std::size_t>> most_used; // by verb, top 10
};

// Command log, one JSON object per line. Keeps the newest 1000 entries.
class HistoryManager {
public:
  static constexpr std::size_t kMaxEntries = 1000;

  static std::filesystem::path default_path();

  explicit HistoryManager(std::filesystem::path path = default_path());

  void load();

  void add(const std::string& command);
  void add_with_details(const std::string& command, int exit_code, uint64_t duration_ms);

  std::vector<HistoryEntry> get_all() const;
  std::vector<HistoryEntry> get_recent(std::size_t count) const;
  // Exact match first, then substring, then within edit distance 3.
  std::vector<HistoryEntry> search(const std::string& query) const;
  // Distinct commands starting with prefix, most recent first.
  std::vector<std::string> suggest(const std::string& prefix) const;

  void clear();
  void prune_old(int days);
  HistoryStatistics statistics() const;

  const std::filesystem::path& path() const { return path_; }

private:
  void append(HistoryEntry entry);
  void save() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::vector<HistoryEntry> entries_;
};
