#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"

// Clipboard state persisted to clipboard.json. History is newest first and
// capped at kMaxHistory entries.
class LocalClipboard : public ClipboardService {
public:
  static constexpr std::size_t kMaxHistory = 100;

  explicit LocalClipboard(std::filesystem::path path);

  bool is_sharing_enabled() override;
  void set_sharing_enabled(bool enabled) override;
  void enable_device(const std::string& peer_id) override;
  void disable_device(const std::string& peer_id) override;
  std::vector<std::string> enabled_devices() override;
  std::string get_content() override;
  void set_content(const std::string& content, const std::string& source_peer) override;
  std::vector<ClipboardEntry> get_history(std::size_t limit) override;
  std::vector<ClipboardEntry> search_history(const std::string& query) override;
  void restore(const std::string& entry_id) override;
  void clear_history() override;

  const std::filesystem::path& path() const { return path_; }

private:
  void load();
  void save();
  void record(const std::string& content, const std::string& source_peer);

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  std::mutex mutex_;
  bool loaded_ = false;
  bool sharing_ = false;
  std::set<std::string> devices_;
  std::string content_;
  std::deque<ClipboardEntry> history_;
};
