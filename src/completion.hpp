#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "command_parser.hpp"

class HistoryManager;

struct CompletionSources {
  const HistoryManager* history = nullptr;
  std::function<std::vector<std::string>()> peer_names;
  std::function<std::vector<std::string>()> config_keys;
};

// Context-aware candidates for a partial command line. Results are cached per
// line for kCacheTtl.
class CompletionEngine {
public:
  using NameSource = std::function<std::vector<std::string>()>;
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::chrono::seconds kCacheTtl{60};

  using Sources = CompletionSources;

  explicit CompletionEngine(const CommandParser& parser, Sources sources = {});

  void set_clock(Clock clock);

  std::vector<std::string> complete(const std::string& line);
  // words excludes the program name; current is the word under the cursor.
  std::vector<std::string> complete_words(const std::vector<std::string>& words,
                                          const std::string& current) const;

  std::vector<std::string> complete_verb(const std::string& prefix) const;
  std::vector<std::string> complete_option(const std::string& verb, const std::string& prefix) const;
  std::vector<std::string> complete_value(const std::string& option, const std::string& prefix) const;
  std::vector<std::string> complete_path(const std::string& prefix) const;
  std::vector<std::string> complete_peer(const std::string& prefix) const;
  std::vector<std::string> complete_from_history(const std::vector<std::string>& words,
                                                 const std::string& current) const;

  void clear_cache();
  std::size_t cache_size() const;

  static const std::vector<std::string>& shells();
  // Throws InvalidArgumentValue for an unsupported shell.
  static std::string script(const std::string& shell);

private:
  struct CacheEntry {
    std::vector<std::string> candidates;
    std::chrono::steady_clock::time_point stored_at;
  };

  const CommandParser& parser_;
  Sources sources_;
  Clock clock_;
  mutable std::mutex cache_mutex_;
  std::map<std::string, CacheEntry> cache_;
};
