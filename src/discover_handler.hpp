#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "channel.hpp"
#include "collaborators.hpp"
#include "log.hpp"
#include "runtime.hpp"
#include "types.hpp"

class SecurityGate;

struct DiscoveryFilters {
  std::optional<std::string> device_type;
  std::optional<std::string> name;
  std::optional<std::chrono::seconds> timeout;
};

struct DiscoveryResult {
  std::vector<PeerInfo> peers;
  std::chrono::milliseconds discovery_time{0};
};

struct PeerNotification {
  enum class Type { Discovered, Updated, Lost };

  Type type = Type::Discovered;
  PeerInfo peer;
};

class DiscoverHandler {
public:
  static constexpr std::chrono::seconds kDefaultTimeout{10};

  DiscoverHandler(Runtime& runtime,
                  std::shared_ptr<DiscoveryService> discovery,
                  SecurityGate& gate);
  ~DiscoverHandler();

  DiscoverHandler(const DiscoverHandler&) = delete;
  DiscoverHandler& operator=(const DiscoverHandler&) = delete;

  // One-shot discovery bounded by filters.timeout (default 10 s).
  DiscoveryResult discover(const DiscoveryFilters& filters);

  std::vector<PeerInfo> get_cached_peers() const;
  std::vector<PeerInfo> get_realtime_peers() const { return get_cached_peers(); }
  // Matches id, id prefix or case-insensitive name.
  std::optional<PeerInfo> find_peer(const std::string& name_or_id) const;

  void start_continuous_discovery();
  void stop_continuous_discovery();
  bool continuous() const { return continuous_.load(); }

  // Merges one discovery event into the peer cache. Errors are logged.
  void apply_event(const DiscoveryEvent& event);
  // Re-reads trust for every cached peer (after trust changes).
  void refresh_trust();

  std::shared_ptr<Channel<PeerNotification>> subscribe(std::size_t capacity = 0);

  PeerInfo to_peer_info(const ServiceRecord& record);
  static bool matches(const PeerInfo& peer, const DiscoveryFilters& filters);

  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void ensure_initialized();
  void upsert(const PeerInfo& peer, bool notify);
  void pump_events();

  Runtime& runtime_;
  std::shared_ptr<DiscoveryService> discovery_;
  SecurityGate& gate_;
  std::shared_ptr<Logger> logger_;

  mutable std::shared_mutex peers_mutex_;
  std::vector<PeerInfo> peers_;

  std::mutex lifecycle_mutex_;
  bool initialized_ = false;
  std::atomic<bool> continuous_{false};
  std::shared_ptr<Channel<DiscoveryEvent>> events_;
  std::shared_ptr<PeriodicTask> pump_;

  Broadcaster<PeerNotification> notifications_;
};
