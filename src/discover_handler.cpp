#include "discover_handler.hpp"

#include <algorithm>

#include "errors.hpp"
#include "security_gate.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kMaxEventsPerTick = 256;

} // namespace

DiscoverHandler::DiscoverHandler(Runtime& runtime,
                                 std::shared_ptr<DiscoveryService> discovery,
                                 SecurityGate& gate)
  : runtime_(runtime),
    discovery_(std::move(discovery)),
    gate_(gate),
    logger_(component_logger("discover")) {}

DiscoverHandler::~DiscoverHandler() {
  stop_continuous_discovery();
}

void DiscoverHandler::ensure_initialized() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if(initialized_) return;
  try {
    discovery_->initialize();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Discovery,
                                   std::string("Failed to initialize discovery: ") + e.what());
  }
  initialized_ = true;
}

PeerInfo DiscoverHandler::to_peer_info(const ServiceRecord& record) {
  PeerInfo peer;
  peer.id = record.peer_id;
  peer.name = record.name;
  auto caps = record.capabilities;
  if(peer.name.empty()) {
    auto it = caps.find("name");
    peer.name = it != caps.end() ? it->second : record.peer_id;
  }
  if(auto it = caps.find("device_type"); it != caps.end() && !it->second.empty()) {
    peer.device_type = it->second;
  }
  if(auto it = caps.find("capabilities"); it != caps.end()) {
    for(auto& cap : split(it->second, ',')) {
      auto trimmed = trim_copy(cap);
      if(!trimmed.empty()) peer.capabilities.push_back(trimmed);
    }
  }
  peer.addresses = record.addresses;
  peer.connection_status = record.addresses.empty() ? ConnectionStatus::Disconnected
                                                    : ConnectionStatus::Connected;
  try {
    peer.trust_status = gate_.trust_status(record.peer_id);
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Trust lookup failed for {}: {}", record.peer_id, e.what());
    peer.trust_status = TrustStatus::Untrusted;
  }
  peer.last_seen = std::chrono::system_clock::now();
  return peer;
}

bool DiscoverHandler::matches(const PeerInfo& peer, const DiscoveryFilters& filters) {
  if(filters.device_type && !contains_icase(peer.device_type, *filters.device_type)) return false;
  if(filters.name && !contains_icase(peer.name, *filters.name)) return false;
  return true;
}

DiscoveryResult DiscoverHandler::discover(const DiscoveryFilters& filters) {
  auto start = std::chrono::steady_clock::now();
  ensure_initialized();

  auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(filters.timeout.value_or(kDefaultTimeout));
  std::vector<ServiceRecord> records;
  try {
    records = discovery_->discover_once(timeout);
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Discovery, std::string("Discovery failed: ") + e.what());
  }

  DiscoveryResult result;
  for(const auto& record : records) {
    auto peer = to_peer_info(record);
    upsert(peer, false);
    if(matches(peer, filters)) result.peers.push_back(std::move(peer));
  }
  result.discovery_time = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  log_debug(logger_.get(), "Discovered {} peers ({} after filters) in {} ms",
            records.size(), result.peers.size(), result.discovery_time.count());
  return result;
}

std::vector<PeerInfo> DiscoverHandler::get_cached_peers() const {
  std::shared_lock<std::shared_mutex> lock(peers_mutex_);
  return peers_;
}

std::optional<PeerInfo> DiscoverHandler::find_peer(const std::string& name_or_id) const {
  auto needle = to_lower(trim_copy(name_or_id));
  if(needle.empty()) return std::nullopt;
  std::shared_lock<std::shared_mutex> lock(peers_mutex_);
  for(const auto& peer : peers_) {
    if(peer.id == needle) return peer;
  }
  for(const auto& peer : peers_) {
    if(to_lower(peer.name) == needle) return peer;
  }
  std::optional<PeerInfo> prefix_match;
  for(const auto& peer : peers_) {
    if(peer.id.rfind(needle, 0) == 0) {
      if(prefix_match) return std::nullopt; // ambiguous
      prefix_match = peer;
    }
  }
  return prefix_match;
}

void DiscoverHandler::upsert(const PeerInfo& peer, bool notify) {
  PeerNotification notification;
  {
    std::unique_lock<std::shared_mutex> lock(peers_mutex_);
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [&](const PeerInfo& existing){ return existing.id == peer.id; });
    if(it == peers_.end()) {
      peers_.push_back(peer);
      notification.type = PeerNotification::Type::Discovered;
    } else {
      *it = peer;
      notification.type = PeerNotification::Type::Updated;
    }
    notification.peer = peer;
  }
  if(notify) notifications_.publish(notification);
}

void DiscoverHandler::apply_event(const DiscoveryEvent& event) {
  switch(event.type) {
    case DiscoveryEvent::Type::PeerDiscovered: {
      auto peer = to_peer_info(event.record);
      log_debug(logger_.get(), "Peer discovered: {} ({})", peer.name, peer.id);
      upsert(peer, true);
      break;
    }
    case DiscoveryEvent::Type::PeerLost: {
      std::optional<PeerInfo> lost;
      {
        std::unique_lock<std::shared_mutex> lock(peers_mutex_);
        for(auto& peer : peers_) {
          if(peer.id == event.peer_id) {
            peer.connection_status = ConnectionStatus::Disconnected;
            peer.last_seen = std::chrono::system_clock::now();
            lost = peer;
            break;
          }
        }
      }
      if(lost) {
        log_debug(logger_.get(), "Peer lost: {}", event.peer_id);
        notifications_.publish({PeerNotification::Type::Lost, *lost});
      }
      break;
    }
    case DiscoveryEvent::Type::StrategyChanged:
      log_debug(logger_.get(), "Discovery strategy changed: {}", event.detail);
      break;
    case DiscoveryEvent::Type::Error:
      log_warn(logger_.get(), "Discovery error: {}", event.detail);
      break;
  }
}

void DiscoverHandler::refresh_trust() {
  std::vector<PeerInfo> changed;
  {
    std::unique_lock<std::shared_mutex> lock(peers_mutex_);
    for(auto& peer : peers_) {
      try {
        auto status = gate_.trust_status(peer.id);
        if(status != peer.trust_status) {
          peer.trust_status = status;
          changed.push_back(peer);
        }
      } catch(const std::exception& e) {
        log_warn(logger_.get(), "Trust lookup failed for {}: {}", peer.id, e.what());
      }
    }
  }
  for(auto& peer : changed) {
    notifications_.publish({PeerNotification::Type::Updated, std::move(peer)});
  }
}

void DiscoverHandler::start_continuous_discovery() {
  ensure_initialized();
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if(continuous_) return;
  try {
    events_ = discovery_->start_discovery();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Discovery,
                                   std::string("Failed to start continuous discovery: ") + e.what());
  }
  for(const auto& record : discovery_->get_cached_peers()) {
    upsert(to_peer_info(record), true);
  }
  continuous_ = true;
  pump_ = runtime_.every(std::chrono::milliseconds(20), [this]{ pump_events(); });
  log_info(logger_.get(), "Continuous discovery started");
}

void DiscoverHandler::stop_continuous_discovery() {
  std::shared_ptr<PeriodicTask> pump;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if(!continuous_) return;
    continuous_ = false;
    pump = std::move(pump_);
    events_.reset();
  }
  if(pump) pump->cancel();
  try {
    discovery_->shutdown();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Discovery shutdown failed: {}", e.what());
  }
  log_info(logger_.get(), "Continuous discovery stopped");
}

void DiscoverHandler::pump_events() {
  std::shared_ptr<Channel<DiscoveryEvent>> events;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    events = events_;
  }
  if(!events) return;
  for(auto& event : events->drain(kMaxEventsPerTick)) {
    try {
      apply_event(event);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Dropped discovery event: {}", e.what());
    }
  }
}

std::shared_ptr<Channel<PeerNotification>> DiscoverHandler::subscribe(std::size_t capacity) {
  return notifications_.subscribe(capacity);
}
