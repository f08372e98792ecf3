#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "collaborators.hpp"
#include "log.hpp"
#include "protocol.hpp"

// UDP broadcast discovery. One-shot queries use an ephemeral socket; the
// continuous mode binds the discovery port, answers queries and announces
// this node periodically.
class LanDiscovery : public DiscoveryService {
public:
  static constexpr std::chrono::seconds kAnnounceInterval{5};
  static constexpr std::chrono::seconds kPeerTimeout{15};
  static constexpr std::chrono::milliseconds kDefaultQueryTimeout{3000};

  explicit LanDiscovery(LocalNode node, unsigned short port = kDefaultDiscoveryPort);
  ~LanDiscovery() override;

  LanDiscovery(const LanDiscovery&) = delete;
  LanDiscovery& operator=(const LanDiscovery&) = delete;

  void initialize() override;
  std::vector<ServiceRecord> discover_once(std::optional<std::chrono::milliseconds> timeout) override;
  std::shared_ptr<Channel<DiscoveryEvent>> start_discovery() override;
  void shutdown() override;
  std::vector<ServiceRecord> get_cached_peers() const override;

  // The TCP port announced to peers; changes after the peer service binds.
  void set_service_port(unsigned short port);
  unsigned short discovery_port() const { return port_; }

  // Decodes an announce datagram sent from sender_host. Our own announces and
  // anything that is not an announce yield nullopt.
  std::optional<ServiceRecord> parse_announce(const std::string& payload, const std::string& sender_host) const;

  // Records an announce. Returns true when the peer is new or its record changed.
  bool remember(const ServiceRecord& record, std::chrono::steady_clock::time_point now);
  // Forgets peers silent for longer than kPeerTimeout and returns their ids.
  std::vector<std::string> expire_silent(std::chrono::steady_clock::time_point now);

private:
  struct Seen {
    ServiceRecord record;
    std::chrono::steady_clock::time_point last_seen;
  };

  std::string announce_payload() const;
  void receive_loop();
  void handle_datagram(std::size_t length);
  void schedule_announce();
  void broadcast(asio::ip::udp::socket& socket, const std::string& payload);

  mutable std::mutex mutex_;
  LocalNode node_;
  unsigned short port_;
  std::shared_ptr<Logger> logger_;
  std::map<std::string, Seen> peers_;

  asio::io_context io_;
  std::unique_ptr<asio::ip::udp::socket> socket_;
  std::unique_ptr<asio::steady_timer> announce_timer_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::shared_ptr<Channel<DiscoveryEvent>> events_;
  std::array<char, 2048> datagram_{};
  asio::ip::udp::endpoint sender_;
};
