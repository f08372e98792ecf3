#include "lan_discovery.hpp"

#include <functional>

#include "errors.hpp"
#include "utils.hpp"

using udp = asio::ip::udp;

namespace {

constexpr std::chrono::milliseconds kRunSlice{50};

} // namespace

LanDiscovery::LanDiscovery(LocalNode node, unsigned short port)
  : node_(std::move(node)),
    port_(port),
    logger_(component_logger("lan")) {}

LanDiscovery::~LanDiscovery() {
  shutdown();
}

void LanDiscovery::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(node_.peer_id.empty()) {
    throw KizunaError::integration(IntegrationDomain::Discovery, "Local peer id is not set");
  }
  log_debug(logger_.get(), "Discovery on UDP port {} as {}", port_, node_.peer_id);
}

void LanDiscovery::set_service_port(unsigned short port) {
  std::lock_guard<std::mutex> lock(mutex_);
  node_.service_port = port;
}

std::string LanDiscovery::announce_payload() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return make_announce(node_).dump();
}

std::optional<ServiceRecord> LanDiscovery::parse_announce(const std::string& payload,
                                                          const std::string& sender_host) const {
  json message = json::parse(payload, nullptr, false);
  if(message.is_discarded() || !message.is_object()) return std::nullopt;
  if(message.value("type", "") != "kizuna_announce") return std::nullopt;
  auto peer_id = message.value("peer_id", "");
  if(peer_id.empty()) return std::nullopt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(peer_id == node_.peer_id) return std::nullopt;
  }
  auto port = message.value("port", 0);
  if(port <= 0 || port > 65535) return std::nullopt;

  ServiceRecord record;
  record.peer_id = peer_id;
  record.name = message.value("name", "");
  record.addresses.push_back(format_host_port(sender_host, static_cast<unsigned short>(port)));
  record.capabilities["device_type"] = message.value("device_type", "");
  std::vector<std::string> caps;
  if(message.contains("capabilities") && message["capabilities"].is_array()) {
    for(const auto& cap : message["capabilities"]) {
      if(cap.is_string()) caps.push_back(cap.get<std::string>());
    }
  }
  record.capabilities["capabilities"] = join(caps, ",");
  return record;
}

bool LanDiscovery::remember(const ServiceRecord& record, std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(record.peer_id);
  if(it == peers_.end()) {
    peers_[record.peer_id] = {record, now};
    return true;
  }
  bool changed = it->second.record.name != record.name ||
                 it->second.record.addresses != record.addresses ||
                 it->second.record.capabilities != record.capabilities;
  it->second.record = record;
  it->second.last_seen = now;
  return changed;
}

std::vector<std::string> LanDiscovery::expire_silent(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> lost;
  for(auto it = peers_.begin(); it != peers_.end();) {
    if(now - it->second.last_seen > kPeerTimeout) {
      lost.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return lost;
}

std::vector<ServiceRecord> LanDiscovery::get_cached_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServiceRecord> out;
  for(const auto& entry : peers_) out.push_back(entry.second.record);
  return out;
}

void LanDiscovery::broadcast(udp::socket& socket, const std::string& payload) {
  const udp::endpoint targets[] = {
    udp::endpoint(asio::ip::address_v4::broadcast(), port_),
    udp::endpoint(asio::ip::address_v4::loopback(), port_),
  };
  for(const auto& target : targets) {
    std::error_code ec;
    socket.send_to(asio::buffer(payload), target, 0, ec);
    if(ec) log_debug(logger_.get(), "Send to {} failed: {}", target.address().to_string(), ec.message());
  }
}

std::vector<ServiceRecord> LanDiscovery::discover_once(std::optional<std::chrono::milliseconds> timeout) {
  asio::io_context io;
  udp::socket socket(io);
  std::error_code ec;
  socket.open(udp::v4(), ec);
  if(!ec) socket.set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket.bind(udp::endpoint(udp::v4(), 0), ec);
  if(ec) {
    throw KizunaError::integration(IntegrationDomain::Discovery, "Cannot open discovery socket: " + ec.message());
  }

  std::string query;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    query = make_query(node_.peer_id).dump();
  }
  broadcast(socket, query);

  std::map<std::string, ServiceRecord> found;
  std::array<char, 2048> buffer{};
  udp::endpoint sender;
  std::function<void()> receive_next = [&]{
    socket.async_receive_from(asio::buffer(buffer), sender,
      [&](std::error_code rec, std::size_t length){
        if(rec) return;
        auto record = parse_announce(std::string(buffer.data(), length), sender.address().to_string());
        if(record) {
          remember(*record, std::chrono::steady_clock::now());
          found[record->peer_id] = *record;
        }
        receive_next();
      });
  };
  receive_next();

  auto deadline = std::chrono::steady_clock::now() + timeout.value_or(kDefaultQueryTimeout);
  while(std::chrono::steady_clock::now() < deadline && !io.stopped()) {
    io.run_for(kRunSlice);
  }
  std::error_code ignored;
  socket.close(ignored);
  io.run();

  std::vector<ServiceRecord> out;
  for(auto& entry : found) out.push_back(std::move(entry.second));
  log_debug(logger_.get(), "Query found {} peers", out.size());
  return out;
}

std::shared_ptr<Channel<DiscoveryEvent>> LanDiscovery::start_discovery() {
  if(running_) return events_;
  auto socket = std::make_unique<udp::socket>(io_);
  std::error_code ec;
  socket->open(udp::v4(), ec);
  if(!ec) socket->set_option(udp::socket::reuse_address(true), ec);
  if(!ec) socket->set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket->bind(udp::endpoint(udp::v4(), port_), ec);
  if(ec) {
    throw KizunaError::integration(IntegrationDomain::Discovery,
                                   "Cannot bind discovery port " + std::to_string(port_) + ": " + ec.message());
  }
  socket_ = std::move(socket);
  announce_timer_ = std::make_unique<asio::steady_timer>(io_);
  events_ = std::make_shared<Channel<DiscoveryEvent>>();
  running_ = true;

  io_.restart();
  receive_loop();
  asio::post(io_, [this]{
    broadcast(*socket_, announce_payload());
    schedule_announce();
  });
  io_thread_ = std::thread([this]{ io_.run(); });
  log_info(logger_.get(), "Announcing on UDP port {}", port_);
  return events_;
}

void LanDiscovery::receive_loop() {
  socket_->async_receive_from(asio::buffer(datagram_), sender_,
    [this](std::error_code ec, std::size_t length){
      if(!running_) return;
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        log_debug(logger_.get(), "Discovery receive failed: {}", ec.message());
      } else {
        handle_datagram(length);
      }
      receive_loop();
    });
}

void LanDiscovery::handle_datagram(std::size_t length) {
  std::string payload(datagram_.data(), length);
  json message = json::parse(payload, nullptr, false);
  if(message.is_discarded() || !message.is_object()) return;
  auto type = message.value("type", "");
  if(type == "kizuna_query") {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(message.value("peer_id", "") == node_.peer_id) return;
    }
    std::error_code ec;
    socket_->send_to(asio::buffer(announce_payload()), sender_, 0, ec);
    if(ec) log_debug(logger_.get(), "Announce reply to {} failed: {}", sender_.address().to_string(), ec.message());
    return;
  }
  auto record = parse_announce(payload, sender_.address().to_string());
  if(!record) return;
  if(remember(*record, std::chrono::steady_clock::now())) {
    log_debug(logger_.get(), "Peer {} at {}", record->peer_id, record->addresses.front());
    DiscoveryEvent event;
    event.type = DiscoveryEvent::Type::PeerDiscovered;
    event.record = *record;
    events_->send(event);
  }
}

void LanDiscovery::schedule_announce() {
  announce_timer_->expires_after(kAnnounceInterval);
  announce_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    broadcast(*socket_, announce_payload());
    for(auto& peer_id : expire_silent(std::chrono::steady_clock::now())) {
      log_debug(logger_.get(), "Peer {} went silent", peer_id);
      DiscoveryEvent event;
      event.type = DiscoveryEvent::Type::PeerLost;
      event.peer_id = peer_id;
      events_->send(event);
    }
    schedule_announce();
  });
}

void LanDiscovery::shutdown() {
  if(!running_.exchange(false)) return;
  asio::post(io_, [this]{
    std::error_code ignored;
    if(announce_timer_) announce_timer_->cancel();
    if(socket_) socket_->close(ignored);
  });
  if(io_thread_.joinable()) io_thread_.join();
  socket_.reset();
  announce_timer_.reset();
  if(events_) events_->close();
  log_debug(logger_.get(), "Discovery stopped");
}
