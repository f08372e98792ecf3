#include "peers_handler.hpp"

#include "discover_handler.hpp"
#include "errors.hpp"
#include "security_gate.hpp"
#include "utils.hpp"

PeersHandler::PeersHandler(DiscoverHandler& discover, SecurityGate& gate)
  : discover_(discover),
    gate_(gate),
    logger_(component_logger("peers")) {}

std::vector<PeerInfo> PeersHandler::get_peers() const {
  return discover_.get_realtime_peers();
}

PeerInfo PeersHandler::get_peer_info(const std::string& name_or_id) const {
  if(auto peer = discover_.find_peer(name_or_id)) return *peer;
  throw KizunaError::integration(IntegrationDomain::Discovery, "Peer " + name_or_id + " not found");
}

std::string PeersHandler::resolve_peer_id(const std::string& name_or_id) const {
  if(auto peer = discover_.find_peer(name_or_id)) return peer->id;
  auto id = to_lower(trim_copy(name_or_id));
  if(id.empty()) throw KizunaError::missing_argument("peer");
  return id;
}

void PeersHandler::trust(const std::string& peer, const std::string& nickname, bool assume_yes) {
  auto id = resolve_peer_id(peer);
  auto name = nickname;
  if(name.empty()) {
    auto known = discover_.find_peer(id);
    name = known ? known->name : id;
  }
  gate_.add_trusted_peer(id, name, assume_yes);
  discover_.refresh_trust();
}

void PeersHandler::untrust(const std::string& peer, bool assume_yes) {
  gate_.remove_trusted_peer(resolve_peer_id(peer), assume_yes);
  discover_.refresh_trust();
}

void PeersHandler::block(const std::string& peer, bool assume_yes) {
  gate_.block_peer(resolve_peer_id(peer), assume_yes);
  discover_.refresh_trust();
}

std::vector<TrustEntry> PeersHandler::trusted_peers() {
  return gate_.get_trusted_peers();
}

PairingCode PeersHandler::pair() {
  auto code = gate_.generate_pairing_code();
  log_debug(logger_.get(), "Pairing code issued, expires {}", format_rfc3339(code.expires_at));
  return code;
}

bool PeersHandler::verify(const std::string& code, const std::string& peer, const std::string& nickname) {
  auto id = resolve_peer_id(peer);
  bool verified = gate_.verify_and_trust_peer(code, id, nickname.empty() ? id : nickname);
  if(verified) discover_.refresh_trust();
  return verified;
}

void PeersHandler::set_private_mode(bool enabled) {
  gate_.set_private_mode(enabled);
}

bool PeersHandler::private_mode() {
  return gate_.is_private_mode();
}

std::string PeersHandler::invite(const std::string& peer) {
  return gate_.generate_invite_code(resolve_peer_id(peer));
}
