#pragma once

#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "types.hpp"

class DiscoverHandler;
class SecurityGate;

// Peer listing plus the trust-management actions of the peers verb.
class PeersHandler {
public:
  PeersHandler(DiscoverHandler& discover, SecurityGate& gate);

  std::vector<PeerInfo> get_peers() const;
  PeerInfo get_peer_info(const std::string& name_or_id) const;
  // Known peer's id, otherwise the argument itself as an opaque id.
  std::string resolve_peer_id(const std::string& name_or_id) const;

  void trust(const std::string& peer, const std::string& nickname, bool assume_yes);
  void untrust(const std::string& peer, bool assume_yes);
  void block(const std::string& peer, bool assume_yes);
  std::vector<TrustEntry> trusted_peers();

  PairingCode pair();
  bool verify(const std::string& code, const std::string& peer, const std::string& nickname);

  void set_private_mode(bool enabled);
  bool private_mode();
  std::string invite(const std::string& peer);

private:
  DiscoverHandler& discover_;
  SecurityGate& gate_;
  std::shared_ptr<Logger> logger_;
};
