#include "security_gate.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

Logger* security_log() {
  static auto logger = component_logger("security");
  return logger.get();
}

} // namespace

const char* to_string(GatedOperation operation) {
  switch(operation) {
    case GatedOperation::Send: return "send";
    case GatedOperation::Receive: return "receive";
    case GatedOperation::Exec: return "exec";
    case GatedOperation::Stream: return "stream";
    case GatedOperation::StreamViewerAdd: return "stream viewer";
    case GatedOperation::Clipboard: return "clipboard";
    case GatedOperation::Discover: return "discover";
    case GatedOperation::Peers: return "peers";
    case GatedOperation::Status: return "status";
  }
  return "unknown";
}

SecurityGate::SecurityGate(std::shared_ptr<SecuritySystem> security, Confirm confirm)
  : security_(std::move(security)),
    confirm_(std::move(confirm)),
    clock_([]{ return std::chrono::system_clock::now(); }) {
  if(!security_) {
    throw std::invalid_argument("SecurityGate requires a security system");
  }
}

template<typename Fn>
auto SecurityGate::guarded(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Security, std::string(what) + ": " + e.what());
  }
}

void SecurityGate::set_clock(Clock clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_ = std::move(clock);
}

void SecurityGate::set_require_trusted_for_send(bool required) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_trusted_for_send_ = required;
}

bool SecurityGate::require_trusted_for_send() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return require_trusted_for_send_;
}

CLISession SecurityGate::authenticate() {
  auto identity = guarded("Failed to get device identity", [&]{ return security_->get_or_create_identity(); });

  std::lock_guard<std::mutex> lock(mutex_);
  CLISession session;
  session.session_id = new_uuid();
  session.peer_id = identity.derive_peer_id();
  session.identity = std::move(identity);
  session.started_at = clock_();
  session.expires_at = session.started_at + kSessionLifetime;
  session_ = session;
  log_debug(security_log(), "Session {} started for peer {}", session.session_id, session.peer_id);
  return session;
}

std::optional<CLISession> SecurityGate::current_session() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_;
}

bool SecurityGate::is_session_valid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ && clock_() < session_->expires_at;
}

CLISession SecurityGate::ensure_session() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(session_ && clock_() < session_->expires_at) return *session_;
  }
  return authenticate();
}

void SecurityGate::logout() {
  std::lock_guard<std::mutex> lock(mutex_);
  session_.reset();
}

TrustStatus SecurityGate::trust_status(const std::string& peer_id) {
  return guarded("Failed to check trust status", [&]{
    if(security_->is_blocked(peer_id)) return TrustStatus::Blocked;
    if(security_->is_trusted(peer_id)) return TrustStatus::Trusted;
    return TrustStatus::Untrusted;
  });
}

bool SecurityGate::is_peer_trusted(const std::string& peer_id) {
  return trust_status(peer_id) == TrustStatus::Trusted;
}

AuthorizationDecision SecurityGate::authorize_operation(GatedOperation operation, const std::string& peer_id) {
  if(!is_session_valid()) {
    return {false, "No active session. Please authenticate first."};
  }
  auto status = trust_status(peer_id);
  if(status == TrustStatus::Blocked) {
    return {false, "Peer '" + peer_id + "' is blocked"};
  }

  bool private_mode = guarded("Failed to read private mode", [&]{ return security_->is_private_mode(); });
  if(private_mode) {
    bool allowed = guarded("Failed to check connection permission",
                           [&]{ return security_->is_connection_allowed(peer_id); });
    if(!allowed) {
      return {false, "Private mode is enabled and peer '" + peer_id + "' holds no invite"};
    }
  }

  bool needs_trust = false;
  switch(operation) {
    case GatedOperation::Send: needs_trust = require_trusted_for_send(); break;
    case GatedOperation::Exec:
    case GatedOperation::StreamViewerAdd: needs_trust = true; break;
    default: break;
  }
  if(needs_trust && status != TrustStatus::Trusted) {
    return {false, "Peer '" + peer_id + "' is not trusted for " + to_string(operation)};
  }
  return {true, {}};
}

void SecurityGate::require_authorized(GatedOperation operation, const std::string& peer_id) {
  ensure_session();
  auto decision = authorize_operation(operation, peer_id);
  if(!decision.allowed) {
    log_warn(security_log(), "Denied {} for {}: {}", to_string(operation), peer_id, decision.reason);
    throw KizunaError::integration(IntegrationDomain::Security, decision.reason);
  }
}

void SecurityGate::confirm_or_throw(const std::string& question, bool assume_yes, const std::string& declined) {
  if(assume_yes || !confirm_) return;
  if(!confirm_(question)) {
    throw KizunaError::integration(IntegrationDomain::Security, declined);
  }
}

void SecurityGate::add_trusted_peer(const std::string& peer_id, const std::string& nickname, bool assume_yes) {
  confirm_or_throw("Add peer '" + nickname + "' (" + peer_id + ") to the trusted list?",
                   assume_yes, "User declined to add trusted peer");
  guarded("Failed to add trusted peer", [&]{ security_->add_trusted_peer(peer_id, nickname); });
  log_info(security_log(), "Trusted peer {} ({})", peer_id, nickname);
}

void SecurityGate::remove_trusted_peer(const std::string& peer_id, bool assume_yes) {
  confirm_or_throw("Remove peer " + peer_id + " from the trusted list?",
                   assume_yes, "User declined to remove trusted peer");
  guarded("Failed to remove trusted peer", [&]{ security_->remove_trusted_peer(peer_id); });
  log_info(security_log(), "Removed trust for peer {}", peer_id);
}

void SecurityGate::block_peer(const std::string& peer_id, bool assume_yes) {
  confirm_or_throw("Block peer " + peer_id + "?", assume_yes, "User declined to block peer");
  guarded("Failed to block peer", [&]{ security_->block_peer(peer_id); });
  log_info(security_log(), "Blocked peer {}", peer_id);
}

std::vector<TrustEntry> SecurityGate::get_trusted_peers() {
  return guarded("Failed to get trusted peers", [&]{ return security_->get_trusted_peers(); });
}

void SecurityGate::update_peer_permissions(const std::string& peer_id, const ServicePermissions& permissions) {
  guarded("Failed to update peer permissions", [&]{ security_->update_peer_permissions(peer_id, permissions); });
}

PairingCode SecurityGate::generate_pairing_code() {
  return guarded("Failed to generate pairing code", [&]{ return security_->generate_pairing_code(); });
}

bool SecurityGate::verify_and_trust_peer(const std::string& code,
                                         const std::string& peer_id,
                                         const std::string& nickname) {
  bool verified = guarded("Failed to verify pairing code",
                          [&]{ return security_->verify_and_trust_peer(code, peer_id, nickname); });
  if(verified) {
    log_info(security_log(), "Verified peer {} ({})", peer_id, nickname);
  } else {
    log_warn(security_log(), "Pairing code rejected for peer {}", peer_id);
  }
  return verified;
}

void SecurityGate::set_private_mode(bool enabled) {
  guarded("Failed to change private mode", [&]{
    if(enabled) security_->enable_private_mode();
    else security_->disable_private_mode();
  });
  log_info(security_log(), "Private mode {}", enabled ? "enabled" : "disabled");
}

bool SecurityGate::is_private_mode() {
  return guarded("Failed to read private mode", [&]{ return security_->is_private_mode(); });
}

std::string SecurityGate::generate_invite_code(const std::string& peer_id) {
  return guarded("Failed to generate invite code", [&]{ return security_->generate_invite_code(peer_id); });
}
