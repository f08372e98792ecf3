#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "types.hpp"

enum class GatedOperation { Send, Receive, Exec, Stream, StreamViewerAdd, Clipboard, Discover, Peers, Status };
const char* to_string(GatedOperation operation);

struct CLISession {
  std::string session_id;
  DeviceIdentity identity;
  std::string peer_id;
  SystemTime started_at;
  SystemTime expires_at;
};

struct AuthorizationDecision {
  bool allowed = false;
  std::string reason;
};

// Per-process authorization gate in front of every peer-touching operation.
// All SecuritySystem failures surface as Integration(Security).
class SecurityGate {
public:
  using Confirm = std::function<bool(const std::string& question)>;
  using Clock = std::function<SystemTime()>;

  static constexpr std::chrono::hours kSessionLifetime{24};

  // confirm is asked before trust changes; an empty confirm always agrees.
  explicit SecurityGate(std::shared_ptr<SecuritySystem> security, Confirm confirm = {});

  void set_clock(Clock clock);
  void set_require_trusted_for_send(bool required);
  bool require_trusted_for_send() const;

  CLISession authenticate();
  std::optional<CLISession> current_session() const;
  bool is_session_valid() const;
  CLISession ensure_session();
  void logout();

  TrustStatus trust_status(const std::string& peer_id);
  bool is_peer_trusted(const std::string& peer_id);

  AuthorizationDecision authorize_operation(GatedOperation operation, const std::string& peer_id);
  // Starts a session when none is valid. Throws Integration(Security) with
  // the decision's reason when denied.
  void require_authorized(GatedOperation operation, const std::string& peer_id);

  void add_trusted_peer(const std::string& peer_id, const std::string& nickname, bool assume_yes = false);
  void remove_trusted_peer(const std::string& peer_id, bool assume_yes = false);
  void block_peer(const std::string& peer_id, bool assume_yes = false);
  std::vector<TrustEntry> get_trusted_peers();
  void update_peer_permissions(const std::string& peer_id, const ServicePermissions& permissions);

  PairingCode generate_pairing_code();
  bool verify_and_trust_peer(const std::string& code, const std::string& peer_id, const std::string& nickname);

  void set_private_mode(bool enabled);
  bool is_private_mode();
  std::string generate_invite_code(const std::string& peer_id);

  const std::shared_ptr<SecuritySystem>& system() const { return security_; }

private:
  void confirm_or_throw(const std::string& question, bool assume_yes, const std::string& declined);
  template<typename Fn>
  auto guarded(const char* what, Fn&& fn) -> decltype(fn());

  std::shared_ptr<SecuritySystem> security_;
  Confirm confirm_;
  Clock clock_;
  bool require_trusted_for_send_ = true;
  mutable std::mutex mutex_;
  std::optional<CLISession> session_;
};
