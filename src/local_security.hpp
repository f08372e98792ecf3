#pragma once

#include <openssl/evp.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"

// Ed25519 device key. The identity secret is its seed and peer ids are cut
// from the public half, so a peer can prove the id it claims.
class DeviceKey {
public:
  static constexpr std::size_t kSeedBytes = 32;
  static constexpr std::size_t kPublicKeyBytes = 32;
  static constexpr std::size_t kSignatureBytes = 64;

  explicit DeviceKey(const std::vector<unsigned char>& seed);
  static DeviceKey generate();

  // Hex.
  const std::string& public_key() const { return public_key_; }
  // Hex signature over message.
  std::string sign(const std::string& message) const;
  DeviceIdentity identity(const std::string& device_name) const;

private:
  std::shared_ptr<EVP_PKEY> key_;
  std::string public_key_;
};

// False for malformed keys or signatures as well as for a bad signature.
bool verify_device_signature(const std::string& public_key,
                             const std::string& message,
                             const std::string& signature);
// Same derivation as DeviceIdentity::derive_peer_id; empty for a malformed key.
std::string peer_id_for_public_key(const std::string& public_key);

struct InviteCode {
  std::string code;
  std::string peer_id;
  SystemTime expires_at;
};

// File-backed SecuritySystem. identity.json holds the device secret,
// trust.json the trust list, private-mode flag and invites.
class LocalSecuritySystem : public SecuritySystem {
public:
  using Clock = std::function<SystemTime()>;

  static constexpr std::chrono::minutes kPairingLifetime{5};
  static constexpr std::chrono::hours kInviteLifetime{24};
  static constexpr std::size_t kSecretBytes = 32;
  static constexpr std::size_t kKeyBytes = 32;
  static constexpr std::size_t kIvBytes = 12;
  static constexpr std::size_t kTagBytes = 16;

  explicit LocalSecuritySystem(std::filesystem::path directory, std::string device_name = {});

  void set_clock(Clock clock);

  DeviceIdentity get_or_create_identity() override;
  std::string sign(const std::string& message) override;

  bool is_trusted(const std::string& peer_id) override;
  bool is_blocked(const std::string& peer_id) override;
  void add_trusted_peer(const std::string& peer_id, const std::string& nickname) override;
  void remove_trusted_peer(const std::string& peer_id) override;
  void block_peer(const std::string& peer_id) override;
  std::vector<TrustEntry> get_trusted_peers() override;
  void update_peer_permissions(const std::string& peer_id, const ServicePermissions& permissions) override;

  SessionId establish_session(const std::string& peer_id) override;
  // Output layout: 12-byte IV, ciphertext, 16-byte GCM tag.
  std::vector<unsigned char> encrypt_message(const SessionId& session,
                                             const std::vector<unsigned char>& plaintext) override;
  std::vector<unsigned char> decrypt_message(const SessionId& session,
                                             const std::vector<unsigned char>& ciphertext) override;

  PairingCode generate_pairing_code() override;
  bool verify_and_trust_peer(const std::string& code,
                             const std::string& peer_id,
                             const std::string& nickname) override;

  void enable_private_mode() override;
  void disable_private_mode() override;
  bool is_private_mode() override;
  std::string generate_invite_code(const std::string& peer_id) override;
  bool is_connection_allowed(const std::string& peer_id) override;

  std::filesystem::path identity_path() const { return directory_ / "identity.json"; }
  std::filesystem::path trust_path() const { return directory_ / "trust.json"; }

private:
  void load_trust();
  void save_trust();
  void upsert_entry(const std::string& peer_id, const std::string& nickname, TrustLevel level);
  std::vector<unsigned char> session_key(const SessionId& session);
  const DeviceKey& device_key_locked();

  std::filesystem::path directory_;
  std::string device_name_;
  Clock clock_;
  std::shared_ptr<Logger> logger_;

  std::mutex mutex_;
  std::optional<DeviceIdentity> identity_;
  std::optional<DeviceKey> device_key_;
  bool trust_loaded_ = false;
  std::vector<TrustEntry> entries_;
  std::vector<InviteCode> invites_;
  bool private_mode_ = false;
  std::map<std::string, PairingCode> pairing_codes_;
  std::map<SessionId, std::vector<unsigned char>> sessions_;
};
