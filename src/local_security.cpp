#include "local_security.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <memory>

#include "errors.hpp"
#include "json_store.hpp"
#include "utils.hpp"

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_digest_context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx) throw KizunaError::integration(IntegrationDomain::Security, "EVP_MD_CTX_new failed");
  return ctx;
}

[[noreturn]] void key_failure(const char* step) {
  throw KizunaError::integration(IntegrationDomain::Security, std::string("Ed25519 ") + step + " failed");
}

CipherContext make_cipher_context() {
  CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if(!ctx) throw KizunaError::integration(IntegrationDomain::Security, "EVP_CIPHER_CTX_new failed");
  return ctx;
}

[[noreturn]] void crypto_failure(const char* step) {
  throw KizunaError::integration(IntegrationDomain::Security, std::string("AES-256-GCM ") + step + " failed");
}

std::optional<TrustLevel> trust_level_from_string(const std::string& value) {
  if(value == "Verified") return TrustLevel::Verified;
  if(value == "Trusted") return TrustLevel::Trusted;
  if(value == "Blocked") return TrustLevel::Blocked;
  return std::nullopt;
}

nlohmann::json permissions_to_json(const ServicePermissions& p) {
  return {{"file_transfer", p.file_transfer},
          {"streaming", p.streaming},
          {"clipboard", p.clipboard},
          {"command_execution", p.command_execution}};
}

ServicePermissions permissions_from_json(const nlohmann::json& j) {
  ServicePermissions p;
  if(!j.is_object()) return p;
  p.file_transfer = j.value("file_transfer", p.file_transfer);
  p.streaming = j.value("streaming", p.streaming);
  p.clipboard = j.value("clipboard", p.clipboard);
  p.command_execution = j.value("command_execution", p.command_execution);
  return p;
}

bool constant_time_equal(const std::string& a, const std::string& b) {
  if(a.size() != b.size()) return false;
  unsigned char diff = 0;
  for(std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return diff == 0;
}

} // namespace

DeviceKey::DeviceKey(const std::vector<unsigned char>& seed) {
  if(seed.size() != kSeedBytes) key_failure("seed length check");
  key_.reset(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()), &EVP_PKEY_free);
  if(!key_) key_failure("key setup");
  std::vector<unsigned char> raw(kPublicKeyBytes);
  std::size_t length = raw.size();
  if(EVP_PKEY_get_raw_public_key(key_.get(), raw.data(), &length) != 1 || length != kPublicKeyBytes) {
    key_failure("public key export");
  }
  public_key_ = hex_from_bytes(raw);
}

DeviceKey DeviceKey::generate() {
  return DeviceKey(random_bytes(kSeedBytes));
}

std::string DeviceKey::sign(const std::string& message) const {
  auto ctx = make_digest_context();
  if(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) key_failure("sign init");
  std::vector<unsigned char> signature(kSignatureBytes);
  std::size_t length = signature.size();
  if(EVP_DigestSign(ctx.get(), signature.data(), &length,
                    reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1) {
    key_failure("sign");
  }
  signature.resize(length);
  return hex_from_bytes(signature);
}

DeviceIdentity DeviceKey::identity(const std::string& device_name) const {
  DeviceIdentity identity;
  auto raw = bytes_from_hex(public_key_).value_or(std::vector<unsigned char>());
  identity.key_fingerprint = hex_from_bytes(sha256_bytes(std::string(raw.begin(), raw.end())));
  identity.public_key = public_key_;
  identity.device_name = device_name;
  return identity;
}

bool verify_device_signature(const std::string& public_key,
                             const std::string& message,
                             const std::string& signature) {
  auto raw_key = bytes_from_hex(public_key);
  auto raw_signature = bytes_from_hex(signature);
  if(!raw_key || raw_key->size() != DeviceKey::kPublicKeyBytes) return false;
  if(!raw_signature || raw_signature->size() != DeviceKey::kSignatureBytes) return false;

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
    EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, raw_key->data(), raw_key->size()), &EVP_PKEY_free);
  if(!key) return false;
  auto ctx = make_digest_context();
  if(EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) return false;
  return EVP_DigestVerify(ctx.get(), raw_signature->data(), raw_signature->size(),
                          reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1;
}

std::string peer_id_for_public_key(const std::string& public_key) {
  auto raw = bytes_from_hex(public_key);
  if(!raw || raw->size() != DeviceKey::kPublicKeyBytes) return {};
  DeviceIdentity identity;
  identity.key_fingerprint = hex_from_bytes(sha256_bytes(std::string(raw->begin(), raw->end())));
  return identity.derive_peer_id();
}

LocalSecuritySystem::LocalSecuritySystem(std::filesystem::path directory, std::string device_name)
  : directory_(std::move(directory)),
    device_name_(std::move(device_name)),
    clock_([]{ return std::chrono::system_clock::now(); }),
    logger_(component_logger("security")) {
  if(device_name_.empty()) device_name_ = local_host_name();
}

void LocalSecuritySystem::set_clock(Clock clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_ = std::move(clock);
}

DeviceIdentity LocalSecuritySystem::get_or_create_identity() {
  std::lock_guard<std::mutex> lock(mutex_);
  device_key_locked();
  return *identity_;
}

std::string LocalSecuritySystem::sign(const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  return device_key_locked().sign(message);
}

// The identity secret doubles as the Ed25519 seed.
const DeviceKey& LocalSecuritySystem::device_key_locked() {
  if(device_key_) return *device_key_;

  auto path = identity_path();
  if(auto doc = read_json_file(path)) {
    auto seed = bytes_from_hex(doc->value("secret", ""));
    if(!seed || seed->size() != kSecretBytes) {
      throw KizunaError::integration(IntegrationDomain::Security, "Corrupt device identity in " + path.string());
    }
    device_key_.emplace(*seed);
    identity_ = device_key_->identity(doc->value("device_name", device_name_));
    identity_->created_at = parse_rfc3339(doc->value("created_at", "")).value_or(clock_());
    return *device_key_;
  }

  auto seed = random_bytes(kSecretBytes);
  device_key_.emplace(seed);
  identity_ = device_key_->identity(device_name_);
  identity_->created_at = clock_();
  nlohmann::json doc;
  doc["secret"] = hex_from_bytes(seed);
  doc["device_name"] = identity_->device_name;
  doc["created_at"] = format_rfc3339(identity_->created_at);
  write_json_file(path, doc);
  log_info(logger_.get(), "Created device identity {}", identity_->derive_peer_id());
  return *device_key_;
}

void LocalSecuritySystem::load_trust() {
  if(trust_loaded_) return;
  trust_loaded_ = true;
  auto doc = read_json_file(trust_path());
  if(!doc) return;

  private_mode_ = doc->value("private_mode", false);
  if(doc->contains("entries") && (*doc)["entries"].is_array()) {
    for(const auto& item : (*doc)["entries"]) {
      auto level = trust_level_from_string(item.value("level", ""));
      auto peer_id = item.value("peer_id", "");
      if(!level || peer_id.empty()) {
        log_warn(logger_.get(), "Skipping malformed trust entry in {}", trust_path().string());
        continue;
      }
      TrustEntry entry;
      entry.peer_id = peer_id;
      entry.nickname = item.value("nickname", "");
      entry.level = *level;
      entry.added_at = parse_rfc3339(item.value("added_at", "")).value_or(clock_());
      entry.permissions = permissions_from_json(item.value("permissions", nlohmann::json::object()));
      entries_.push_back(std::move(entry));
    }
  }
  if(doc->contains("invites") && (*doc)["invites"].is_array()) {
    for(const auto& item : (*doc)["invites"]) {
      InviteCode invite;
      invite.code = item.value("code", "");
      invite.peer_id = item.value("peer_id", "");
      auto expires = parse_rfc3339(item.value("expires_at", ""));
      if(invite.code.empty() || !expires) continue;
      invite.expires_at = *expires;
      invites_.push_back(std::move(invite));
    }
  }
}

void LocalSecuritySystem::save_trust() {
  nlohmann::json entries = nlohmann::json::array();
  for(const auto& entry : entries_) {
    entries.push_back({{"peer_id", entry.peer_id},
                       {"nickname", entry.nickname},
                       {"level", to_string(entry.level)},
                       {"added_at", format_rfc3339(entry.added_at)},
                       {"permissions", permissions_to_json(entry.permissions)}});
  }
  nlohmann::json invites = nlohmann::json::array();
  auto now = clock_();
  for(const auto& invite : invites_) {
    if(invite.expires_at <= now) continue;
    invites.push_back({{"code", invite.code},
                       {"peer_id", invite.peer_id},
                       {"expires_at", format_rfc3339(invite.expires_at)}});
  }
  nlohmann::json doc;
  doc["private_mode"] = private_mode_;
  doc["entries"] = entries;
  doc["invites"] = invites;
  write_json_file(trust_path(), doc);
}

void LocalSecuritySystem::upsert_entry(const std::string& peer_id, const std::string& nickname, TrustLevel level) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const TrustEntry& e){ return e.peer_id == peer_id; });
  if(it == entries_.end()) {
    TrustEntry entry;
    entry.peer_id = peer_id;
    entry.nickname = nickname;
    entry.level = level;
    entry.added_at = clock_();
    entries_.push_back(std::move(entry));
  } else {
    it->level = level;
    if(!nickname.empty()) it->nickname = nickname;
  }
  save_trust();
}

bool LocalSecuritySystem::is_trusted(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  return std::any_of(entries_.begin(), entries_.end(), [&](const TrustEntry& e){
    return e.peer_id == peer_id && e.level != TrustLevel::Blocked;
  });
}

bool LocalSecuritySystem::is_blocked(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  return std::any_of(entries_.begin(), entries_.end(), [&](const TrustEntry& e){
    return e.peer_id == peer_id && e.level == TrustLevel::Blocked;
  });
}

void LocalSecuritySystem::add_trusted_peer(const std::string& peer_id, const std::string& nickname) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  upsert_entry(peer_id, nickname, TrustLevel::Trusted);
  log_info(logger_.get(), "Trusted peer {}", peer_id);
}

void LocalSecuritySystem::remove_trusted_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const TrustEntry& e){ return e.peer_id == peer_id; });
  if(it == entries_.end()) {
    throw KizunaError::integration(IntegrationDomain::Security, "Peer '" + peer_id + "' is not in the trust list");
  }
  entries_.erase(it);
  save_trust();
  log_info(logger_.get(), "Removed peer {} from the trust list", peer_id);
}

void LocalSecuritySystem::block_peer(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  upsert_entry(peer_id, {}, TrustLevel::Blocked);
  log_info(logger_.get(), "Blocked peer {}", peer_id);
}

std::vector<TrustEntry> LocalSecuritySystem::get_trusted_peers() {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  std::vector<TrustEntry> out;
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
               [](const TrustEntry& e){ return e.level != TrustLevel::Blocked; });
  return out;
}

void LocalSecuritySystem::update_peer_permissions(const std::string& peer_id, const ServicePermissions& permissions) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const TrustEntry& e){ return e.peer_id == peer_id; });
  if(it == entries_.end()) {
    throw KizunaError::integration(IntegrationDomain::Security, "Peer '" + peer_id + "' is not in the trust list");
  }
  it->permissions = permissions;
  save_trust();
}

SessionId LocalSecuritySystem::establish_session(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto session = new_uuid();
  sessions_[session] = random_bytes(kKeyBytes);
  log_debug(logger_.get(), "Session {} established for {}", session, peer_id);
  return session;
}

std::vector<unsigned char> LocalSecuritySystem::session_key(const SessionId& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session);
  if(it == sessions_.end()) {
    throw KizunaError::integration(IntegrationDomain::Security, "Unknown session " + session);
  }
  return it->second;
}

std::vector<unsigned char> LocalSecuritySystem::encrypt_message(const SessionId& session,
                                                                const std::vector<unsigned char>& plaintext) {
  auto key = session_key(session);
  auto iv = random_bytes(kIvBytes);
  auto ctx = make_cipher_context();

  if(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) crypto_failure("init");
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1) crypto_failure("iv setup");
  if(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) crypto_failure("key setup");

  std::vector<unsigned char> out(iv);
  out.resize(kIvBytes + plaintext.size() + kTagBytes);
  int len = 0;
  if(!plaintext.empty()) {
    if(EVP_EncryptUpdate(ctx.get(), out.data() + kIvBytes, &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      crypto_failure("encrypt");
    }
  }
  int written = len;
  if(EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvBytes + written, &len) != 1) crypto_failure("finalize");
  written += len;
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes),
                         out.data() + kIvBytes + written) != 1) {
    crypto_failure("tag");
  }
  out.resize(kIvBytes + static_cast<std::size_t>(written) + kTagBytes);
  return out;
}

std::vector<unsigned char> LocalSecuritySystem::decrypt_message(const SessionId& session,
                                                                const std::vector<unsigned char>& ciphertext) {
  if(ciphertext.size() < kIvBytes + kTagBytes) {
    throw KizunaError::integration(IntegrationDomain::Security, "Ciphertext too short");
  }
  auto key = session_key(session);
  auto ctx = make_cipher_context();
  std::size_t body = ciphertext.size() - kIvBytes - kTagBytes;

  if(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) crypto_failure("init");
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvBytes), nullptr) != 1) crypto_failure("iv setup");
  if(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), ciphertext.data()) != 1) crypto_failure("key setup");

  std::vector<unsigned char> out(body + kTagBytes);
  int len = 0;
  if(body > 0) {
    if(EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data() + kIvBytes, static_cast<int>(body)) != 1) {
      crypto_failure("decrypt");
    }
  }
  int written = len;
  std::vector<unsigned char> tag(ciphertext.end() - static_cast<std::ptrdiff_t>(kTagBytes), ciphertext.end());
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), tag.data()) != 1) {
    crypto_failure("tag setup");
  }
  if(EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
    throw KizunaError::integration(IntegrationDomain::Security, "Message authentication failed");
  }
  written += len;
  out.resize(static_cast<std::size_t>(written));
  return out;
}

PairingCode LocalSecuritySystem::generate_pairing_code() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  for(auto it = pairing_codes_.begin(); it != pairing_codes_.end();) {
    it = it->second.expires_at <= now ? pairing_codes_.erase(it) : std::next(it);
  }

  auto bytes = random_bytes(4);
  uint32_t value = 0;
  for(auto b : bytes) value = (value << 8) | b;
  PairingCode code;
  code.code = fmt::format("{:06}", value % 1000000);
  code.expires_at = now + kPairingLifetime;
  pairing_codes_[code.code] = code;
  return code;
}

bool LocalSecuritySystem::verify_and_trust_peer(const std::string& code,
                                                const std::string& peer_id,
                                                const std::string& nickname) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  auto match = pairing_codes_.end();
  for(auto it = pairing_codes_.begin(); it != pairing_codes_.end(); ++it) {
    if(constant_time_equal(it->first, code)) match = it;
  }
  if(match == pairing_codes_.end()) return false;
  bool expired = match->second.expires_at <= now;
  pairing_codes_.erase(match);
  if(expired) {
    log_info(logger_.get(), "Pairing code for {} expired", peer_id);
    return false;
  }
  load_trust();
  upsert_entry(peer_id, nickname, TrustLevel::Verified);
  log_info(logger_.get(), "Verified peer {}", peer_id);
  return true;
}

void LocalSecuritySystem::enable_private_mode() {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  private_mode_ = true;
  save_trust();
}

void LocalSecuritySystem::disable_private_mode() {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  private_mode_ = false;
  save_trust();
}

bool LocalSecuritySystem::is_private_mode() {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  return private_mode_;
}

std::string LocalSecuritySystem::generate_invite_code(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  InviteCode invite;
  invite.code = random_hex(8);
  invite.peer_id = peer_id;
  invite.expires_at = clock_() + kInviteLifetime;
  invites_.push_back(invite);
  save_trust();
  return invite.code;
}

bool LocalSecuritySystem::is_connection_allowed(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  load_trust();
  for(const auto& entry : entries_) {
    if(entry.peer_id != peer_id) continue;
    if(entry.level == TrustLevel::Blocked) return false;
    return true;
  }
  if(!private_mode_) return true;
  auto now = clock_();
  return std::any_of(invites_.begin(), invites_.end(), [&](const InviteCode& invite){
    return invite.peer_id == peer_id && invite.expires_at > now;
  });
}
