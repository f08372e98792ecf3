#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "channel.hpp"
#include "types.hpp"

// ---- discovery -------------------------------------------------------------

struct ServiceRecord {
  std::string peer_id;
  std::string name;
  std::vector<std::string> addresses; // "host:port"
  std::map<std::string, std::string> capabilities;
};

struct DiscoveryEvent {
  enum class Type { PeerDiscovered, PeerLost, StrategyChanged, Error };

  Type type = Type::PeerDiscovered;
  ServiceRecord record;  // PeerDiscovered
  std::string peer_id;   // PeerLost
  std::string detail;    // StrategyChanged / Error
};

class DiscoveryService {
public:
  virtual ~DiscoveryService() = default;

  virtual void initialize() = 0;
  virtual std::vector<ServiceRecord> discover_once(std::optional<std::chrono::milliseconds> timeout) = 0;
  virtual std::shared_ptr<Channel<DiscoveryEvent>> start_discovery() = 0;
  virtual void shutdown() = 0;
  virtual std::vector<ServiceRecord> get_cached_peers() const = 0;
};

// ---- security --------------------------------------------------------------

struct DeviceIdentity {
  std::string key_fingerprint; // SHA-256 hex of the raw Ed25519 public key
  std::string public_key;      // Ed25519, hex
  std::string device_name;
  SystemTime created_at = std::chrono::system_clock::now();

  // First 128 bits of the fingerprint, lowercase hex.
  std::string derive_peer_id() const;
};

enum class TrustLevel { Verified, Trusted, Blocked };
const char* to_string(TrustLevel level);

struct ServicePermissions {
  bool file_transfer = true;
  bool streaming = true;
  bool clipboard = true;
  bool command_execution = false;
};

struct TrustEntry {
  std::string peer_id;
  std::string nickname;
  TrustLevel level = TrustLevel::Trusted;
  SystemTime added_at = std::chrono::system_clock::now();
  ServicePermissions permissions;
};

struct PairingCode {
  std::string code;
  SystemTime expires_at;
};

using SessionId = std::string;

class SecuritySystem {
public:
  virtual ~SecuritySystem() = default;

  virtual DeviceIdentity get_or_create_identity() = 0;

  virtual bool is_trusted(const std::string& peer_id) = 0;
  virtual bool is_blocked(const std::string& peer_id) = 0;
  virtual void add_trusted_peer(const std::string& peer_id, const std::string& nickname) = 0;
  virtual void remove_trusted_peer(const std::string& peer_id) = 0;
  virtual void block_peer(const std::string& peer_id) = 0;
  virtual std::vector<TrustEntry> get_trusted_peers() = 0;
  virtual void update_peer_permissions(const std::string& peer_id, const ServicePermissions& permissions) = 0;

  // Hex Ed25519 signature by the device key behind get_or_create_identity().
  virtual std::string sign(const std::string& message) = 0;

  virtual SessionId establish_session(const std::string& peer_id) = 0;
  virtual std::vector<unsigned char> encrypt_message(const SessionId& session,
                                                     const std::vector<unsigned char>& plaintext) = 0;
  virtual std::vector<unsigned char> decrypt_message(const SessionId& session,
                                                     const std::vector<unsigned char>& ciphertext) = 0;

  virtual PairingCode generate_pairing_code() = 0;
  virtual bool verify_and_trust_peer(const std::string& code,
                                     const std::string& peer_id,
                                     const std::string& nickname) = 0;

  virtual void enable_private_mode() = 0;
  virtual void disable_private_mode() = 0;
  virtual bool is_private_mode() = 0;
  virtual std::string generate_invite_code(const std::string& peer_id) = 0;
  virtual bool is_connection_allowed(const std::string& peer_id) = 0;
};

// ---- transfer --------------------------------------------------------------

struct SendArgs {
  std::string operation_id;
  std::vector<std::filesystem::path> files;
  std::string peer_id;
  std::string peer_address; // host:port, empty when the service resolves it
  bool compression = true;
  bool encryption = true;
};

struct IncomingOffer {
  std::string operation_id;
  std::string peer_id;
  std::vector<std::string> file_names;
  uint64_t total_bytes = 0;
};

struct ReceiveArgs {
  std::string operation_id;
  std::filesystem::path output_dir;
  std::optional<std::string> from_peer;
  // Decides per offer; returning false rejects it.
  std::function<bool(const IncomingOffer&)> accept;
};

struct TransferEvent {
  enum class Type { Started, Progress, Completed, Failed, Cancelled };

  Type type = Type::Progress;
  std::string operation_id;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  double rate = 0.0; // bytes per second
  std::string error;
};

class TransferService {
public:
  virtual ~TransferService() = default;

  virtual void handle_send(const SendArgs& args) = 0;
  virtual void start_receiving(const ReceiveArgs& args) = 0;
  virtual void stop_receiving() = 0;
  virtual void cancel(const std::string& operation_id) = 0;
  virtual void pause(const std::string& operation_id) = 0;
  virtual void resume(const std::string& operation_id) = 0;
  virtual void set_bandwidth_limit(const std::string& operation_id, std::optional<uint64_t> bytes_per_sec) = 0;
  virtual std::shared_ptr<Channel<TransferEvent>> events() = 0;
};

// ---- streaming -------------------------------------------------------------

enum class StreamQuality { Low, Medium, High, Ultra };
const char* to_string(StreamQuality quality);
std::optional<StreamQuality> stream_quality_from_string(const std::string& value);

enum class StreamSessionState { Starting, Active, Paused, Stopping, Stopped, Error };
const char* to_string(StreamSessionState state);

struct StreamConfig {
  std::string camera;
  StreamQuality quality = StreamQuality::Medium;
};

struct StreamSession {
  std::string session_id;
  StreamSessionState state = StreamSessionState::Starting;
  StreamConfig config;
};

struct StreamEvent {
  enum class Type { SessionStarted, StateChanged, ViewerConnected, ViewerDisconnected, StatsUpdated, SessionStopped, Error };

  Type type = Type::StateChanged;
  std::string session_id;
  StreamSessionState state = StreamSessionState::Starting;
  std::string viewer_id;
  double bitrate = 0.0;
  std::string error;
};

class StreamingService {
public:
  virtual ~StreamingService() = default;

  virtual StreamSession start_camera_stream(const StreamConfig& config) = 0;
  virtual void start_recording(const std::string& session_id, const std::filesystem::path& output) = 0;
  virtual std::string add_viewer(const std::string& session_id, const std::string& peer_id) = 0;
  virtual void remove_viewer(const std::string& session_id, const std::string& viewer_id) = 0;
  virtual void stop_stream(const std::string& session_id) = 0;
  virtual void pause_stream(const std::string& session_id) = 0;
  virtual void resume_stream(const std::string& session_id) = 0;
  virtual std::shared_ptr<Channel<StreamEvent>> events() = 0;
};

// ---- remote command execution ---------------------------------------------

struct ExecRequest {
  std::string command;
  std::string peer_id;
  std::string peer_address;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ExecOutcome {
  std::string output; // stdout and stderr interleaved
  int exit_code = 0;
};

class ExecService {
public:
  virtual ~ExecService() = default;
  virtual ExecOutcome execute(const ExecRequest& request) = 0;
};

// ---- clipboard -------------------------------------------------------------

struct ClipboardEntry {
  std::string id;
  std::string content;
  std::string source_peer;
  SystemTime timestamp = std::chrono::system_clock::now();
};

class ClipboardService {
public:
  virtual ~ClipboardService() = default;

  virtual bool is_sharing_enabled() = 0;
  virtual void set_sharing_enabled(bool enabled) = 0;
  virtual void enable_device(const std::string& peer_id) = 0;
  virtual void disable_device(const std::string& peer_id) = 0;
  virtual std::vector<std::string> enabled_devices() = 0;
  virtual std::string get_content() = 0;
  virtual void set_content(const std::string& content, const std::string& source_peer) = 0;
  virtual std::vector<ClipboardEntry> get_history(std::size_t limit) = 0;
  virtual std::vector<ClipboardEntry> search_history(const std::string& query) = 0;
  virtual void restore(const std::string& entry_id) = 0;
  virtual void clear_history() = 0;
};
