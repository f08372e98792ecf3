#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
// Every message is one JSON object terminated by '\n'. File bodies follow
// their header as raw bytes.
inline constexpr unsigned short kDefaultDiscoveryPort = 47800;
inline constexpr unsigned short kDefaultServicePort = 47801;
inline constexpr std::size_t kChunkSize = 64 * 1024;

// What this device announces about itself.
struct LocalNode {
  std::string peer_id;
  std::string name;
  std::string device_type = "desktop";
  std::vector<std::string> capabilities;
  unsigned short service_port = kDefaultServicePort;
};

struct OfferedFile {
  std::string name;
  uint64_t size = 0;
};

json make_query(const std::string& peer_id);
json make_announce(const LocalNode& node);

json make_file_offer(const std::string& operation_id,
                     const LocalNode& sender,
                     const std::vector<OfferedFile>& files,
                     bool compression,
                     bool encryption);
json make_offer_reply(const std::string& operation_id, bool accepted, const std::string& reason = "");
json make_file_complete(const std::string& operation_id, uint64_t bytes);

// Exec is a challenge round: exec_request -> exec_challenge -> exec_auth ->
// exec_result (or error at any step).
json make_exec_request(const std::string& peer_id,
                       const std::string& public_key,
                       const std::string& command,
                       std::optional<int64_t> timeout_ms);
json make_exec_challenge(const std::string& nonce);
json make_exec_auth(const std::string& signature);
std::string exec_signing_payload(const std::string& nonce,
                                 const std::string& target_peer_id,
                                 const std::string& command);
json make_exec_result(const std::string& output, int exit_code);
json make_error(const std::string& message);

std::vector<OfferedFile> offered_files(const json& offer);

struct HostPort {
  std::string host;
  unsigned short port = 0;
};

// "host:port", "[v6]:port" or a bare host with default_port.
std::optional<HostPort> parse_host_port(const std::string& address, unsigned short default_port = 0);
std::string format_host_port(const std::string& host, unsigned short port);
