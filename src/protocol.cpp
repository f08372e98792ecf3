#include "protocol.hpp"

json make_query(const std::string& peer_id) {
  json j;
  j["type"] = "kizuna_query";
  j["peer_id"] = peer_id;
  return j;
}

json make_announce(const LocalNode& node) {
  json j;
  j["type"] = "kizuna_announce";
  j["peer_id"] = node.peer_id;
  j["name"] = node.name;
  j["device_type"] = node.device_type;
  j["capabilities"] = node.capabilities;
  j["port"] = node.service_port;
  return j;
}

json make_file_offer(const std::string& operation_id,
                     const LocalNode& sender,
                     const std::vector<OfferedFile>& files,
                     bool compression,
                     bool encryption) {
  json j;
  j["type"] = "file_offer";
  j["operation_id"] = operation_id;
  j["peer_id"] = sender.peer_id;
  j["name"] = sender.name;
  j["compression"] = compression;
  j["encryption"] = encryption;
  uint64_t total = 0;
  json list = json::array();
  for(const auto& file : files) {
    list.push_back({{"name", file.name}, {"size", file.size}});
    total += file.size;
  }
  j["files"] = list;
  j["total_bytes"] = total;
  return j;
}

json make_offer_reply(const std::string& operation_id, bool accepted, const std::string& reason) {
  json j;
  j["type"] = "file_offer_reply";
  j["operation_id"] = operation_id;
  j["accepted"] = accepted;
  if(!reason.empty()) j["reason"] = reason;
  return j;
}

json make_file_complete(const std::string& operation_id, uint64_t bytes) {
  json j;
  j["type"] = "file_complete";
  j["operation_id"] = operation_id;
  j["bytes"] = bytes;
  return j;
}

json make_exec_request(const std::string& peer_id,
                       const std::string& public_key,
                       const std::string& command,
                       std::optional<int64_t> timeout_ms) {
  json j;
  j["type"] = "exec_request";
  j["peer_id"] = peer_id;
  j["public_key"] = public_key;
  j["command"] = command;
  if(timeout_ms) j["timeout_ms"] = *timeout_ms;
  return j;
}

json make_exec_challenge(const std::string& nonce) {
  json j;
  j["type"] = "exec_challenge";
  j["nonce"] = nonce;
  return j;
}

json make_exec_auth(const std::string& signature) {
  json j;
  j["type"] = "exec_auth";
  j["signature"] = signature;
  return j;
}

std::string exec_signing_payload(const std::string& nonce,
                                 const std::string& target_peer_id,
                                 const std::string& command) {
  return "kizuna-exec\n" + nonce + "\n" + target_peer_id + "\n" + command;
}

json make_exec_result(const std::string& output, int exit_code) {
  json j;
  j["type"] = "exec_result";
  j["output"] = output;
  j["exit_code"] = exit_code;
  return j;
}

json make_error(const std::string& message) {
  json j;
  j["type"] = "error";
  j["message"] = message;
  return j;
}

std::vector<OfferedFile> offered_files(const json& offer) {
  std::vector<OfferedFile> files;
  if(!offer.contains("files") || !offer["files"].is_array()) return files;
  for(const auto& item : offer["files"]) {
    OfferedFile file;
    file.name = item.value("name", "");
    file.size = item.value("size", uint64_t{0});
    files.push_back(std::move(file));
  }
  return files;
}

std::optional<HostPort> parse_host_port(const std::string& address, unsigned short default_port) {
  if(address.empty()) return std::nullopt;
  HostPort out;
  std::string port_text;
  if(address.front() == '[') {
    auto close = address.find(']');
    if(close == std::string::npos) return std::nullopt;
    out.host = address.substr(1, close - 1);
    if(close + 1 < address.size()) {
      if(address[close + 1] != ':') return std::nullopt;
      port_text = address.substr(close + 2);
    }
  } else {
    auto colon = address.rfind(':');
    if(colon != std::string::npos && address.find(':') == colon) {
      out.host = address.substr(0, colon);
      port_text = address.substr(colon + 1);
    } else {
      out.host = address;
    }
  }
  if(out.host.empty()) return std::nullopt;
  if(port_text.empty()) {
    if(default_port == 0) return std::nullopt;
    out.port = default_port;
    return out;
  }
  try {
    auto value = std::stoul(port_text);
    if(value == 0 || value > 65535) return std::nullopt;
    out.port = static_cast<unsigned short>(value);
  } catch(const std::exception&) {
    return std::nullopt;
  }
  return out;
}

std::string format_host_port(const std::string& host, unsigned short port) {
  if(host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}
