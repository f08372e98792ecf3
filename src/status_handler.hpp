#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

class DiscoverHandler;
class TransferHandler;
class StreamingHandler;
class ClipboardHandler;

struct SystemStatus {
  std::string version;
  std::chrono::seconds uptime{0};
  std::size_t connected_peers = 0;
  std::size_t active_transfers = 0;
  std::size_t active_streams = 0;
  bool clipboard_sync_enabled = false;
  bool discovery_enabled = false;
};

void to_json(nlohmann::json& j, const SystemStatus& status);

const char* kizuna_version();

class StatusHandler {
public:
  // clipboard may be null when no clipboard collaborator is wired in.
  StatusHandler(DiscoverHandler& discover,
                TransferHandler& transfer,
                StreamingHandler& streaming,
                ClipboardHandler* clipboard);

  SystemStatus get_system_status();

private:
  DiscoverHandler& discover_;
  TransferHandler& transfer_;
  StreamingHandler& streaming_;
  ClipboardHandler* clipboard_;
  std::chrono::steady_clock::time_point started_;
};
