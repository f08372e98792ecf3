#include "status_handler.hpp"

#include <algorithm>

#include "clipboard_handler.hpp"
#include "discover_handler.hpp"
#include "log.hpp"
#include "streaming_handler.hpp"
#include "transfer_handler.hpp"

#ifndef KIZUNA_VERSION
#define KIZUNA_VERSION "0.1.0"
#endif

namespace {

std::size_t count_in_progress(const std::vector<OperationStatus>& operations) {
  return static_cast<std::size_t>(std::count_if(operations.begin(), operations.end(),
    [](const OperationStatus& op){ return op.state.kind == OperationState::Kind::InProgress; }));
}

} // namespace

const char* kizuna_version() {
  return KIZUNA_VERSION;
}

void to_json(nlohmann::json& j, const SystemStatus& status) {
  j = nlohmann::json{
    {"version", status.version},
    {"uptime_seconds", status.uptime.count()},
    {"connected_peers", status.connected_peers},
    {"active_transfers", status.active_transfers},
    {"active_streams", status.active_streams},
    {"clipboard_sync_enabled", status.clipboard_sync_enabled},
    {"discovery_enabled", status.discovery_enabled},
  };
}

StatusHandler::StatusHandler(DiscoverHandler& discover,
                             TransferHandler& transfer,
                             StreamingHandler& streaming,
                             ClipboardHandler* clipboard)
  : discover_(discover),
    transfer_(transfer),
    streaming_(streaming),
    clipboard_(clipboard),
    started_(std::chrono::steady_clock::now()) {}

SystemStatus StatusHandler::get_system_status() {
  SystemStatus status;
  status.version = kizuna_version();
  status.uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_);

  auto peers = discover_.get_realtime_peers();
  status.connected_peers = static_cast<std::size_t>(std::count_if(peers.begin(), peers.end(),
    [](const PeerInfo& peer){ return peer.connection_status == ConnectionStatus::Connected; }));
  status.active_transfers = count_in_progress(transfer_.get_all_operations());
  status.active_streams = count_in_progress(streaming_.get_all_operations());
  status.discovery_enabled = true;

  if(clipboard_) {
    try {
      status.clipboard_sync_enabled = clipboard_->sharing_enabled();
    } catch(const std::exception& e) {
      log_warn(component_logger("clipboard").get(), "Clipboard status unavailable: {}", e.what());
    }
  }
  return status;
}
