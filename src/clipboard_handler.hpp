#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "types.hpp"

class SecurityGate;

struct ClipboardResult {
  std::string message;
  std::optional<bool> sharing_enabled;
  std::vector<ClipboardEntry> entries;
};

struct ClipboardStatus {
  bool sharing_enabled = false;
  std::vector<std::string> enabled_devices;
  std::size_t history_size = 0;
};

class ClipboardHandler {
public:
  using PeerResolver = std::function<std::optional<PeerInfo>(const std::string& name_or_id)>;

  static constexpr std::size_t kDefaultHistoryLimit = 20;

  ClipboardHandler(std::shared_ptr<ClipboardService> service, SecurityGate& gate, PeerResolver resolver);

  // No explicit state toggles; with a peer only that device changes.
  ClipboardResult share(std::optional<bool> enable, const std::optional<std::string>& peer);
  ClipboardStatus get_status();
  ClipboardResult status();

  ClipboardResult history(std::size_t limit);
  ClipboardResult search_history(const std::string& query);
  ClipboardResult restore(const std::string& entry_id);
  ClipboardResult clear_history();

  ClipboardResult get_content();
  ClipboardResult set_content(const std::string& content);

  bool sharing_enabled();

private:
  std::string resolve_peer_id(const std::string& peer) const;

  std::shared_ptr<ClipboardService> service_;
  SecurityGate& gate_;
  PeerResolver resolver_;
  std::shared_ptr<Logger> logger_;
};
