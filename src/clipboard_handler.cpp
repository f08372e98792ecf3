#include "clipboard_handler.hpp"

#include "errors.hpp"
#include "security_gate.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kStatusHistoryWindow = 1000;

template<typename Fn>
auto clipboard_call(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Clipboard, std::string(what) + ": " + e.what());
  }
}

} // namespace

ClipboardHandler::ClipboardHandler(std::shared_ptr<ClipboardService> service,
                                   SecurityGate& gate,
                                   PeerResolver resolver)
  : service_(std::move(service)),
    gate_(gate),
    resolver_(std::move(resolver)),
    logger_(component_logger("clipboard")) {}

std::string ClipboardHandler::resolve_peer_id(const std::string& peer) const {
  if(resolver_) {
    if(auto resolved = resolver_(peer)) return resolved->id;
  }
  return to_lower(trim_copy(peer));
}

bool ClipboardHandler::sharing_enabled() {
  return clipboard_call("Failed to get status", [&]{ return service_->is_sharing_enabled(); });
}

ClipboardResult ClipboardHandler::share(std::optional<bool> enable, const std::optional<std::string>& peer) {
  ClipboardResult result;
  if(peer) {
    auto id = resolve_peer_id(*peer);
    bool on = enable.value_or(true);
    if(on) {
      gate_.require_authorized(GatedOperation::Clipboard, id);
      clipboard_call("Failed to enable device", [&]{ service_->enable_device(id); });
      result.message = "Clipboard sync enabled for device: " + id;
    } else {
      clipboard_call("Failed to disable device", [&]{ service_->disable_device(id); });
      result.message = "Clipboard sync disabled for device: " + id;
    }
    log_info(logger_.get(), "{}", result.message);
    result.sharing_enabled = sharing_enabled();
    return result;
  }

  bool next = enable.value_or(!sharing_enabled());
  clipboard_call(next ? "Failed to start monitoring" : "Failed to stop monitoring",
                 [&]{ service_->set_sharing_enabled(next); });
  result.sharing_enabled = next;
  result.message = next ? "Clipboard sharing enabled" : "Clipboard sharing disabled";
  log_info(logger_.get(), "{}", result.message);
  return result;
}

ClipboardStatus ClipboardHandler::get_status() {
  ClipboardStatus status;
  status.sharing_enabled = sharing_enabled();
  status.enabled_devices = clipboard_call("Failed to get status", [&]{ return service_->enabled_devices(); });
  status.history_size = clipboard_call("Failed to get history",
                                       [&]{ return service_->get_history(kStatusHistoryWindow); }).size();
  return status;
}

ClipboardResult ClipboardHandler::status() {
  auto status = get_status();
  ClipboardResult result;
  result.sharing_enabled = status.sharing_enabled;
  result.message = "Clipboard Status:\n"
                   "  - Sharing: " + std::string(status.sharing_enabled ? "ON" : "OFF") + "\n"
                   "  - Enabled devices: " +
                   (status.enabled_devices.empty() ? std::string("none") : join(status.enabled_devices, ", ")) + "\n"
                   "  - History entries: " + std::to_string(status.history_size);
  return result;
}

ClipboardResult ClipboardHandler::history(std::size_t limit) {
  if(limit == 0) throw KizunaError::invalid_argument_value("--limit", "must be greater than zero");
  ClipboardResult result;
  result.entries = clipboard_call("Failed to get history", [&]{ return service_->get_history(limit); });
  result.message = "Retrieved " + std::to_string(result.entries.size()) + " history entries";
  return result;
}

ClipboardResult ClipboardHandler::search_history(const std::string& query) {
  ClipboardResult result;
  result.entries = clipboard_call("Failed to search history", [&]{ return service_->search_history(query); });
  result.message = "Found " + std::to_string(result.entries.size()) + " matching entries";
  return result;
}

ClipboardResult ClipboardHandler::restore(const std::string& entry_id) {
  clipboard_call("Failed to restore from history", [&]{ service_->restore(entry_id); });
  ClipboardResult result;
  result.message = "Restored content from history entry: " + entry_id;
  return result;
}

ClipboardResult ClipboardHandler::clear_history() {
  clipboard_call("Failed to clear history", [&]{ service_->clear_history(); });
  ClipboardResult result;
  result.message = "Clipboard history cleared";
  return result;
}

ClipboardResult ClipboardHandler::get_content() {
  auto content = clipboard_call("Failed to get content", [&]{ return service_->get_content(); });
  ClipboardResult result;
  result.message = content.empty() ? "Clipboard is empty" : content;
  return result;
}

ClipboardResult ClipboardHandler::set_content(const std::string& content) {
  clipboard_call("Failed to set content", [&]{ service_->set_content(content, "local"); });
  ClipboardResult result;
  result.message = "Clipboard content set";
  return result;
}
