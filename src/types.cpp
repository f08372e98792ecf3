#include "types.hpp"

#include "utils.hpp"

const char* to_string(ConnectionStatus status) {
  switch(status) {
    case ConnectionStatus::Connected: return "Connected";
    case ConnectionStatus::Connecting: return "Connecting";
    case ConnectionStatus::Disconnected: return "Disconnected";
    case ConnectionStatus::Error: return "Error";
  }
  return "Error";
}

const char* to_string(TrustStatus status) {
  switch(status) {
    case TrustStatus::Trusted: return "Trusted";
    case TrustStatus::Untrusted: return "Untrusted";
    case TrustStatus::Blocked: return "Blocked";
  }
  return "Untrusted";
}

const char* to_string(OperationKind kind) {
  switch(kind) {
    case OperationKind::FileTransfer: return "FileTransfer";
    case OperationKind::CameraStream: return "CameraStream";
    case OperationKind::CommandExecution: return "CommandExecution";
    case OperationKind::ClipboardSync: return "ClipboardSync";
  }
  return "FileTransfer";
}

const char* to_string(OutputFormat format) {
  switch(format) {
    case OutputFormat::Table: return "table";
    case OutputFormat::Json: return "json";
    case OutputFormat::Csv: return "csv";
    case OutputFormat::Minimal: return "minimal";
  }
  return "table";
}

const char* to_string(ColorMode mode) {
  switch(mode) {
    case ColorMode::Always: return "always";
    case ColorMode::Never: return "never";
    case ColorMode::Auto: return "auto";
  }
  return "auto";
}

std::optional<OutputFormat> output_format_from_string(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "table") return OutputFormat::Table;
  if(v == "json") return OutputFormat::Json;
  if(v == "csv") return OutputFormat::Csv;
  if(v == "minimal") return OutputFormat::Minimal;
  return std::nullopt;
}

std::optional<ColorMode> color_mode_from_string(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "always") return ColorMode::Always;
  if(v == "never") return ColorMode::Never;
  if(v == "auto") return ColorMode::Auto;
  return std::nullopt;
}

const char* to_string(OperationState::Kind kind) {
  switch(kind) {
    case OperationState::Kind::Starting: return "Starting";
    case OperationState::Kind::InProgress: return "InProgress";
    case OperationState::Kind::Completed: return "Completed";
    case OperationState::Kind::Failed: return "Failed";
    case OperationState::Kind::Cancelled: return "Cancelled";
  }
  return "Starting";
}

std::string describe(const OperationState& state) {
  if(state.kind == OperationState::Kind::Failed && !state.message.empty()) {
    return std::string("Failed: ") + state.message;
  }
  if(state.kind == OperationState::Kind::InProgress) return "In Progress";
  return to_string(state.kind);
}

std::optional<double> ProgressInfo::percentage() const {
  if(!total || *total == 0) return std::nullopt;
  double pct = static_cast<double>(current) / static_cast<double>(*total) * 100.0;
  return pct > 100.0 ? 100.0 : pct;
}

CommandOutput CommandOutput::make_text(std::string text) {
  CommandOutput out;
  out.type = Type::Text;
  out.text = std::move(text);
  return out;
}

CommandOutput CommandOutput::make_table(TableData table) {
  CommandOutput out;
  out.type = Type::Table;
  out.table = std::move(table);
  return out;
}

CommandOutput CommandOutput::make_json(nlohmann::json value) {
  CommandOutput out;
  out.type = Type::Json;
  out.json = std::move(value);
  return out;
}

CommandOutput CommandOutput::make_progress(ProgressInfo progress) {
  CommandOutput out;
  out.type = Type::Progress;
  out.progress = std::move(progress);
  return out;
}

CommandOutput CommandOutput::interactive() {
  CommandOutput out;
  out.type = Type::Interactive;
  return out;
}

void to_json(nlohmann::json& j, const PeerInfo& peer) {
  j = nlohmann::json{
    {"id", peer.id},
    {"name", peer.name},
    {"device_type", peer.device_type},
    {"capabilities", peer.capabilities},
    {"addresses", peer.addresses},
    {"connection_status", to_string(peer.connection_status)},
    {"trust_status", to_string(peer.trust_status)}
  };
  if(peer.last_seen) {
    j["last_seen"] = format_rfc3339(*peer.last_seen);
  } else {
    j["last_seen"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, PeerInfo& peer) {
  peer.id = j.at("id").get<std::string>();
  peer.name = j.value("name", peer.id);
  peer.device_type = j.value("device_type", "unknown");
  peer.capabilities = j.value("capabilities", std::vector<std::string>{});
  peer.addresses = j.value("addresses", std::vector<std::string>{});
  auto status = j.value("connection_status", "Disconnected");
  if(status == "Connected") peer.connection_status = ConnectionStatus::Connected;
  else if(status == "Connecting") peer.connection_status = ConnectionStatus::Connecting;
  else if(status == "Error") peer.connection_status = ConnectionStatus::Error;
  else peer.connection_status = ConnectionStatus::Disconnected;
  auto trust = j.value("trust_status", "Untrusted");
  if(trust == "Trusted") peer.trust_status = TrustStatus::Trusted;
  else if(trust == "Blocked") peer.trust_status = TrustStatus::Blocked;
  else peer.trust_status = TrustStatus::Untrusted;
  if(j.contains("last_seen") && j.at("last_seen").is_string()) {
    peer.last_seen = parse_rfc3339(j.at("last_seen").get<std::string>());
  }
}

void to_json(nlohmann::json& j, const ProgressInfo& progress) {
  j = nlohmann::json{{"current", progress.current}};
  j["total"] = progress.total ? nlohmann::json(*progress.total) : nlohmann::json(nullptr);
  j["rate"] = progress.rate ? nlohmann::json(*progress.rate) : nlohmann::json(nullptr);
  j["eta_seconds"] = progress.eta ? nlohmann::json(progress.eta->count()) : nlohmann::json(nullptr);
  j["message"] = progress.message ? nlohmann::json(*progress.message) : nlohmann::json(nullptr);
  if(auto pct = progress.percentage()) j["percentage"] = *pct;
}

void to_json(nlohmann::json& j, const OperationStatus& status) {
  j = nlohmann::json{
    {"operation_id", status.operation_id},
    {"kind", to_string(status.kind)},
    {"peer_id", status.peer_id},
    {"state", to_string(status.state.kind)},
    {"started_at", format_rfc3339(status.started_at)}
  };
  if(status.state.kind == OperationState::Kind::Failed) {
    j["error"] = status.state.message;
  }
  if(status.progress) {
    j["progress"] = *status.progress;
  }
  if(status.estimated_completion) {
    j["estimated_completion"] = format_rfc3339(*status.estimated_completion);
  }
}
