#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using SystemTime = std::chrono::system_clock::time_point;

enum class ConnectionStatus { Connected, Connecting, Disconnected, Error };
enum class TrustStatus { Trusted, Untrusted, Blocked };
enum class OperationKind { FileTransfer, CameraStream, CommandExecution, ClipboardSync };
enum class OutputFormat { Table, Json, Csv, Minimal };
enum class ColorMode { Always, Never, Auto };

const char* to_string(ConnectionStatus status);
const char* to_string(TrustStatus status);
const char* to_string(OperationKind kind);
const char* to_string(OutputFormat format);
const char* to_string(ColorMode mode);

std::optional<OutputFormat> output_format_from_string(const std::string& value);
std::optional<ColorMode> color_mode_from_string(const std::string& value);

// Peer identity (id) is immutable; everything else is observed state.
struct PeerInfo {
  std::string id;
  std::string name;
  std::string device_type = "unknown";
  std::vector<std::string> capabilities;
  std::vector<std::string> addresses;
  ConnectionStatus connection_status = ConnectionStatus::Disconnected;
  TrustStatus trust_status = TrustStatus::Untrusted;
  std::optional<SystemTime> last_seen;
};

struct OperationState {
  enum class Kind { Starting, InProgress, Completed, Failed, Cancelled };

  Kind kind = Kind::Starting;
  std::string message; // failure reason when kind == Failed

  static OperationState starting() { return {Kind::Starting, {}}; }
  static OperationState in_progress() { return {Kind::InProgress, {}}; }
  static OperationState completed() { return {Kind::Completed, {}}; }
  static OperationState failed(std::string reason) { return {Kind::Failed, std::move(reason)}; }
  static OperationState cancelled() { return {Kind::Cancelled, {}}; }

  bool is_terminal() const {
    return kind == Kind::Completed || kind == Kind::Failed || kind == Kind::Cancelled;
  }
  bool operator==(const OperationState& other) const {
    return kind == other.kind && message == other.message;
  }
  bool operator!=(const OperationState& other) const { return !(*this == other); }
};

const char* to_string(OperationState::Kind kind);
std::string describe(const OperationState& state);

struct ProgressInfo {
  uint64_t current = 0;
  std::optional<uint64_t> total;
  std::optional<double> rate; // units per second
  std::optional<std::chrono::seconds> eta;
  std::optional<std::string> message;

  std::optional<double> percentage() const;
};

struct OperationStatus {
  std::string operation_id;
  OperationKind kind = OperationKind::FileTransfer;
  std::string peer_id;
  OperationState state;
  std::optional<ProgressInfo> progress;
  SystemTime started_at = std::chrono::system_clock::now();
  std::optional<SystemTime> estimated_completion;
};

struct TableData {
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
};

enum class TextStyle { Normal, Bold, Italic, Underline, Dim };
enum class Color { Black, Red, Green, Yellow, Blue, Magenta, Cyan, White, Gray };

struct CommandOutput {
  enum class Type { Text, Table, Json, Progress, Interactive };

  Type type = Type::Text;
  std::string text;
  TableData table;
  nlohmann::json json;
  ProgressInfo progress;

  static CommandOutput make_text(std::string text);
  static CommandOutput make_table(TableData table);
  static CommandOutput make_json(nlohmann::json value);
  static CommandOutput make_progress(ProgressInfo progress);
  static CommandOutput interactive();
};

struct CommandResult {
  bool success = true;
  CommandOutput output;
  std::chrono::milliseconds execution_time{0};
  int exit_code = 0;
};

void to_json(nlohmann::json& j, const PeerInfo& peer);
void from_json(const nlohmann::json& j, PeerInfo& peer);
void to_json(nlohmann::json& j, const ProgressInfo& progress);
void to_json(nlohmann::json& j, const OperationStatus& status);
