#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "types.hpp"

enum class ViewType { PeerList, FileBrowser, TransferProgress, StreamViewer, CommandTerminal, Settings };
const char* to_string(ViewType view);

enum class LogLevel { Info, Warning, Error, Debug };
const char* to_string(LogLevel level);

struct LogEntry {
  SystemTime timestamp = std::chrono::system_clock::now();
  LogLevel level = LogLevel::Info;
  std::string operation_id;
  std::string message;
};

struct KeyEvent {
  enum class Code { Char, Enter, Esc, Tab, BackTab, Up, Down, Left, Right, Backspace, CtrlC };

  Code code = Code::Char;
  char ch = 0;

  static KeyEvent character(char c) { return {Code::Char, c}; }
  static KeyEvent key(Code code) { return {code, 0}; }
  bool is_char(char c) const { return code == Code::Char && ch == c; }
};

// Cursor over a list whose length changes underneath it.
class ListSelection {
public:
  void set_count(std::size_t count);
  void next();
  void previous();
  std::size_t index() const { return index_; }
  std::size_t count() const { return count_; }
  bool empty() const { return count_ == 0; }

private:
  std::size_t index_ = 0;
  std::size_t count_ = 0;
};

// ---- peers -----------------------------------------------------------------

enum class PeerAction { Connect, Disconnect, ToggleTrust, Block, Retry, Cancel };
const char* to_string(PeerAction action);

// Palette offered for a peer in the given connection state.
std::vector<PeerAction> available_actions(ConnectionStatus status);
std::optional<PeerAction> peer_action_from_key(char key, ConnectionStatus status);

class PeerViewState {
public:
  void set_peers(std::vector<PeerInfo> peers);
  void upsert(const PeerInfo& peer);
  void remove(const std::string& peer_id);
  void set_connection_status(const std::string& peer_id, ConnectionStatus status);

  const std::vector<PeerInfo>& peers() const { return peers_; }
  std::optional<PeerInfo> selected() const;
  const ListSelection& selection() const { return selection_; }
  void select_next() { selection_.next(); }
  void select_previous() { selection_.previous(); }

  bool show_details() const { return show_details_; }
  void toggle_details() { show_details_ = !show_details_; }

private:
  std::vector<PeerInfo> peers_;
  ListSelection selection_;
  bool show_details_ = false;
};

// ---- file browser ----------------------------------------------------------

struct FileEntry {
  std::string name;
  std::filesystem::path path;
  bool is_directory = false;
  uint64_t size = 0;
};

class FileBrowserState {
public:
  explicit FileBrowserState(std::filesystem::path start = std::filesystem::current_path());

  // Re-reads the current directory: directories first, then by name.
  void refresh();
  void navigate(const std::filesystem::path& directory);
  void go_parent();
  // Directories are entered, files toggle their selection.
  void open_selected();
  void toggle_selection();
  void toggle_hidden();
  void clear_selection() { selected_.clear(); selected_sizes_.clear(); }

  void select_next() { cursor_.next(); }
  void select_previous() { cursor_.previous(); }

  const std::filesystem::path& directory() const { return directory_; }
  const std::vector<FileEntry>& entries() const { return entries_; }
  const ListSelection& cursor() const { return cursor_; }
  bool show_hidden() const { return show_hidden_; }
  bool is_selected(const std::filesystem::path& path) const { return selected_.count(path) > 0; }
  std::vector<std::filesystem::path> selected_files() const;
  uint64_t selected_bytes() const;
  const std::string& error() const { return error_; }

private:
  std::filesystem::path directory_;
  std::vector<FileEntry> entries_;
  std::set<std::filesystem::path> selected_;
  std::map<std::filesystem::path, uint64_t> selected_sizes_;
  ListSelection cursor_;
  bool show_hidden_ = false;
  std::string error_;
};

// ---- operations ------------------------------------------------------------

struct OperationStats {
  std::size_t total = 0;
  std::size_t active = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
};

class OperationMonitorState {
public:
  static constexpr std::size_t kMaxLogs = 1000;
  static constexpr std::size_t kMaxSamples = 60;
  static constexpr std::size_t kMaxOperations = 200;

  // Past kMaxOperations the oldest finished operations are dropped.
  // Active operations are never evicted.
  void apply(const OperationStatus& status);
  void set_operations(const std::vector<OperationStatus>& operations);
  const std::vector<OperationStatus>& operations() const { return operations_; }
  std::optional<OperationStatus> selected() const;
  void select_next() { selection_.next(); }
  void select_previous() { selection_.previous(); }
  const ListSelection& selection() const { return selection_; }
  std::size_t clear_completed();

  void add_log(LogLevel level, std::string operation_id, std::string message);
  const std::deque<LogEntry>& logs() const { return logs_; }
  bool show_logs() const { return show_logs_; }
  void toggle_logs() { show_logs_ = !show_logs_; }

  // Samples the summed rate of in-progress operations.
  void sample_bandwidth();
  const std::deque<double>& bandwidth_history() const { return bandwidth_; }
  double current_bandwidth() const;
  double average_bandwidth() const;
  uint64_t total_transferred() const;

  OperationStats stats() const;

private:
  void evict_finished();

  std::vector<OperationStatus> operations_;
  ListSelection selection_;
  std::deque<LogEntry> logs_;
  std::deque<double> bandwidth_;
  bool show_logs_ = false;
};

// ---- actions handed to the app ---------------------------------------------

struct TuiAction {
  enum class Type {
    SendFiles, CancelOperation, PauseOperation, ResumeOperation,
    ConnectPeer, DisconnectPeer, ToggleTrust, BlockPeer, RefreshPeers
  };

  Type type = Type::RefreshPeers;
  std::string peer_id;
  std::string operation_id;
  std::vector<std::filesystem::path> files;
  TrustStatus trust = TrustStatus::Untrusted;
};

// Whole TUI view state. Single writer: the render loop.
class TuiState {
public:
  explicit TuiState(std::filesystem::path start_dir = std::filesystem::current_path());

  // Applies one key. Handler work comes back as an action for the caller to
  // run without blocking the tick.
  std::optional<TuiAction> handle_key(const KeyEvent& key);

  void next_view();
  void previous_view();
  void set_view(ViewType view) { current_view_ = view; }
  ViewType current_view() const { return current_view_; }
  bool running() const { return running_; }
  void quit() { running_ = false; }

  PeerViewState& peer_view() { return peers_; }
  const PeerViewState& peer_view() const { return peers_; }
  FileBrowserState& file_browser() { return files_; }
  const FileBrowserState& file_browser() const { return files_; }
  OperationMonitorState& monitor() { return monitor_; }
  const OperationMonitorState& monitor() const { return monitor_; }

  // Read-only lists for the stream, terminal and settings views.
  void set_streams(std::vector<OperationStatus> streams);
  void set_history(std::vector<std::string> lines);
  void set_settings(std::vector<std::pair<std::string, std::string>> settings);
  const std::vector<OperationStatus>& streams() const { return streams_; }
  const std::vector<std::string>& history() const { return history_; }
  const std::vector<std::pair<std::string, std::string>>& settings() const { return settings_; }
  const ListSelection& stream_selection() const { return stream_selection_; }
  const ListSelection& history_selection() const { return history_selection_; }
  const ListSelection& settings_selection() const { return settings_selection_; }

  // Latest log line, shown in the status bar.
  std::string status_message() const;

private:
  std::optional<TuiAction> handle_peer_key(char key);
  std::optional<TuiAction> handle_transfer_key(char key);
  std::optional<TuiAction> send_selected_files();
  void move_selection(bool down);

  ViewType current_view_ = ViewType::PeerList;
  bool running_ = true;
  PeerViewState peers_;
  FileBrowserState files_;
  OperationMonitorState monitor_;
  std::vector<OperationStatus> streams_;
  std::vector<std::string> history_;
  std::vector<std::pair<std::string, std::string>> settings_;
  ListSelection stream_selection_;
  ListSelection history_selection_;
  ListSelection settings_selection_;
};
