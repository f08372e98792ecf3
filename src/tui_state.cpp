#include "tui_state.hpp"

#include <algorithm>
#include <numeric>
#include <system_error>

namespace {

constexpr ViewType kViewOrder[] = {
  ViewType::PeerList, ViewType::FileBrowser, ViewType::TransferProgress,
  ViewType::StreamViewer, ViewType::CommandTerminal, ViewType::Settings
};
constexpr std::size_t kViewCount = sizeof(kViewOrder) / sizeof(kViewOrder[0]);

std::size_t view_index(ViewType view) {
  for(std::size_t i = 0; i < kViewCount; ++i) {
    if(kViewOrder[i] == view) return i;
  }
  return 0;
}

bool is_hidden(const std::string& name) {
  return !name.empty() && name[0] == '.';
}

} // namespace

const char* to_string(ViewType view) {
  switch(view) {
    case ViewType::PeerList: return "Peers";
    case ViewType::FileBrowser: return "Files";
    case ViewType::TransferProgress: return "Transfers";
    case ViewType::StreamViewer: return "Streams";
    case ViewType::CommandTerminal: return "Terminal";
    case ViewType::Settings: return "Settings";
  }
  return "Peers";
}

const char* to_string(LogLevel level) {
  switch(level) {
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Debug: return "DEBUG";
  }
  return "INFO";
}

// ---- ListSelection ---------------------------------------------------------

void ListSelection::set_count(std::size_t count) {
  count_ = count;
  if(count_ == 0) {
    index_ = 0;
  } else if(index_ >= count_) {
    index_ = count_ - 1;
  }
}

void ListSelection::next() {
  if(count_ == 0) return;
  index_ = (index_ + 1) % count_;
}

void ListSelection::previous() {
  if(count_ == 0) return;
  index_ = index_ == 0 ? count_ - 1 : index_ - 1;
}

// ---- peers -----------------------------------------------------------------

const char* to_string(PeerAction action) {
  switch(action) {
    case PeerAction::Connect: return "Connect";
    case PeerAction::Disconnect: return "Disconnect";
    case PeerAction::ToggleTrust: return "Toggle Trust";
    case PeerAction::Block: return "Block";
    case PeerAction::Retry: return "Retry";
    case PeerAction::Cancel: return "Cancel";
  }
  return "Connect";
}

std::vector<PeerAction> available_actions(ConnectionStatus status) {
  switch(status) {
    case ConnectionStatus::Connected:
      return {PeerAction::Disconnect, PeerAction::ToggleTrust, PeerAction::Block};
    case ConnectionStatus::Disconnected:
      return {PeerAction::Connect, PeerAction::ToggleTrust, PeerAction::Block};
    case ConnectionStatus::Connecting:
      return {PeerAction::Cancel};
    case ConnectionStatus::Error:
      return {PeerAction::Retry, PeerAction::Block};
  }
  return {};
}

std::optional<PeerAction> peer_action_from_key(char key, ConnectionStatus status) {
  std::optional<PeerAction> action;
  switch(key) {
    case 'c': action = PeerAction::Connect; break;
    case 'd': action = PeerAction::Disconnect; break;
    case 't': action = PeerAction::ToggleTrust; break;
    case 'b': action = PeerAction::Block; break;
    case 'r': action = PeerAction::Retry; break;
    case 'x': action = PeerAction::Cancel; break;
    default: return std::nullopt;
  }
  auto allowed = available_actions(status);
  if(std::find(allowed.begin(), allowed.end(), *action) == allowed.end()) return std::nullopt;
  return action;
}

void PeerViewState::set_peers(std::vector<PeerInfo> peers) {
  peers_ = std::move(peers);
  selection_.set_count(peers_.size());
}

void PeerViewState::upsert(const PeerInfo& peer) {
  auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerInfo& p){ return p.id == peer.id; });
  if(it == peers_.end()) {
    peers_.push_back(peer);
  } else {
    *it = peer;
  }
  selection_.set_count(peers_.size());
}

void PeerViewState::remove(const std::string& peer_id) {
  peers_.erase(std::remove_if(peers_.begin(), peers_.end(),
                              [&](const PeerInfo& p){ return p.id == peer_id; }),
               peers_.end());
  selection_.set_count(peers_.size());
}

void PeerViewState::set_connection_status(const std::string& peer_id, ConnectionStatus status) {
  for(auto& peer : peers_) {
    if(peer.id == peer_id) peer.connection_status = status;
  }
}

std::optional<PeerInfo> PeerViewState::selected() const {
  if(selection_.empty() || selection_.index() >= peers_.size()) return std::nullopt;
  return peers_[selection_.index()];
}

// ---- file browser ----------------------------------------------------------

FileBrowserState::FileBrowserState(std::filesystem::path start)
  : directory_(std::move(start)) {
  refresh();
}

void FileBrowserState::refresh() {
  namespace fs = std::filesystem;
  entries_.clear();
  error_.clear();

  std::error_code ec;
  fs::directory_iterator it(directory_, ec);
  if(ec) {
    error_ = ec.message();
    cursor_.set_count(0);
    return;
  }
  for(const auto& item : it) {
    FileEntry entry;
    entry.path = item.path();
    entry.name = item.path().filename().string();
    if(!show_hidden_ && is_hidden(entry.name)) continue;
    std::error_code type_ec;
    entry.is_directory = item.is_directory(type_ec);
    if(!entry.is_directory) {
      std::error_code size_ec;
      auto size = item.file_size(size_ec);
      entry.size = size_ec ? 0 : size;
    }
    entries_.push_back(std::move(entry));
  }
  std::sort(entries_.begin(), entries_.end(), [](const FileEntry& a, const FileEntry& b){
    if(a.is_directory != b.is_directory) return a.is_directory;
    return a.name < b.name;
  });
  cursor_.set_count(entries_.size());
}

void FileBrowserState::navigate(const std::filesystem::path& directory) {
  directory_ = directory;
  cursor_ = ListSelection{};
  refresh();
}

void FileBrowserState::go_parent() {
  auto parent = directory_.parent_path();
  if(parent.empty() || parent == directory_) return;
  navigate(parent);
}

void FileBrowserState::open_selected() {
  if(cursor_.empty()) return;
  const auto& entry = entries_[cursor_.index()];
  if(entry.is_directory) {
    navigate(entry.path);
  } else {
    toggle_selection();
  }
}

void FileBrowserState::toggle_selection() {
  if(cursor_.empty()) return;
  const auto& entry = entries_[cursor_.index()];
  if(entry.is_directory) return;
  if(selected_.erase(entry.path) > 0) {
    selected_sizes_.erase(entry.path);
  } else {
    selected_.insert(entry.path);
    selected_sizes_[entry.path] = entry.size;
  }
}

void FileBrowserState::toggle_hidden() {
  show_hidden_ = !show_hidden_;
  refresh();
}

std::vector<std::filesystem::path> FileBrowserState::selected_files() const {
  return {selected_.begin(), selected_.end()};
}

uint64_t FileBrowserState::selected_bytes() const {
  uint64_t total = 0;
  for(const auto& [path, size] : selected_sizes_) total += size;
  return total;
}

// ---- operations ------------------------------------------------------------

void OperationMonitorState::apply(const OperationStatus& status) {
  auto it = std::find_if(operations_.begin(), operations_.end(), [&](const OperationStatus& op){
    return op.operation_id == status.operation_id;
  });
  if(it == operations_.end()) {
    operations_.push_back(status);
    evict_finished();
  } else {
    // Terminal states stick even if a late update arrives.
    if(it->state.is_terminal() && !status.state.is_terminal()) return;
    *it = status;
  }
  selection_.set_count(operations_.size());
}

void OperationMonitorState::evict_finished() {
  auto excess = operations_.size() > kMaxOperations ? operations_.size() - kMaxOperations : 0;
  for(auto it = operations_.begin(); excess > 0 && it != operations_.end();) {
    if(it->state.is_terminal()) {
      it = operations_.erase(it);
      --excess;
    } else {
      ++it;
    }
  }
}

void OperationMonitorState::set_operations(const std::vector<OperationStatus>& operations) {
  for(const auto& op : operations) apply(op);
}

std::optional<OperationStatus> OperationMonitorState::selected() const {
  if(selection_.empty() || selection_.index() >= operations_.size()) return std::nullopt;
  return operations_[selection_.index()];
}

std::size_t OperationMonitorState::clear_completed() {
  auto before = operations_.size();
  operations_.erase(std::remove_if(operations_.begin(), operations_.end(),
                                   [](const OperationStatus& op){ return op.state.is_terminal(); }),
                    operations_.end());
  selection_.set_count(operations_.size());
  return before - operations_.size();
}

void OperationMonitorState::add_log(LogLevel level, std::string operation_id, std::string message) {
  LogEntry entry;
  entry.level = level;
  entry.operation_id = std::move(operation_id);
  entry.message = std::move(message);
  logs_.push_back(std::move(entry));
  while(logs_.size() > kMaxLogs) logs_.pop_front();
}

void OperationMonitorState::sample_bandwidth() {
  double total = 0.0;
  for(const auto& op : operations_) {
    if(op.state.kind != OperationState::Kind::InProgress) continue;
    if(op.progress && op.progress->rate) total += *op.progress->rate;
  }
  bandwidth_.push_back(total);
  while(bandwidth_.size() > kMaxSamples) bandwidth_.pop_front();
}

double OperationMonitorState::current_bandwidth() const {
  return bandwidth_.empty() ? 0.0 : bandwidth_.back();
}

double OperationMonitorState::average_bandwidth() const {
  if(bandwidth_.empty()) return 0.0;
  return std::accumulate(bandwidth_.begin(), bandwidth_.end(), 0.0) / static_cast<double>(bandwidth_.size());
}

uint64_t OperationMonitorState::total_transferred() const {
  uint64_t total = 0;
  for(const auto& op : operations_) {
    if(op.kind == OperationKind::FileTransfer && op.progress) total += op.progress->current;
  }
  return total;
}

OperationStats OperationMonitorState::stats() const {
  OperationStats stats;
  stats.total = operations_.size();
  for(const auto& op : operations_) {
    switch(op.state.kind) {
      case OperationState::Kind::Starting:
      case OperationState::Kind::InProgress: ++stats.active; break;
      case OperationState::Kind::Completed: ++stats.completed; break;
      case OperationState::Kind::Failed: ++stats.failed; break;
      case OperationState::Kind::Cancelled: break;
    }
  }
  return stats;
}

// ---- TuiState --------------------------------------------------------------

TuiState::TuiState(std::filesystem::path start_dir)
  : files_(std::move(start_dir)) {}

void TuiState::next_view() {
  current_view_ = kViewOrder[(view_index(current_view_) + 1) % kViewCount];
}

void TuiState::previous_view() {
  current_view_ = kViewOrder[(view_index(current_view_) + kViewCount - 1) % kViewCount];
}

void TuiState::set_streams(std::vector<OperationStatus> streams) {
  streams_ = std::move(streams);
  stream_selection_.set_count(streams_.size());
}

void TuiState::set_history(std::vector<std::string> lines) {
  history_ = std::move(lines);
  history_selection_.set_count(history_.size());
}

void TuiState::set_settings(std::vector<std::pair<std::string, std::string>> settings) {
  settings_ = std::move(settings);
  settings_selection_.set_count(settings_.size());
}

std::string TuiState::status_message() const {
  const auto& logs = monitor_.logs();
  if(logs.empty()) return {};
  return logs.back().message;
}

std::optional<TuiAction> TuiState::handle_key(const KeyEvent& key) {
  using Code = KeyEvent::Code;
  switch(key.code) {
    case Code::CtrlC:
    case Code::Esc:
      running_ = false;
      return std::nullopt;
    case Code::Tab:
      next_view();
      return std::nullopt;
    case Code::BackTab:
      previous_view();
      return std::nullopt;
    case Code::Up:
      move_selection(false);
      return std::nullopt;
    case Code::Down:
      move_selection(true);
      return std::nullopt;
    case Code::Enter:
      if(current_view_ == ViewType::PeerList) peers_.toggle_details();
      if(current_view_ == ViewType::FileBrowser) files_.open_selected();
      return std::nullopt;
    case Code::Backspace:
    case Code::Left:
      if(current_view_ == ViewType::FileBrowser) files_.go_parent();
      return std::nullopt;
    case Code::Right:
      if(current_view_ == ViewType::FileBrowser) files_.open_selected();
      return std::nullopt;
    case Code::Char:
      break;
  }

  switch(key.ch) {
    case 'q': running_ = false; return std::nullopt;
    case '1': current_view_ = ViewType::PeerList; return std::nullopt;
    case '2': current_view_ = ViewType::FileBrowser; return std::nullopt;
    case '3': current_view_ = ViewType::TransferProgress; return std::nullopt;
    case 'k': move_selection(false); return std::nullopt;
    case 'j': move_selection(true); return std::nullopt;
    default: break;
  }

  switch(current_view_) {
    case ViewType::PeerList:
      return handle_peer_key(key.ch);
    case ViewType::FileBrowser:
      if(key.ch == ' ') files_.toggle_selection();
      if(key.ch == 'h') files_.toggle_hidden();
      if(key.ch == 's') return send_selected_files();
      return std::nullopt;
    case ViewType::TransferProgress:
      return handle_transfer_key(key.ch);
    default:
      return std::nullopt;
  }
}

std::optional<TuiAction> TuiState::handle_peer_key(char key) {
  auto peer = peers_.selected();
  if(key == 'r' && (!peer || peer->connection_status != ConnectionStatus::Error)) {
    return TuiAction{TuiAction::Type::RefreshPeers};
  }
  if(!peer) return std::nullopt;

  auto action = peer_action_from_key(key, peer->connection_status);
  if(!action) return std::nullopt;

  TuiAction out;
  out.peer_id = peer->id;
  switch(*action) {
    case PeerAction::Connect:
    case PeerAction::Retry:
      out.type = TuiAction::Type::ConnectPeer;
      peers_.set_connection_status(peer->id, ConnectionStatus::Connecting);
      break;
    case PeerAction::Disconnect:
    case PeerAction::Cancel:
      out.type = TuiAction::Type::DisconnectPeer;
      peers_.set_connection_status(peer->id, ConnectionStatus::Disconnected);
      break;
    case PeerAction::ToggleTrust:
      out.type = TuiAction::Type::ToggleTrust;
      out.trust = peer->trust_status == TrustStatus::Trusted ? TrustStatus::Untrusted : TrustStatus::Trusted;
      break;
    case PeerAction::Block:
      out.type = TuiAction::Type::BlockPeer;
      out.trust = TrustStatus::Blocked;
      break;
  }
  return out;
}

std::optional<TuiAction> TuiState::handle_transfer_key(char key) {
  if(key == 'l') {
    monitor_.toggle_logs();
    return std::nullopt;
  }
  if(key == 'x') {
    auto removed = monitor_.clear_completed();
    monitor_.add_log(LogLevel::Info, {}, "Cleared " + std::to_string(removed) + " finished operations");
    return std::nullopt;
  }

  auto op = monitor_.selected();
  if(!op || op->state.is_terminal()) return std::nullopt;

  TuiAction out;
  out.operation_id = op->operation_id;
  out.peer_id = op->peer_id;
  switch(key) {
    case 'c': out.type = TuiAction::Type::CancelOperation; return out;
    case 'p': out.type = TuiAction::Type::PauseOperation; return out;
    case 'r': out.type = TuiAction::Type::ResumeOperation; return out;
    default: return std::nullopt;
  }
}

std::optional<TuiAction> TuiState::send_selected_files() {
  auto files = files_.selected_files();
  if(files.empty()) {
    monitor_.add_log(LogLevel::Warning, {}, "No files selected");
    return std::nullopt;
  }
  auto peer = peers_.selected();
  if(!peer) {
    monitor_.add_log(LogLevel::Warning, {}, "Select a peer in the peer view first");
    return std::nullopt;
  }
  TuiAction out;
  out.type = TuiAction::Type::SendFiles;
  out.peer_id = peer->id;
  out.files = std::move(files);
  files_.clear_selection();
  return out;
}

void TuiState::move_selection(bool down) {
  auto step = [down](auto& target){
    if(down) {
      target.select_next();
    } else {
      target.select_previous();
    }
  };
  switch(current_view_) {
    case ViewType::PeerList: step(peers_); break;
    case ViewType::FileBrowser: step(files_); break;
    case ViewType::TransferProgress: step(monitor_); break;
    case ViewType::StreamViewer:
      down ? stream_selection_.next() : stream_selection_.previous();
      break;
    case ViewType::CommandTerminal:
      down ? history_selection_.next() : history_selection_.previous();
      break;
    case ViewType::Settings:
      down ? settings_selection_.next() : settings_selection_.previous();
      break;
  }
}
