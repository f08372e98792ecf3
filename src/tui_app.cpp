#include "tui_app.hpp"

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdio>

#include "discover_handler.hpp"
#include "errors.hpp"
#include "exec_handler.hpp"
#include "history.hpp"
#include "peers_handler.hpp"
#include "runtime.hpp"
#include "streaming_handler.hpp"
#include "transfer_handler.hpp"

namespace {

constexpr const char* kEnterScreen = "\x1b[?1049h\x1b[?25l\x1b[?1000l\x1b[2J";
constexpr const char* kLeaveScreen = "\x1b[?1000l\x1b[?25h\x1b[?1049l";

void write_all(const std::string& data) {
  std::size_t written = 0;
  while(written < data.size()) {
    auto n = ::write(STDOUT_FILENO, data.data() + written, data.size() - written);
    if(n <= 0) return;
    written += static_cast<std::size_t>(n);
  }
}

LogLevel to_log_level(spdlog::level::level_enum level) {
  switch(level) {
    case spdlog::level::err:
    case spdlog::level::critical: return LogLevel::Error;
    case spdlog::level::warn: return LogLevel::Warning;
    case spdlog::level::debug:
    case spdlog::level::trace: return LogLevel::Debug;
    default: return LogLevel::Info;
  }
}

std::string peer_label(const PeerInfo& peer) {
  return peer.name.empty() ? peer.id : peer.name;
}

void send_log(Channel<LogEntry>& logs, LogLevel level, const std::string& operation_id, const std::string& message) {
  LogEntry entry;
  entry.level = level;
  entry.operation_id = operation_id;
  entry.message = message;
  logs.send(std::move(entry));
}

} // namespace

// ---- TerminalGuard ---------------------------------------------------------

TerminalGuard::~TerminalGuard() {
  restore();
}

void TerminalGuard::enter() {
  if(active_) return;
  if(!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    throw KizunaError::tui("interactive mode needs a terminal");
  }
  if(tcgetattr(STDIN_FILENO, &original_) == -1) {
    throw KizunaError::tui("cannot read terminal attributes");
  }
  termios raw = original_;
  raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
  raw.c_iflag &= ~(IXON | ICRNL);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if(tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == -1) {
    throw KizunaError::tui("cannot switch the terminal to raw mode");
  }
  active_ = true;
  write_all(kEnterScreen);
}

void TerminalGuard::restore() {
  if(!active_) return;
  write_all(kLeaveScreen);
  tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
  active_ = false;
}

// ---- input -----------------------------------------------------------------

std::vector<KeyEvent> parse_keys(const std::string& bytes) {
  using Code = KeyEvent::Code;
  std::vector<KeyEvent> keys;
  for(std::size_t i = 0; i < bytes.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    if(c == 0x1b) {
      if(i + 2 < bytes.size() && (bytes[i + 1] == '[' || bytes[i + 1] == 'O')) {
        char final_byte = bytes[i + 2];
        i += 2;
        switch(final_byte) {
          case 'A': keys.push_back(KeyEvent::key(Code::Up)); break;
          case 'B': keys.push_back(KeyEvent::key(Code::Down)); break;
          case 'C': keys.push_back(KeyEvent::key(Code::Right)); break;
          case 'D': keys.push_back(KeyEvent::key(Code::Left)); break;
          case 'Z': keys.push_back(KeyEvent::key(Code::BackTab)); break;
          default:
            // Skip the rest of an unknown CSI sequence.
            while(i < bytes.size() && !(bytes[i] >= 0x40 && bytes[i] <= 0x7e)) ++i;
            break;
        }
      } else {
        keys.push_back(KeyEvent::key(Code::Esc));
      }
      continue;
    }
    switch(c) {
      case '\r':
      case '\n': keys.push_back(KeyEvent::key(Code::Enter)); break;
      case '\t': keys.push_back(KeyEvent::key(Code::Tab)); break;
      case 0x7f:
      case 0x08: keys.push_back(KeyEvent::key(Code::Backspace)); break;
      case 0x03: keys.push_back(KeyEvent::key(Code::CtrlC)); break;
      default:
        if(c >= 0x20 && c < 0x7f) keys.push_back(KeyEvent::character(static_cast<char>(c)));
        break;
    }
  }
  return keys;
}

std::pair<std::size_t, std::size_t> terminal_size() {
  winsize ws{};
  if(ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    return {ws.ws_row, ws.ws_col};
  }
  return {24, 80};
}

// ---- TuiApp ----------------------------------------------------------------

TuiApp::TuiApp(TuiDependencies deps, StyleManager style)
  : deps_(std::move(deps)),
    renderer_(style),
    logger_(component_logger("tui")),
    input_(std::make_shared<Channel<KeyEvent>>()),
    logs_(std::make_shared<Channel<LogEntry>>(OperationMonitorState::kMaxLogs)),
    peer_snapshots_(std::make_shared<Channel<std::vector<PeerInfo>>>(4)) {
  peer_updates_ = deps_.discover.subscribe();
  transfer_updates_ = deps_.transfer.subscribe();
  stream_updates_ = deps_.streaming.subscribe();
  exec_updates_ = deps_.exec.subscribe();
  load_snapshot();
}

TuiApp::~TuiApp() {
  reading_.store(false);
  if(input_thread_.joinable()) input_thread_.join();
  detach_logs();
  peer_updates_->close();
  transfer_updates_->close();
  stream_updates_->close();
  exec_updates_->close();
}

void TuiApp::load_snapshot() {
  state_.peer_view().set_peers(deps_.discover.get_cached_peers());
  state_.monitor().set_operations(deps_.transfer.get_all_operations());
  state_.monitor().set_operations(deps_.streaming.get_all_operations());
  state_.monitor().set_operations(deps_.exec.get_all_operations());
  state_.set_streams(deps_.streaming.get_active_streams());
  state_.set_settings(deps_.config_manager.list(deps_.config));
  if(deps_.history) {
    std::vector<std::string> lines;
    for(const auto& entry : deps_.history->get_recent(kHistoryRows)) lines.push_back(entry.format());
    state_.set_history(std::move(lines));
  }
}

void TuiApp::attach_logs() {
  for(auto& logger : component_loggers()) {
    auto channel = logs_;
    auto handle = logger->add_listener(
      [channel](const std::string& name, spdlog::level::level_enum level, const std::string& message) {
        LogEntry entry;
        entry.level = to_log_level(level);
        entry.message = name + ": " + message;
        channel->send(std::move(entry));
        return true;
      });
    listeners_.emplace_back(logger, handle);
  }
}

void TuiApp::detach_logs() {
  for(auto& [logger, handle] : listeners_) logger->remove_listener(handle);
  listeners_.clear();
}

void TuiApp::apply_peer_notification(const PeerNotification& notification) {
  auto& view = state_.peer_view();
  switch(notification.type) {
    case PeerNotification::Type::Discovered:
      view.upsert(notification.peer);
      state_.monitor().add_log(LogLevel::Info, {}, "Discovered " + peer_label(notification.peer));
      break;
    case PeerNotification::Type::Updated:
      view.upsert(notification.peer);
      break;
    case PeerNotification::Type::Lost:
      view.upsert(notification.peer);
      state_.monitor().add_log(LogLevel::Info, {}, "Lost " + peer_label(notification.peer));
      break;
  }
}

bool TuiApp::tick() {
  if(auto key = input_->try_receive()) {
    if(auto action = state_.handle_key(*key)) dispatch(*action);
  }

  if(auto notification = peer_updates_->try_receive()) apply_peer_notification(*notification);
  if(auto peers = peer_snapshots_->try_receive()) {
    for(const auto& peer : *peers) state_.peer_view().upsert(peer);
  }
  if(auto status = transfer_updates_->try_receive()) state_.monitor().apply(*status);
  if(auto status = stream_updates_->try_receive()) {
    state_.monitor().apply(*status);
    state_.set_streams(deps_.streaming.get_active_streams());
  }
  if(auto status = exec_updates_->try_receive()) state_.monitor().apply(*status);
  for(auto& entry : logs_->drain()) {
    state_.monitor().add_log(entry.level, std::move(entry.operation_id), std::move(entry.message));
  }

  state_.monitor().sample_bandwidth();
  return state_.running();
}

std::vector<std::string> TuiApp::frame(std::size_t width, std::size_t height) const {
  return renderer_.render(state_, width, height);
}

void TuiApp::dispatch(const TuiAction& action) {
  // Runs after this app may be gone: capture the handlers and channels, not this.
  auto deps = deps_;
  auto logs = logs_;
  auto snapshots = peer_snapshots_;
  auto log_action = [logs](LogLevel level, const std::string& operation_id, const std::string& message) {
    send_log(*logs, level, operation_id, message);
  };
  auto run = [deps, snapshots, log_action, action]{
    try {
      switch(action.type) {
        case TuiAction::Type::SendFiles: {
          SendRequest request;
          request.files = action.files;
          request.peer = action.peer_id;
          auto handle = deps.transfer.send(request);
          log_action(LogLevel::Info, handle.operation_id,
                     "Sending " + std::to_string(action.files.size()) + " files to " + action.peer_id);
          break;
        }
        case TuiAction::Type::CancelOperation:
        case TuiAction::Type::PauseOperation:
        case TuiAction::Type::ResumeOperation: {
          bool stream = deps.streaming.get_operation_status(action.operation_id).has_value();
          if(action.type == TuiAction::Type::CancelOperation) {
            stream ? deps.streaming.stop_stream(action.operation_id)
                   : deps.transfer.cancel_operation(action.operation_id);
            log_action(LogLevel::Info, action.operation_id, "Cancel requested");
          } else if(action.type == TuiAction::Type::PauseOperation) {
            stream ? deps.streaming.pause_stream(action.operation_id)
                   : deps.transfer.pause_operation(action.operation_id);
            log_action(LogLevel::Info, action.operation_id, "Pause requested");
          } else {
            stream ? deps.streaming.resume_stream(action.operation_id)
                   : deps.transfer.resume_operation(action.operation_id);
            log_action(LogLevel::Info, action.operation_id, "Resume requested");
          }
          break;
        }
        case TuiAction::Type::ConnectPeer:
        case TuiAction::Type::RefreshPeers: {
          DiscoveryFilters filters;
          filters.timeout = std::chrono::seconds(3);
          auto result = deps.discover.discover(filters);
          if(action.type == TuiAction::Type::ConnectPeer) {
            bool seen = false;
            for(auto& peer : result.peers) {
              if(peer.id != action.peer_id) continue;
              peer.connection_status = ConnectionStatus::Connected;
              seen = true;
            }
            if(!seen) {
              PeerInfo lost;
              for(const auto& cached : deps.discover.get_cached_peers()) {
                if(cached.id == action.peer_id) lost = cached;
              }
              lost.id = action.peer_id;
              lost.connection_status = ConnectionStatus::Error;
              result.peers.push_back(lost);
              log_action(LogLevel::Warning, {}, "Peer " + action.peer_id + " did not answer");
            }
          } else {
            log_action(LogLevel::Info, {}, "Found " + std::to_string(result.peers.size()) + " peers");
          }
          snapshots->send(std::move(result.peers));
          break;
        }
        case TuiAction::Type::DisconnectPeer:
          log_action(LogLevel::Info, {}, "Disconnected from " + action.peer_id);
          break;
        case TuiAction::Type::ToggleTrust:
          if(action.trust == TrustStatus::Trusted) {
            auto info = deps.peers.get_peer_info(action.peer_id);
            deps.peers.trust(action.peer_id, info.name, true);
          } else {
            deps.peers.untrust(action.peer_id, true);
          }
          deps.discover.refresh_trust();
          break;
        case TuiAction::Type::BlockPeer:
          deps.peers.block(action.peer_id, true);
          deps.discover.refresh_trust();
          break;
      }
    } catch(const KizunaError& e) {
      log_action(LogLevel::Error, action.operation_id, e.what());
    } catch(const std::exception& e) {
      log_action(LogLevel::Error, action.operation_id, std::string("Unexpected error: ") + e.what());
    }
  };
  deps_.runtime.post(std::move(run));
}

void TuiApp::input_loop() {
  while(reading_.load()) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(kTickInterval.count()));
    if(ready <= 0 || !(pfd.revents & POLLIN)) continue;
    char buffer[64];
    auto n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if(n <= 0) continue;
    for(const auto& key : parse_keys(std::string(buffer, static_cast<std::size_t>(n)))) {
      input_->send(key);
    }
  }
}

void TuiApp::run() {
  TerminalGuard guard;
  guard.enter();

  bool passthrough = log_passthrough();
  set_log_passthrough(false);
  attach_logs();

  try {
    deps_.transfer.start();
    deps_.streaming.start();
    deps_.discover.start_continuous_discovery();
  } catch(const KizunaError& e) {
    state_.monitor().add_log(LogLevel::Error, {}, e.what());
  }

  reading_.store(true);
  input_thread_ = std::thread([this]{ input_loop(); });
  log_info(logger_.get(), "Interactive mode started");

  try {
    auto next = std::chrono::steady_clock::now();
    while(tick()) {
      auto [rows, cols] = terminal_size();
      write_all(compose_frame(frame(cols, rows)));
      next += kTickInterval;
      auto now = std::chrono::steady_clock::now();
      if(next > now) {
        std::this_thread::sleep_for(next - now);
      } else {
        next = now;
      }
    }
  } catch(...) {
    leave(passthrough);
    guard.restore();
    throw;
  }

  leave(passthrough);
  guard.restore();
}

void TuiApp::leave(bool passthrough) {
  reading_.store(false);
  if(input_thread_.joinable()) input_thread_.join();
  deps_.discover.stop_continuous_discovery();
  detach_logs();
  set_log_passthrough(passthrough);
}
