#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <termios.h>

#include "channel.hpp"
#include "config_manager.hpp"
#include "log.hpp"
#include "output_formatter.hpp"
#include "tui_render.hpp"
#include "tui_state.hpp"

class DiscoverHandler;
class ExecHandler;
class HistoryManager;
class PeersHandler;
class Runtime;
class StreamingHandler;
class TransferHandler;
struct PeerNotification;

// Raw mode plus alternate screen for as long as the guard lives. The
// destructor always leaves the terminal usable.
class TerminalGuard {
public:
  TerminalGuard() = default;
  ~TerminalGuard();

  TerminalGuard(const TerminalGuard&) = delete;
  TerminalGuard& operator=(const TerminalGuard&) = delete;

  // Throws KizunaError(Tui) when stdin is not a terminal.
  void enter();
  void restore();
  bool active() const { return active_; }

private:
  bool active_ = false;
  termios original_{};
};

// Decodes raw terminal bytes. A lone ESC at the end of the chunk is the Esc
// key, not the start of a sequence.
std::vector<KeyEvent> parse_keys(const std::string& bytes);

// Rows and columns of the controlling terminal, 24x80 when unknown.
std::pair<std::size_t, std::size_t> terminal_size();

struct TuiDependencies {
  Runtime& runtime;
  DiscoverHandler& discover;
  TransferHandler& transfer;
  StreamingHandler& streaming;
  ExecHandler& exec;
  PeersHandler& peers;
  const ConfigManager& config_manager;
  CLIConfig config;
  HistoryManager* history = nullptr;
};

class TuiApp {
public:
  static constexpr std::chrono::milliseconds kTickInterval{50};
  static constexpr std::size_t kHistoryRows = 50;

  TuiApp(TuiDependencies deps, StyleManager style);
  ~TuiApp();

  TuiApp(const TuiApp&) = delete;
  TuiApp& operator=(const TuiApp&) = delete;

  // Owns the terminal until the user quits.
  void run();

  // Applies at most one queued key and one update from each source. Returns
  // false once the user quit.
  bool tick();
  void push_key(const KeyEvent& key) { input_->send(key); }
  // Hands an action to the runtime; never waits for the handler.
  void dispatch(const TuiAction& action);

  std::vector<std::string> frame(std::size_t width, std::size_t height) const;
  TuiState& state() { return state_; }
  const TuiState& state() const { return state_; }

private:
  void load_snapshot();
  void attach_logs();
  void detach_logs();
  void apply_peer_notification(const PeerNotification& notification);
  void input_loop();
  // Stops input and discovery and hands logging back to the default sinks.
  void leave(bool passthrough);

  TuiDependencies deps_;
  TuiState state_;
  TuiRenderer renderer_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<Channel<KeyEvent>> input_;
  std::shared_ptr<Channel<LogEntry>> logs_;
  std::shared_ptr<Channel<std::vector<PeerInfo>>> peer_snapshots_;
  std::shared_ptr<Channel<PeerNotification>> peer_updates_;
  std::shared_ptr<Channel<OperationStatus>> transfer_updates_;
  std::shared_ptr<Channel<OperationStatus>> stream_updates_;
  std::shared_ptr<Channel<OperationStatus>> exec_updates_;

  std::vector<std::pair<std::shared_ptr<Logger>, LogListenerHandle>> listeners_;
  std::atomic<bool> reading_{false};
  std::thread input_thread_;
};
