#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "command_validator.hpp"
#include "config_manager.hpp"
#include "log.hpp"
#include "output_formatter.hpp"
#include "types.hpp"

class BatchOrchestrator;
struct BatchRequest;
class ClipboardHandler;
class CommandParser;
class DiscoverHandler;
class ExecHandler;
class HistoryManager;
class KizunaError;
class PeersHandler;
class QueueDispatcher;
class StatusHandler;
class StreamingHandler;
class TransferHandler;
class TransferQueue;
struct PeerNotification;

// Immutable per-invocation state handed to every route.
struct CommandContext {
  ValidatedCommand validated_command;
  std::chrono::steady_clock::time_point start_time;
  bool verbose = false;
  bool quiet = false;

  static CommandContext create(ValidatedCommand validated);

  const ParsedCommand& command() const { return validated_command.command; }
  std::chrono::milliseconds elapsed() const;
};

struct RouterDependencies {
  CLIConfig config;
  const ConfigManager& config_manager;
  const CommandParser& parser;
  DiscoverHandler& discover;
  TransferHandler& transfer;
  StreamingHandler& streaming;
  ExecHandler& exec;
  PeersHandler& peers;
  StatusHandler& status;
  BatchOrchestrator& batch;
  TransferQueue& queue;
  QueueDispatcher& dispatcher;
  ClipboardHandler* clipboard = nullptr;
  HistoryManager* history = nullptr;
};

struct RouterIo {
  std::istream* in = nullptr;
  std::ostream* out = nullptr;
  std::ostream* err = nullptr;
  bool stdin_terminal = false;
  bool stderr_terminal = false;
  // Blocks up to the interval; true once the user interrupted.
  std::function<bool(std::chrono::milliseconds)> wait_interrupt;
};

// Error text with "Did you mean" suggestions appended.
std::string format_error(const KizunaError& error, const StyleManager& style);

// Failure text goes to err. Structured output is rendered to out whether or
// not the command succeeded.
void write_result(const CommandResult& result, const OutputFormatter& formatter,
                  std::ostream& out, std::ostream& err);

// Maps a validated command onto its handler and wraps the outcome in a
// CommandResult. Exit codes: 0 success, 1 usage, 2 integration, 130 cancelled.
class CommandRouter {
public:
  using TuiLauncher = std::function<void()>;

  static constexpr std::chrono::milliseconds kRetryBackoff{500};
  static constexpr std::chrono::milliseconds kPollInterval{200};

  CommandRouter(RouterDependencies deps, RouterIo io);

  void set_tui_launcher(TuiLauncher launcher);

  // Throws KizunaError.
  CommandResult route(const CommandContext& context);
  // Converts failures into a non-zero CommandResult.
  CommandResult execute(const CommandContext& context);
  // Like execute, but retries a transient integration failure once.
  CommandResult execute_with_recovery(const CommandContext& context);

  CommandResult failure(const KizunaError& error, std::chrono::milliseconds elapsed) const;

  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  // Warnings are printed once per invocation, before the first attempt.
  void report_warnings(const CommandContext& ctx);
  CommandResult dispatch(const CommandContext& ctx);
  CommandResult dispatch_or_fail(const CommandContext& ctx);

  CommandResult route_discover(const CommandContext& ctx);
  CommandResult route_send(const CommandContext& ctx);
  CommandResult route_receive(const CommandContext& ctx);
  CommandResult route_stream(const CommandContext& ctx);
  CommandResult route_exec(const CommandContext& ctx);
  CommandResult route_peers(const CommandContext& ctx);
  CommandResult route_status(const CommandContext& ctx);
  CommandResult route_clipboard(const CommandContext& ctx);
  CommandResult route_tui(const CommandContext& ctx);
  CommandResult route_config(const CommandContext& ctx);
  CommandResult route_completion(const CommandContext& ctx);

  CommandResult send_batch(const CommandContext& ctx, BatchRequest request);
  CommandResult send_queued(const CommandContext& ctx,
                            const std::vector<std::filesystem::path>& files,
                            const std::vector<std::string>& peers);
  CommandResult send_single(const CommandContext& ctx,
                            const std::vector<std::filesystem::path>& files,
                            const std::string& peer);

  // Renders peer changes until interrupted, then throws Cancelled.
  void watch_peers(const CommandContext& ctx, const std::string& filter);
  // Polls an operation until it is terminal; on interrupt calls on_interrupt
  // and throws Cancelled.
  OperationStatus wait_for_operation(const CommandContext& ctx,
                                     const std::function<std::optional<OperationStatus>()>& poll,
                                     const std::function<void()>& on_interrupt);

  CommandResult ok(const CommandContext& ctx, CommandOutput output) const;
  CommandResult peer_list_output(const CommandContext& ctx, const std::vector<PeerInfo>& peers) const;
  bool pipeline(const CommandContext& ctx) const;
  bool interrupted(std::chrono::milliseconds wait) const;
  void note(const CommandContext& ctx, const std::string& message) const;
  void emit(const std::string& line) const;
  std::string notification_line(const PeerNotification& notification) const;
  std::vector<std::string> target_peers(const CommandContext& ctx) const;

  RouterDependencies deps_;
  RouterIo io_;
  StyleManager style_;
  StyleManager err_style_;
  TuiLauncher tui_launcher_;
  std::shared_ptr<Logger> logger_;
};
