#include "command_router.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

#include "batch_orchestrator.hpp"
#include "clipboard_handler.hpp"
#include "completion.hpp"
#include "discover_handler.hpp"
#include "errors.hpp"
#include "exec_handler.hpp"
#include "history.hpp"
#include "peers_handler.hpp"
#include "pipeline_io.hpp"
#include "queue_dispatcher.hpp"
#include "status_handler.hpp"
#include "streaming_handler.hpp"
#include "transfer_handler.hpp"
#include "transfer_queue.hpp"
#include "utils.hpp"

namespace {

std::string yes_no(bool value, const char* yes = "enabled", const char* no = "disabled") {
  return value ? yes : no;
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  for(auto& part : split(value, ',')) {
    auto trimmed = trim_copy(part);
    if(!trimmed.empty()) out.push_back(std::move(trimmed));
  }
  return out;
}

TableData key_value_table(const std::vector<std::pair<std::string, std::string>>& rows,
                          const char* key_header = "Property",
                          const char* value_header = "Value") {
  TableData table;
  table.headers = {key_header, value_header};
  for(const auto& row : rows) table.rows.push_back({row.first, row.second});
  return table;
}

TableData clipboard_table(const std::vector<ClipboardEntry>& entries) {
  TableData table;
  table.headers = {"id", "content", "source", "time"};
  for(const auto& entry : entries) {
    auto content = entry.content;
    std::replace(content.begin(), content.end(), '\n', ' ');
    table.rows.push_back({entry.id, truncate_display(content, 60), entry.source_peer,
                          format_local_time(entry.timestamp)});
  }
  return table;
}

nlohmann::json clipboard_json(const ClipboardResult& result) {
  nlohmann::json j{{"message", result.message}};
  if(result.sharing_enabled) j["sharing_enabled"] = *result.sharing_enabled;
  if(!result.entries.empty()) {
    auto entries = nlohmann::json::array();
    for(const auto& entry : result.entries) {
      entries.push_back({{"id", entry.id},
                         {"content", entry.content},
                         {"source_peer", entry.source_peer},
                         {"timestamp", format_rfc3339(entry.timestamp)}});
    }
    j["entries"] = entries;
  }
  return j;
}

} // namespace

CommandContext CommandContext::create(ValidatedCommand validated) {
  CommandContext ctx;
  ctx.verbose = validated.command.has_flag("verbose");
  ctx.quiet = validated.command.has_flag("quiet");
  ctx.validated_command = std::move(validated);
  ctx.start_time = std::chrono::steady_clock::now();
  return ctx;
}

std::chrono::milliseconds CommandContext::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
}

std::string format_error(const KizunaError& error, const StyleManager& style) {
  std::string text = style.status_line(StatusKind::Error, error.what());
  if(!error.suggestions().empty()) {
    text += "\n\nDid you mean:";
    for(const auto& suggestion : error.suggestions()) text += "\n  " + suggestion;
  }
  return text;
}

void write_result(const CommandResult& result, const OutputFormatter& formatter,
                  std::ostream& out, std::ostream& err) {
  bool text = result.output.type == CommandOutput::Type::Text;
  std::string block = (text && !result.success) ? result.output.text : formatter.render(result.output);
  if(block.empty()) return;
  auto& stream = (text && !result.success) ? err : out;
  stream << block;
  if(block.back() != '\n') stream << "\n";
  stream.flush();
}

CommandRouter::CommandRouter(RouterDependencies deps, RouterIo io)
  : deps_(std::move(deps)),
    io_(std::move(io)),
    style_(deps_.config.color_mode),
    err_style_(deps_.config.color_mode, io_.stderr_terminal),
    logger_(component_logger("router")) {
  if(!io_.in) io_.in = &std::cin;
  if(!io_.out) io_.out = &std::cout;
  if(!io_.err) io_.err = &std::cerr;
}

void CommandRouter::set_tui_launcher(TuiLauncher launcher) {
  tui_launcher_ = std::move(launcher);
}

CommandResult CommandRouter::route(const CommandContext& ctx) {
  report_warnings(ctx);
  return dispatch(ctx);
}

void CommandRouter::report_warnings(const CommandContext& ctx) {
  if(ctx.quiet) return;
  for(const auto& warning : ctx.validated_command.warnings) {
    std::string line = warning.field + ": " + warning.message;
    if(warning.suggestion) line += " (" + *warning.suggestion + ")";
    *io_.err << err_style_.status_line(StatusKind::Warning, line) << "\n";
  }
}

CommandResult CommandRouter::dispatch(const CommandContext& ctx) {
  const auto& verb = ctx.command().verb;
  log_debug(logger_.get(), "Routing '{}'", verb);
  if(verb == "discover") return route_discover(ctx);
  if(verb == "send") return route_send(ctx);
  if(verb == "receive") return route_receive(ctx);
  if(verb == "stream") return route_stream(ctx);
  if(verb == "exec") return route_exec(ctx);
  if(verb == "peers") return route_peers(ctx);
  if(verb == "status") return route_status(ctx);
  if(verb == "clipboard") return route_clipboard(ctx);
  if(verb == "tui") return route_tui(ctx);
  if(verb == "config") return route_config(ctx);
  if(verb == "completion") return route_completion(ctx);
  throw KizunaError::invalid_command(verb, rank_suggestions(verb, deps_.parser.verbs(), 3));
}

CommandResult CommandRouter::failure(const KizunaError& error, std::chrono::milliseconds elapsed) const {
  CommandResult result;
  result.success = false;
  result.output = CommandOutput::make_text(format_error(error, err_style_));
  result.execution_time = elapsed;
  result.exit_code = error.exit_code();
  return result;
}

CommandResult CommandRouter::execute(const CommandContext& ctx) {
  report_warnings(ctx);
  return dispatch_or_fail(ctx);
}

CommandResult CommandRouter::dispatch_or_fail(const CommandContext& ctx) {
  try {
    return dispatch(ctx);
  } catch(const KizunaError& e) {
    log_debug(logger_.get(), "'{}' failed: {}", ctx.command().verb, e.what());
    return failure(e, ctx.elapsed());
  } catch(const std::exception& e) {
    log_error(logger_.get(), "'{}' failed unexpectedly: {}", ctx.command().verb, e.what());
    return failure(KizunaError::other(e.what()), ctx.elapsed());
  }
}

CommandResult CommandRouter::execute_with_recovery(const CommandContext& ctx) {
  report_warnings(ctx);
  try {
    return dispatch(ctx);
  } catch(const KizunaError& e) {
    if(!e.is_transient()) return failure(e, ctx.elapsed());
    log_warn(logger_.get(), "{}; retrying in {} ms", e.what(), kRetryBackoff.count());
  } catch(const std::exception& e) {
    return failure(KizunaError::other(e.what()), ctx.elapsed());
  }
  std::this_thread::sleep_for(kRetryBackoff);
  return dispatch_or_fail(ctx);
}

CommandResult CommandRouter::ok(const CommandContext& ctx, CommandOutput output) const {
  CommandResult result;
  result.success = true;
  result.output = std::move(output);
  result.execution_time = ctx.elapsed();
  result.exit_code = kExitSuccess;
  return result;
}

bool CommandRouter::pipeline(const CommandContext& ctx) const {
  return ctx.command().has_flag("pipeline");
}

bool CommandRouter::interrupted(std::chrono::milliseconds wait) const {
  if(io_.wait_interrupt) return io_.wait_interrupt(wait);
  std::this_thread::sleep_for(wait);
  return false;
}

void CommandRouter::note(const CommandContext& ctx, const std::string& message) const {
  if(ctx.quiet || pipeline(ctx)) return;
  *io_.err << err_style_.status_line(StatusKind::Info, message) << "\n";
  io_.err->flush();
}

void CommandRouter::emit(const std::string& line) const {
  *io_.out << line << "\n";
  io_.out->flush();
}

std::vector<std::string> CommandRouter::target_peers(const CommandContext& ctx) const {
  if(auto peer = ctx.command().option("peer")) {
    if(*peer != "-") return split_list(*peer);
    if(io_.stdin_terminal) {
      throw KizunaError::invalid_argument_value("--peer", "'-' reads peers from standard input, which is a terminal");
    }
    return parse_peer_list(*io_.in);
  }
  if(deps_.config.default_peer) return split_list(*deps_.config.default_peer);
  return {};
}

CommandResult CommandRouter::peer_list_output(const CommandContext& ctx, const std::vector<PeerInfo>& peers) const {
  if(pipeline(ctx)) {
    PipelineOutput(*io_.out, deps_.config.output_format).write_peer_list(peers);
    return ok(ctx, CommandOutput::interactive());
  }
  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json(nlohmann::json(peers)));
  }
  return ok(ctx, CommandOutput::make_table(peers_table(peers)));
}

// ---- discover / peers ------------------------------------------------------

std::string CommandRouter::notification_line(const PeerNotification& notification) const {
  if(deps_.config.output_format == OutputFormat::Json) {
    const char* event = notification.type == PeerNotification::Type::Discovered ? "discovered"
                      : notification.type == PeerNotification::Type::Updated ? "updated" : "lost";
    return render_json(nlohmann::json{{"event", event}, {"peer", notification.peer}}, false);
  }
  const auto& peer = notification.peer;
  switch(notification.type) {
    case PeerNotification::Type::Discovered:
      return style_.colorize("+", Color::Green) + " " + peer.name + " (" + peer.id + ") " + peer.device_type +
             " " + to_string(peer.trust_status);
    case PeerNotification::Type::Updated:
      return style_.colorize("~", Color::Yellow) + " " + peer.name + " (" + peer.id + ") " +
             to_string(peer.connection_status) + " " + to_string(peer.trust_status);
    case PeerNotification::Type::Lost:
      return style_.colorize("-", Color::Red) + " " + peer.name + " (" + peer.id + ")";
  }
  return {};
}

void CommandRouter::watch_peers(const CommandContext& ctx, const std::string& filter) {
  auto notifications = deps_.discover.subscribe();
  try {
    deps_.discover.start_continuous_discovery();
  } catch(const KizunaError& e) {
    if(!e.is_transient()) throw;
    log_warn(logger_.get(), "{}; retrying discovery once", e.what());
    std::this_thread::sleep_for(kRetryBackoff);
    deps_.discover.start_continuous_discovery();
  }
  deps_.dispatcher.start();
  note(ctx, "Watching for peers (Ctrl-C to stop)");

  for(const auto& peer : deps_.discover.get_realtime_peers()) {
    if(!filter.empty() && !contains_icase(peer.name, filter) && !contains_icase(peer.device_type, filter) &&
       !contains_icase(peer.id, filter)) {
      continue;
    }
    emit(notification_line(PeerNotification{PeerNotification::Type::Discovered, peer}));
  }

  while(!interrupted(kPollInterval)) {
    for(auto& notification : notifications->drain()) {
      const auto& peer = notification.peer;
      if(!filter.empty() && !contains_icase(peer.name, filter) && !contains_icase(peer.device_type, filter) &&
         !contains_icase(peer.id, filter)) {
        continue;
      }
      emit(notification_line(notification));
    }
  }
  deps_.discover.stop_continuous_discovery();
  deps_.dispatcher.stop();
  throw KizunaError::cancelled();
}

CommandResult CommandRouter::route_discover(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  if(cmd.has_flag("watch")) {
    watch_peers(ctx, cmd.option("name").value_or(cmd.option("type").value_or("")));
  }

  DiscoveryFilters filters;
  filters.device_type = cmd.option("type");
  filters.name = cmd.option("name");
  if(auto timeout = cmd.int_option("timeout")) filters.timeout = std::chrono::seconds(*timeout);

  note(ctx, "Discovering peers...");
  auto result = deps_.discover.discover(filters);
  log_info(logger_.get(), "Discovered {} peers in {} ms", result.peers.size(), result.discovery_time.count());
  return peer_list_output(ctx, result.peers);
}

CommandResult CommandRouter::route_peers(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  bool assume_yes = cmd.has_flag("yes");
  auto nickname = cmd.option("nickname").value_or("");

  if(auto peer = cmd.option("trust")) {
    deps_.peers.trust(*peer, nickname, assume_yes);
    return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success, "Peer " + *peer + " trusted")));
  }
  if(auto peer = cmd.option("untrust")) {
    deps_.peers.untrust(*peer, assume_yes);
    return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success, "Peer " + *peer + " untrusted")));
  }
  if(auto peer = cmd.option("block")) {
    deps_.peers.block(*peer, assume_yes);
    return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success, "Peer " + *peer + " blocked")));
  }
  if(cmd.has_flag("pair")) {
    auto code = deps_.peers.pair();
    if(deps_.config.output_format == OutputFormat::Json) {
      return ok(ctx, CommandOutput::make_json({{"code", code.code}, {"expires_at", format_rfc3339(code.expires_at)}}));
    }
    return ok(ctx, CommandOutput::make_text("Pairing code: " + code.code + " (expires " +
                                            format_local_time(code.expires_at) + ")"));
  }
  if(auto code = cmd.option("verify")) {
    auto peer = cmd.option("peer");
    if(!peer) throw KizunaError::missing_argument("--peer");
    if(!deps_.peers.verify(*code, *peer, nickname)) {
      throw KizunaError::integration(IntegrationDomain::Security, "Pairing code rejected for peer '" + *peer + "'");
    }
    return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success, "Peer " + *peer + " verified")));
  }
  if(auto mode = cmd.option("private")) {
    bool enabled = false;
    if(!parse_bool_literal(*mode, enabled)) {
      throw KizunaError::invalid_argument_value("--private", "expected on or off");
    }
    deps_.peers.set_private_mode(enabled);
    return ok(ctx, CommandOutput::make_text("Private mode " + yes_no(enabled)));
  }
  if(auto peer = cmd.option("invite")) {
    auto code = deps_.peers.invite(*peer);
    if(deps_.config.output_format == OutputFormat::Json) {
      return ok(ctx, CommandOutput::make_json({{"peer", *peer}, {"invite_code", code}}));
    }
    return ok(ctx, CommandOutput::make_text("Invite code for " + *peer + ": " + code));
  }

  auto filter = cmd.option("filter").value_or("");
  if(cmd.has_flag("watch")) watch_peers(ctx, filter);

  std::vector<PeerInfo> peers;
  for(auto& peer : deps_.peers.get_peers()) {
    if(filter.empty() || contains_icase(peer.name, filter) || contains_icase(peer.device_type, filter) ||
       contains_icase(peer.id, filter)) {
      peers.push_back(std::move(peer));
    }
  }
  return peer_list_output(ctx, peers);
}

// ---- transfer --------------------------------------------------------------

OperationStatus CommandRouter::wait_for_operation(const CommandContext& ctx,
                                                  const std::function<std::optional<OperationStatus>()>& poll,
                                                  const std::function<void()>& on_interrupt) {
  bool show_progress = io_.stderr_terminal && !ctx.quiet && !pipeline(ctx);
  ProgressRenderer renderer(err_style_);
  auto started = std::chrono::steady_clock::now();
  bool drew = false;
  while(true) {
    auto status = poll();
    if(!status) throw KizunaError::other("operation record lost");
    if(status->state.is_terminal()) {
      if(drew) *io_.err << "\n";
      return *status;
    }
    if(show_progress && status->progress) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
      *io_.err << "\r" << renderer.render(*status->progress, elapsed) << "\x1b[K";
      io_.err->flush();
      drew = true;
    }
    if(interrupted(kPollInterval)) {
      if(drew) *io_.err << "\n";
      on_interrupt();
      throw KizunaError::cancelled();
    }
  }
}

CommandResult CommandRouter::route_send(const CommandContext& ctx) {
  const auto& cmd = ctx.command();

  if(cmd.has_flag("batch")) {
    auto request = parse_batch_json(read_all(*io_.in));
    if(cmd.has_flag("parallel")) request.parallel = true;
    if(auto limit = cmd.int_option("max-concurrent")) request.max_concurrent = static_cast<std::size_t>(*limit);
    return send_batch(ctx, std::move(request));
  }

  std::vector<std::filesystem::path> files;
  if(cmd.positional.size() == 1 && cmd.positional.front() == "-") {
    files = parse_file_list(*io_.in);
  } else {
    for(const auto& file : cmd.positional) files.emplace_back(file);
  }
  if(files.empty()) throw KizunaError::missing_argument("files");

  auto peers = target_peers(ctx);
  if(peers.empty()) throw KizunaError::missing_argument("--peer");

  if(cmd.has_flag("queue")) return send_queued(ctx, files, peers);

  if(peers.size() > 1 || (files.size() > 1 && cmd.has_flag("parallel"))) {
    BatchRequest request;
    request.files = files;
    request.peers = peers;
    request.parallel = cmd.has_flag("parallel");
    if(auto limit = cmd.int_option("max-concurrent")) request.max_concurrent = static_cast<std::size_t>(*limit);
    return send_batch(ctx, std::move(request));
  }
  return send_single(ctx, files, peers.front());
}

CommandResult CommandRouter::send_batch(const CommandContext& ctx, BatchRequest request) {
  if(!request.compression) request.compression = deps_.config.transfer.compression;
  if(!request.encryption) request.encryption = deps_.config.transfer.encryption;
  if(request.parallel && !request.max_concurrent) {
    request.max_concurrent = static_cast<std::size_t>(std::max(1, deps_.config.transfer.max_concurrent));
  }

  note(ctx, "Sending " + std::to_string(request.files.size() * request.peers.size()) + " transfers");
  auto batch_id = deps_.batch.submit(request);
  std::optional<BatchResult> result;
  while(!(result = deps_.batch.wait(batch_id, kPollInterval))) {
    if(interrupted(std::chrono::milliseconds(0))) {
      deps_.batch.cancel_batch(batch_id);
      deps_.batch.wait(batch_id);
      throw KizunaError::cancelled();
    }
  }

  CommandResult out;
  if(pipeline(ctx)) {
    PipelineOutput(*io_.out, deps_.config.output_format).write_batch_result(*result);
    out = ok(ctx, CommandOutput::interactive());
  } else if(deps_.config.output_format == OutputFormat::Json) {
    out = ok(ctx, CommandOutput::make_json(nlohmann::json(*result)));
  } else {
    out = ok(ctx, CommandOutput::make_table(batch_table(*result)));
  }
  if(result->failed > 0) {
    out.success = false;
    out.exit_code = kExitIntegration;
    note(ctx, std::to_string(result->failed) + " of " + std::to_string(result->total_operations) +
              " transfers failed");
  }
  return out;
}

CommandResult CommandRouter::send_queued(const CommandContext& ctx,
                                         const std::vector<std::filesystem::path>& files,
                                         const std::vector<std::string>& peers) {
  const auto& cmd = ctx.command();
  auto priority = QueuePriority::Normal;
  if(auto value = cmd.option("priority")) {
    auto parsed = queue_priority_from_string(to_lower(*value));
    if(!parsed) throw KizunaError::invalid_argument_value("--priority", "expected low, normal, high or urgent");
    priority = *parsed;
  }

  TableData table;
  table.headers = {"queue_id", "peer", "priority", "files"};
  auto json = nlohmann::json::array();
  for(const auto& peer : peers) {
    QueuedTransfer request;
    request.files = files;
    request.peer = peer;
    request.compression = deps_.config.transfer.compression;
    request.encryption = deps_.config.transfer.encryption;
    auto id = deps_.queue.enqueue(request, priority, deps_.peers.resolve_peer_id(peer));
    table.rows.push_back({id, peer, to_string(priority), std::to_string(files.size())});
    json.push_back({{"queue_id", id}, {"peer", peer}, {"priority", to_string(priority)}});
  }
  if(deps_.config.output_format == OutputFormat::Json) return ok(ctx, CommandOutput::make_json(json));
  return ok(ctx, CommandOutput::make_table(table));
}

CommandResult CommandRouter::send_single(const CommandContext& ctx,
                                         const std::vector<std::filesystem::path>& files,
                                         const std::string& peer) {
  SendRequest request;
  request.files = files;
  request.peer = peer;
  request.compression = deps_.config.transfer.compression;
  request.encryption = deps_.config.transfer.encryption;
  auto handle = deps_.transfer.send(request);

  if(ctx.command().has_flag("no-wait")) {
    if(deps_.config.output_format == OutputFormat::Json) {
      return ok(ctx, CommandOutput::make_json(nlohmann::json(handle.status)));
    }
    return ok(ctx, CommandOutput::make_text("Transfer " + handle.operation_id + " started"));
  }

  deps_.dispatcher.start();
  auto id = handle.operation_id;
  auto status = wait_for_operation(ctx,
    [&]{ return deps_.transfer.get_operation_status(id); },
    [&]{ deps_.transfer.cancel_operation(id); });
  deps_.dispatcher.stop();

  if(status.state.kind == OperationState::Kind::Failed) {
    throw KizunaError::integration(IntegrationDomain::Transfer, status.state.message);
  }
  if(status.state.kind == OperationState::Kind::Cancelled) throw KizunaError::cancelled();

  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json(nlohmann::json(status)));
  }
  uint64_t bytes = status.progress && status.progress->total ? *status.progress->total : 0;
  return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success,
    fmt::format("Sent {} file{} ({}) to {} in {}", files.size(), files.size() == 1 ? "" : "s",
                format_bytes(bytes), peer, format_duration(std::chrono::duration_cast<std::chrono::seconds>(ctx.elapsed()))))));
}

CommandResult CommandRouter::route_receive(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  ReceiveRequest request;
  if(auto output = cmd.option("output")) {
    request.output_dir = std::filesystem::path(*output);
  } else if(deps_.config.transfer.default_download_path) {
    request.output_dir = std::filesystem::path(*deps_.config.transfer.default_download_path);
  }
  request.auto_accept = cmd.has_flag("auto-accept") || deps_.config.transfer.auto_accept_trusted;
  request.from_peer = cmd.option("from");

  auto handle = deps_.transfer.receive(request);
  deps_.dispatcher.start();
  note(ctx, "Waiting for incoming transfer... (Ctrl-C to stop)");
  auto id = handle.operation_id;
  auto status = wait_for_operation(ctx,
    [&]{ return deps_.transfer.get_operation_status(id); },
    [&]{
      deps_.transfer.stop_receiving();
      deps_.dispatcher.stop();
    });
  deps_.transfer.stop_receiving();
  deps_.dispatcher.stop();

  if(status.state.kind == OperationState::Kind::Failed) {
    throw KizunaError::integration(IntegrationDomain::Transfer, status.state.message);
  }
  if(status.state.kind == OperationState::Kind::Cancelled) throw KizunaError::cancelled();
  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json(nlohmann::json(status)));
  }
  uint64_t bytes = status.progress ? status.progress->current : 0;
  std::string from = status.peer_id.empty() ? std::string() : " from " + status.peer_id;
  return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success,
    "Received " + format_bytes(bytes) + from)));
}

// ---- stream / exec ---------------------------------------------------------

CommandResult CommandRouter::route_stream(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  StreamRequest request;
  request.camera = cmd.option("camera");
  auto quality = cmd.option("quality").value_or(deps_.config.stream.default_quality);
  auto parsed = stream_quality_from_string(to_lower(quality));
  if(!parsed) throw KizunaError::invalid_argument_value("--quality", "expected low, medium, high or ultra");
  request.quality = *parsed;
  request.record = cmd.has_flag("record") || deps_.config.stream.auto_record;
  if(auto output = cmd.option("output")) {
    request.output = std::filesystem::path(*output);
  } else if(request.record && deps_.config.stream.recording_path) {
    request.output = std::filesystem::path(*deps_.config.stream.recording_path) / StreamingHandler::kDefaultRecording;
  }

  auto result = deps_.streaming.handle_stream(request);
  note(ctx, "Streaming at " + result.stream_url.value_or("") + " (Ctrl-C to stop)");
  if(result.recording) note(ctx, "Recording to " + result.recording->string());

  auto id = result.operation_id;
  auto status = wait_for_operation(ctx,
    [&]{ return deps_.streaming.get_operation_status(id); },
    [&]{ deps_.streaming.stop_stream(id); });
  if(status.state.kind == OperationState::Kind::Failed) {
    throw KizunaError::integration(IntegrationDomain::Streaming, status.state.message);
  }
  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json(nlohmann::json(status)));
  }
  return ok(ctx, CommandOutput::make_text("Stream " + id + " ended"));
}

CommandResult CommandRouter::route_exec(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  auto peers = target_peers(ctx);
  if(peers.empty()) throw KizunaError::missing_argument("--peer");
  std::optional<std::chrono::seconds> timeout;
  if(auto value = cmd.int_option("timeout")) timeout = std::chrono::seconds(*value);

  if(cmd.has_flag("interactive")) {
    std::size_t executed = 0;
    std::string line;
    while(true) {
      if(io_.stdin_terminal) {
        *io_.err << peers.front() << "> ";
        io_.err->flush();
      }
      if(!std::getline(*io_.in, line)) break;
      auto command = trim_copy(line);
      if(command.empty()) continue;
      if(command == "exit" || command == "quit") break;
      try {
        auto result = deps_.exec.handle_exec(ExecCommandRequest{command, peers.front(), timeout});
        *io_.out << result.output;
        if(!result.output.empty() && result.output.back() != '\n') *io_.out << "\n";
        if(result.exit_code != 0) *io_.out << "[exit code: " << result.exit_code << "]\n";
        io_.out->flush();
      } catch(const KizunaError& e) {
        if(e.kind() == ErrorKind::Integration && e.domain() == IntegrationDomain::Security) throw;
        *io_.err << format_error(e, err_style_) << "\n";
      }
      ++executed;
    }
    return ok(ctx, CommandOutput::make_text(std::to_string(executed) + " commands executed on " + peers.front()));
  }

  auto command = join(cmd.positional, " ");
  if(trim_copy(command).empty()) throw KizunaError::missing_argument("command");
  auto result = deps_.exec.handle_exec(ExecCommandRequest{command, peers.front(), timeout});
  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json({{"operation_id", result.operation_id},
                                             {"output", result.output},
                                             {"exit_code", result.exit_code},
                                             {"execution_time_ms", result.execution_time.count()}}));
  }
  auto text = result.output;
  if(!text.empty() && text.back() == '\n') text.pop_back();
  if(result.exit_code != 0) {
    if(!text.empty()) text += "\n";
    text += err_style_.status_line(StatusKind::Warning, "Remote command exited with code " + std::to_string(result.exit_code));
  }
  return ok(ctx, CommandOutput::make_text(text));
}

// ---- status / clipboard ----------------------------------------------------

CommandResult CommandRouter::route_status(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  if(cmd.has_flag("queue")) {
    auto stats = deps_.queue.statistics();
    if(deps_.config.output_format == OutputFormat::Json) {
      return ok(ctx, CommandOutput::make_json(nlohmann::json(stats)));
    }
    return ok(ctx, CommandOutput::make_table(key_value_table({
      {"Pending", std::to_string(stats.pending_count)},
      {"Active", std::to_string(stats.active_count)},
      {"Available slots", std::to_string(stats.available_slots)},
      {"Paused", std::to_string(stats.paused_count)},
      {"Completed", std::to_string(stats.completed_count)},
      {"Failed", std::to_string(stats.failed_count)},
      {"Cancelled", std::to_string(stats.cancelled_count)},
      {"Max concurrent", std::to_string(stats.max_concurrent)}
    })));
  }

  auto status = deps_.status.get_system_status();
  bool detailed = cmd.has_flag("detailed");
  if(deps_.config.output_format == OutputFormat::Json) {
    nlohmann::json j = status;
    if(detailed) {
      j["private_mode"] = deps_.peers.private_mode();
      j["trusted_peers"] = deps_.peers.trusted_peers().size();
      j["queue"] = deps_.queue.statistics();
      j["operations"] = deps_.transfer.get_all_operations();
    }
    return ok(ctx, CommandOutput::make_json(j));
  }

  std::vector<std::pair<std::string, std::string>> rows = {
    {"Version", status.version},
    {"Uptime", format_duration(status.uptime)},
    {"Connected peers", std::to_string(status.connected_peers)},
    {"Active transfers", std::to_string(status.active_transfers)},
    {"Active streams", std::to_string(status.active_streams)},
    {"Clipboard sync", yes_no(status.clipboard_sync_enabled)},
    {"Discovery", yes_no(status.discovery_enabled)}
  };
  if(detailed) {
    auto stats = deps_.queue.statistics();
    rows.emplace_back("Private mode", yes_no(deps_.peers.private_mode(), "on", "off"));
    rows.emplace_back("Trusted peers", std::to_string(deps_.peers.trusted_peers().size()));
    rows.emplace_back("Queued transfers", std::to_string(stats.pending_count));
    rows.emplace_back("Config file", deps_.config_manager.path().string());
  }
  return ok(ctx, CommandOutput::make_table(key_value_table(rows)));
}

CommandResult CommandRouter::route_clipboard(const CommandContext& ctx) {
  if(!deps_.clipboard) {
    throw KizunaError::integration(IntegrationDomain::Clipboard, "Clipboard service is not available");
  }
  auto& clipboard = *deps_.clipboard;
  const auto& cmd = ctx.command();
  auto sub = cmd.subcommand.value_or("status");
  ClipboardResult result;

  if(sub == "share") {
    std::optional<bool> enable;
    if(cmd.has_flag("enable")) enable = true;
    if(cmd.has_flag("disable")) enable = false;
    result = clipboard.share(enable, cmd.option("peer"));
  } else if(sub == "status") {
    if(deps_.config.output_format == OutputFormat::Json) {
      auto status = clipboard.get_status();
      return ok(ctx, CommandOutput::make_json({{"sharing_enabled", status.sharing_enabled},
                                               {"enabled_devices", status.enabled_devices},
                                               {"history_size", status.history_size}}));
    }
    result = clipboard.status();
  } else {
    if(cmd.has_flag("clear")) {
      result = clipboard.clear_history();
    } else if(auto id = cmd.option("restore")) {
      result = clipboard.restore(*id);
    } else if(auto query = cmd.option("search")) {
      result = clipboard.search_history(*query);
    } else {
      auto limit = cmd.int_option("limit").value_or(static_cast<long long>(ClipboardHandler::kDefaultHistoryLimit));
      if(limit <= 0) throw KizunaError::invalid_argument_value("--limit", "must be a positive integer");
      result = clipboard.history(static_cast<std::size_t>(limit));
    }
    if(deps_.config.output_format != OutputFormat::Json && !result.entries.empty()) {
      return ok(ctx, CommandOutput::make_table(clipboard_table(result.entries)));
    }
  }

  if(deps_.config.output_format == OutputFormat::Json) {
    return ok(ctx, CommandOutput::make_json(clipboard_json(result)));
  }
  return ok(ctx, CommandOutput::make_text(result.message));
}

// ---- tui / config / completion ---------------------------------------------

CommandResult CommandRouter::route_tui(const CommandContext& ctx) {
  if(!tui_launcher_) throw KizunaError::tui("interactive mode is not available");
  deps_.dispatcher.start();
  try {
    tui_launcher_();
  } catch(...) {
    deps_.dispatcher.stop();
    throw;
  }
  deps_.dispatcher.stop();
  return ok(ctx, CommandOutput::interactive());
}

CommandResult CommandRouter::route_config(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  const auto& manager = deps_.config_manager;
  auto sub = cmd.subcommand.value_or("list");

  if(sub == "get") {
    if(cmd.positional.empty()) throw KizunaError::missing_argument("key");
    auto key = cmd.positional.front();
    auto value = manager.get_value(deps_.config, key);
    if(deps_.config.output_format == OutputFormat::Json) {
      return ok(ctx, CommandOutput::make_json({{"key", *manager.resolve_key(key)}, {"value", value}}));
    }
    return ok(ctx, CommandOutput::make_text(value));
  }

  if(sub == "set") {
    if(cmd.positional.size() < 2) throw KizunaError::missing_argument(cmd.positional.empty() ? "key" : "value");
    const auto& key = cmd.positional[0];
    const auto& value = cmd.positional[1];
    manager.write_default_file();
    auto stored = manager.load();
    manager.set_value(stored, key, value);
    manager.save(stored);
    auto canonical = manager.resolve_key(key).value_or(key);
    log_info(logger_.get(), "Set {} in {}", canonical, manager.path().string());
    return ok(ctx, CommandOutput::make_text(style_.status_line(StatusKind::Success,
      canonical + " = " + manager.get_value(stored, canonical))));
  }

  if(manager.write_default_file()) note(ctx, "Wrote default configuration to " + manager.path().string());
  auto entries = manager.list(deps_.config);
  if(deps_.config.output_format == OutputFormat::Json) {
    nlohmann::json j = nlohmann::json::object();
    for(const auto& entry : entries) j[entry.first] = entry.second;
    return ok(ctx, CommandOutput::make_json(j));
  }
  return ok(ctx, CommandOutput::make_table(key_value_table(entries, "Key", "Value")));
}

CommandResult CommandRouter::route_completion(const CommandContext& ctx) {
  const auto& cmd = ctx.command();
  if(auto line = cmd.option("line")) {
    CompletionEngine::Sources sources;
    sources.history = deps_.history;
    sources.peer_names = [this]{
      std::vector<std::string> names;
      for(const auto& peer : deps_.discover.get_cached_peers()) names.push_back(peer.name);
      try {
        for(const auto& entry : deps_.peers.trusted_peers()) {
          names.push_back(entry.nickname.empty() ? entry.peer_id : entry.nickname);
        }
      } catch(const KizunaError& e) {
        log_debug(logger_.get(), "Trusted peers unavailable for completion: {}", e.what());
      }
      return names;
    };
    sources.config_keys = [this]{ return deps_.config_manager.keys(); };
    CompletionEngine engine(deps_.parser, sources);
    auto candidates = engine.complete(*line);
    std::string text;
    for(const auto& candidate : candidates) text += candidate + "\n";
    if(!text.empty()) text.pop_back();
    return ok(ctx, CommandOutput::make_text(text));
  }
  if(!cmd.subcommand) throw KizunaError::missing_argument("shell");
  return ok(ctx, CommandOutput::make_text(CompletionEngine::script(*cmd.subcommand)));
}
