#include "kizuna_app.hpp"

#include <unistd.h>

#include <algorithm>
#include <iostream>

#include "batch_orchestrator.hpp"
#include "clipboard_handler.hpp"
#include "command_parser.hpp"
#include "command_router.hpp"
#include "command_validator.hpp"
#include "config_manager.hpp"
#include "discover_handler.hpp"
#include "errors.hpp"
#include "exec_handler.hpp"
#include "history.hpp"
#include "lan_discovery.hpp"
#include "local_clipboard.hpp"
#include "local_security.hpp"
#include "output_formatter.hpp"
#include "peer_service.hpp"
#include "peers_handler.hpp"
#include "pipeline_io.hpp"
#include "queue_dispatcher.hpp"
#include "runtime.hpp"
#include "security_gate.hpp"
#include "status_handler.hpp"
#include "stream_registry.hpp"
#include "streaming_handler.hpp"
#include "transfer_handler.hpp"
#include "transfer_queue.hpp"
#include "tui_app.hpp"
#include "utils.hpp"

namespace {

bool is_help(const std::string& arg) {
  return arg == "--help" || arg == "-h" || arg == "help";
}

std::string command_line(const std::vector<std::string>& args) {
  std::vector<std::string> quoted;
  for(const auto& arg : args) {
    quoted.push_back(arg.find(' ') == std::string::npos ? arg : "\"" + arg + "\"");
  }
  return "kizuna " + join(quoted, " ");
}

void write_block(std::ostream& stream, const std::string& text) {
  if(text.empty()) return;
  stream << text;
  if(text.back() != '\n') stream << "\n";
  stream.flush();
}

} // namespace

KizunaApp::KizunaApp(std::istream& in, std::ostream& out, std::ostream& err)
  : in_(in),
    out_(out),
    err_(err),
    stdin_terminal_(stdin_is_terminal()),
    stderr_terminal_(isatty(STDERR_FILENO) == 1),
    logger_(component_logger("app")) {}

bool KizunaApp::ask(const std::string& question) {
  std::lock_guard<std::mutex> lock(prompt_mutex_);
  err_ << question << " [y/N] ";
  err_.flush();
  std::string answer;
  if(!std::getline(in_, answer)) return false;
  answer = to_lower(trim_copy(answer));
  return answer == "y" || answer == "yes";
}

bool KizunaApp::serves_peers(const std::string& verb) {
  return verb == "receive" || verb == "tui";
}

bool KizunaApp::records_history(const std::string& verb) {
  return verb != "tui" && verb != "completion";
}

LocalNode KizunaApp::local_node(const CLIConfig& config, const std::string& peer_id) {
  LocalNode node;
  node.peer_id = peer_id;
  node.name = config.network.device_name.empty() ? local_host_name() : config.network.device_name;
  node.device_type = config.network.device_type;
  node.capabilities = {"file_transfer", "streaming", "clipboard"};
  if(config.exec.allow_remote) node.capabilities.push_back("exec");
  node.service_port = static_cast<unsigned short>(config.network.listen_port);
  return node;
}

std::optional<PeerInfo> KizunaApp::resolve_peer(DiscoverHandler& discover, const std::string& name_or_id) {
  if(auto peer = discover.find_peer(name_or_id)) return peer;
  DiscoveryFilters filters;
  filters.timeout = kResolveTimeout;
  discover.discover(filters);
  return discover.find_peer(name_or_id);
}

int KizunaApp::run(const std::vector<std::string>& args) {
  CommandParser parser("kizuna");
  StyleManager err_style(ColorMode::Auto, stderr_terminal_);

  if(args.empty()) {
    write_block(err_, parser.usage());
    return kExitUsage;
  }
  if(is_help(args.front())) {
    write_block(out_, parser.usage());
    return kExitSuccess;
  }

  ParsedCommand command;
  try {
    command = parser.parse(args);
  } catch(const KizunaError& e) {
    write_block(err_, format_error(e, err_style));
    return e.exit_code();
  }
  if(command.has_flag("help")) {
    write_block(out_, parser.verb_usage(command.verb));
    return kExitSuccess;
  }

  auto config_path = command.option("config");
  ConfigManager config_manager = config_path ? ConfigManager(*config_path) : ConfigManager();
  CLIConfig config;
  try {
    config = config_manager.resolve(command);
  } catch(const KizunaError& e) {
    write_block(err_, format_error(e, err_style));
    return e.exit_code();
  }

  init(command.has_flag("verbose"), command.has_flag("quiet"));

  CommandValidator::Context validation;
  validation.default_peer = config.default_peer;
  validation.stdin_payload = command.has_flag("batch") ||
    std::find(command.positional.begin(), command.positional.end(), "-") != command.positional.end();
  ValidatedCommand validated;
  try {
    validated = CommandValidator(validation).validate(command);
  } catch(const KizunaError& e) {
    write_block(err_, format_error(e, err_style));
    return e.exit_code();
  }
  auto context = CommandContext::create(std::move(validated));

  // Collaborators
  auto data_dir = user_data_dir();
  auto device_name = config.network.device_name.empty() ? local_host_name() : config.network.device_name;
  auto security = std::make_shared<LocalSecuritySystem>(data_dir, device_name);
  std::string peer_id;
  try {
    peer_id = security->get_or_create_identity().derive_peer_id();
  } catch(const KizunaError& e) {
    log_warn(logger_.get(), "Device identity unavailable: {}", e.what());
  }
  auto node = local_node(config, peer_id);
  auto peer_service = std::make_shared<PeerService>(node, security);
  peer_service->set_allow_remote_exec(config.exec.allow_remote);
  auto discovery = std::make_shared<LanDiscovery>(node, static_cast<unsigned short>(config.network.discovery_port));
  auto streams = std::make_shared<StreamRegistry>();
  auto clipboard_store = std::make_shared<LocalClipboard>(data_dir / "clipboard.json");

  SecurityGate::Confirm confirm;
  if(stdin_terminal_) confirm = [this](const std::string& question){ return ask(question); };
  SecurityGate gate(security, confirm);
  gate.set_require_trusted_for_send(config.transfer.require_trusted);

  // Handlers
  Runtime runtime;
  runtime.start();
  DiscoverHandler discover(runtime, discovery, gate);
  auto resolver = [&discover](const std::string& name_or_id){ return resolve_peer(discover, name_or_id); };
  TransferHandler transfer(runtime, peer_service, gate, resolver);
  transfer.set_defaults(config.transfer.compression, config.transfer.encryption);
  if(config.transfer.default_download_path) transfer.set_download_dir(*config.transfer.default_download_path);
  if(stdin_terminal_) {
    transfer.set_offer_prompt([this](const IncomingOffer& offer){
      return ask("Accept " + std::to_string(offer.file_names.size()) + " file(s), " +
                 format_bytes(offer.total_bytes) + ", from " + offer.peer_id + "?");
    });
  }
  StreamingHandler streaming(runtime, streams, gate);
  ExecHandler exec(peer_service, gate, resolver);
  PeersHandler peers(discover, gate);
  ClipboardHandler clipboard(clipboard_store, gate, resolver);
  StatusHandler status(discover, transfer, streaming, &clipboard);
  BatchOrchestrator batch(transfer);
  TransferQueue queue(data_dir / "queue", static_cast<std::size_t>(std::max(1, config.transfer.max_concurrent)));
  QueueDispatcher dispatcher(runtime, queue, transfer);
  HistoryManager history;
  InterruptSignal interrupt(runtime);

  RouterDependencies deps{config, config_manager, parser, discover, transfer, streaming, exec, peers,
                          status, batch, queue, dispatcher, &clipboard, &history};
  RouterIo io;
  io.in = &in_;
  io.out = &out_;
  io.err = &err_;
  io.stdin_terminal = stdin_terminal_;
  io.stderr_terminal = stderr_terminal_;
  io.wait_interrupt = [&interrupt](std::chrono::milliseconds wait){ return interrupt.wait_for(wait); };
  CommandRouter router(deps, io);
  router.set_tui_launcher([&]{
    TuiDependencies tui{runtime, discover, transfer, streaming, exec, peers, config_manager, config, &history};
    TuiApp app(tui, StyleManager(config.color_mode, true));
    app.run();
  });

  CommandResult result;
  try {
    history.load();
    queue.initialize();
    transfer.start();
    streaming.start();

    const auto& verb = context.command().verb;
    if(serves_peers(verb)) {
      try {
        peer_service->listen(node.service_port);
        discovery->set_service_port(peer_service->port());
        discover.start_continuous_discovery();
      } catch(const KizunaError& e) {
        log_warn(logger_.get(), "{}", e.what());
      }
    }
    result = router.execute_with_recovery(context);
  } catch(const KizunaError& e) {
    result = router.failure(e, context.elapsed());
  }

  OutputFormatter formatter(config.output_format,
                            StyleManager(config.color_mode, isatty(STDOUT_FILENO) == 1),
                            command.has_flag("pipeline"));
  write_result(result, formatter, out_, err_);

  if(records_history(command.verb)) {
    try {
      history.add_with_details(command_line(args), result.exit_code,
                               static_cast<uint64_t>(result.execution_time.count()));
    } catch(const KizunaError& e) {
      log_warn(logger_.get(), "Could not record history: {}", e.what());
    }
  }

  dispatcher.stop();
  discover.stop_continuous_discovery();
  peer_service->stop();
  transfer.stop();
  streaming.stop();
  runtime.stop();
  return result.exit_code;
}
