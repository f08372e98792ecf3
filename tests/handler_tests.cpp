#include "batch_orchestrator.hpp"
#include "clipboard_handler.hpp"
#include "command_parser.hpp"
#include "command_router.hpp"
#include "command_validator.hpp"
#include "config_manager.hpp"
#include "discover_handler.hpp"
#include "errors.hpp"
#include "exec_handler.hpp"
#include "fake_collaborators.hpp"
#include "operation_tracker.hpp"
#include "peer_service.hpp"
#include "peers_handler.hpp"
#include "protocol.hpp"
#include "queue_dispatcher.hpp"
#include "runtime.hpp"
#include "security_gate.hpp"
#include "status_handler.hpp"
#include "streaming_handler.hpp"
#include "test_runner_utils.hpp"
#include "transfer_handler.hpp"
#include "transfer_queue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using kizuna::test::FakeClipboard;
using kizuna::test::FakeDiscovery;
using kizuna::test::FakeExec;
using kizuna::test::FakeSecurity;
using kizuna::test::FakeStreaming;
using kizuna::test::FakeTransfer;
using kizuna::test::ScratchDir;
using kizuna::test::TestCase;
using kizuna::test::TestContext;
using kizuna::test::caught;
using kizuna::test::check;
using kizuna::test::contains;
using kizuna::test::read_file;
using kizuna::test::throws_kind;
using kizuna::test::wait_for_condition;
using kizuna::test::write_file;

namespace {

const std::string kLaptopId = "a1b2c3d4e5f60718";
const std::string kPhoneId = "ffee0011aabbccdd";
const std::string kLocalPeerId(32, 'a');

// Every handler wired to scripted collaborators, plus the router inputs.
struct Harness {
  ScratchDir scratch{"handlers"};
  std::shared_ptr<FakeDiscovery> discovery = std::make_shared<FakeDiscovery>();
  std::shared_ptr<FakeSecurity> security = std::make_shared<FakeSecurity>();
  std::shared_ptr<FakeTransfer> transfer_service = std::make_shared<FakeTransfer>();
  std::shared_ptr<FakeStreaming> streaming_service = std::make_shared<FakeStreaming>();
  std::shared_ptr<FakeExec> exec_service = std::make_shared<FakeExec>();
  std::shared_ptr<FakeClipboard> clipboard_service = std::make_shared<FakeClipboard>();

  Runtime runtime{2};
  SecurityGate gate{security};
  DiscoverHandler discover{runtime, discovery, gate};
  TransferHandler transfer{runtime, transfer_service, gate, resolver()};
  StreamingHandler streaming{runtime, streaming_service, gate};
  ExecHandler exec{exec_service, gate, resolver()};
  PeersHandler peers{discover, gate};
  ClipboardHandler clipboard{clipboard_service, gate, resolver()};
  StatusHandler status{discover, transfer, streaming, &clipboard};
  BatchOrchestrator batch{transfer};
  TransferQueue queue{scratch.path() / "queue", 2};
  QueueDispatcher dispatcher{runtime, queue, transfer};

  CommandParser parser{"kizuna"};
  ConfigManager config_manager{scratch.path() / "config.toml"};
  CLIConfig config;
  std::istringstream in;
  std::ostringstream out;
  std::ostringstream err;
  std::atomic<bool> interrupt{false};

  Harness() {
    discovery->records = {FakeDiscovery::record(kLaptopId, "laptop"),
                          FakeDiscovery::record(kPhoneId, "phone", "mobile", "file_transfer")};
    config.color_mode = ColorMode::Never;
    queue.initialize();
    runtime.start();
    transfer.start();
    streaming.start();
  }

  ~Harness() {
    dispatcher.stop();
    transfer.stop();
    streaming.stop();
    runtime.stop();
  }

  TransferHandler::PeerResolver resolver() {
    return [this](const std::string& name_or_id) -> std::optional<PeerInfo> {
      if(auto peer = discover.find_peer(name_or_id)) return peer;
      DiscoveryFilters filters;
      filters.timeout = std::chrono::seconds(1);
      discover.discover(filters);
      return discover.find_peer(name_or_id);
    };
  }

  void populate() {
    discover.discover(DiscoveryFilters{});
  }

  std::filesystem::path file(const std::string& name, const std::string& content = "payload") {
    auto path = scratch / name;
    write_file(path, content);
    return path;
  }

  CommandRouter router() {
    RouterDependencies deps{config, config_manager, parser, discover, transfer, streaming, exec, peers,
                            status, batch, queue, dispatcher, &clipboard, nullptr};
    RouterIo io;
    io.in = &in;
    io.out = &out;
    io.err = &err;
    io.wait_interrupt = [this](std::chrono::milliseconds wait){
      std::this_thread::sleep_for(std::min(wait, std::chrono::milliseconds(20)));
      return interrupt.load();
    };
    return CommandRouter(deps, io);
  }

  CommandContext context(const std::vector<std::string>& args) {
    CommandValidator::Context validation;
    validation.default_peer = config.default_peer;
    return CommandContext::create(CommandValidator(validation).validate(parser.parse(args)));
  }

  CommandResult run(const std::vector<std::string>& args, const std::string& stdin_text = std::string()) {
    in.clear();
    in.str(stdin_text);
    return router().execute(context(args));
  }
};

IncomingOffer offer_from(const std::string& peer_id) {
  IncomingOffer offer;
  offer.operation_id = "offer-1";
  offer.peer_id = peer_id;
  offer.file_names = {"a.txt"};
  offer.total_bytes = 7;
  return offer;
}

// ---- runtime ---------------------------------------------------------------

bool test_periodic_task_cancel(TestContext& ctx) {
  Runtime runtime{2};
  runtime.start();
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  std::atomic<int> ticks{0};
  auto task = runtime.every(std::chrono::milliseconds(5), [&]{
    ++ticks;
    if(!entered.exchange(true)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      finished = true;
    }
  });
  bool ok = check(ctx, wait_for_condition([&]{ return entered.load(); }, std::chrono::seconds(2)), "tick started");
  task->cancel();
  ok &= check(ctx, finished.load(), "cancel waits for the running tick");
  auto after = ticks.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ok &= check(ctx, ticks.load() == after && task->cancelled(), "no tick after cancel");

  std::mutex slot_mutex;
  std::shared_ptr<PeriodicTask> self_cancelling;
  std::atomic<int> self_ticks{0};
  {
    std::lock_guard<std::mutex> lock(slot_mutex);
    self_cancelling = runtime.every(std::chrono::milliseconds(5), [&]{
      ++self_ticks;
      std::lock_guard<std::mutex> inner(slot_mutex);
      self_cancelling->cancel();
    });
  }
  ok &= check(ctx, wait_for_condition([&]{ return self_ticks.load() >= 1; }, std::chrono::seconds(2)),
              "cancel from inside the callback returns");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ok &= check(ctx, self_ticks.load() == 1, "stopped itself");
  runtime.stop();
  return ok;
}

// ---- security gate ---------------------------------------------------------

bool test_gate_session(TestContext& ctx) {
  auto security = std::make_shared<FakeSecurity>();
  SecurityGate gate(security);
  auto now = std::chrono::system_clock::now();
  gate.set_clock([&now]{ return now; });

  auto denied = gate.authorize_operation(GatedOperation::Discover, kLaptopId);
  bool ok = check(ctx, !denied.allowed && contains(denied.reason, "No active session"), "session required");

  auto session = gate.authenticate();
  ok &= check(ctx, session.peer_id == kLocalPeerId, "peer id derived from identity");
  ok &= check(ctx, session.expires_at - session.started_at == SecurityGate::kSessionLifetime, "24h lifetime");
  ok &= check(ctx, gate.is_session_valid(), "valid after authenticate");

  now += std::chrono::hours(25);
  ok &= check(ctx, !gate.is_session_valid(), "expired");
  auto renewed = gate.ensure_session();
  ok &= check(ctx, renewed.session_id != session.session_id && gate.is_session_valid(), "renewed");

  gate.logout();
  ok &= check(ctx, !gate.current_session(), "logged out");
  return ok;
}

bool test_gate_policy(TestContext& ctx) {
  auto security = std::make_shared<FakeSecurity>();
  SecurityGate gate(security);
  gate.authenticate();

  bool ok = true;
  ok &= check(ctx, !gate.authorize_operation(GatedOperation::Send, kLaptopId).allowed, "untrusted send denied");
  ok &= check(ctx, !gate.authorize_operation(GatedOperation::Exec, kLaptopId).allowed, "untrusted exec denied");
  ok &= check(ctx, !gate.authorize_operation(GatedOperation::StreamViewerAdd, kLaptopId).allowed,
              "untrusted viewer denied");
  ok &= check(ctx, gate.authorize_operation(GatedOperation::Receive, kLaptopId).allowed, "receive allowed");
  ok &= check(ctx, gate.authorize_operation(GatedOperation::Clipboard, kLaptopId).allowed, "clipboard allowed");

  gate.set_require_trusted_for_send(false);
  ok &= check(ctx, gate.authorize_operation(GatedOperation::Send, kLaptopId).allowed, "send policy relaxed");

  security->trusted.insert(kLaptopId);
  ok &= check(ctx, gate.authorize_operation(GatedOperation::Exec, kLaptopId).allowed, "trusted exec");
  ok &= check(ctx, gate.trust_status(kLaptopId) == TrustStatus::Trusted, "trusted status");

  security->blocked.insert(kPhoneId);
  auto blocked = gate.authorize_operation(GatedOperation::Receive, kPhoneId);
  ok &= check(ctx, !blocked.allowed && contains(blocked.reason, "blocked"), "blocked peer denied");

  gate.set_private_mode(true);
  ok &= check(ctx, gate.is_private_mode(), "private mode on");
  ok &= check(ctx, !gate.authorize_operation(GatedOperation::Discover, "cafe0000").allowed,
              "private mode denies strangers");
  ok &= check(ctx, gate.authorize_operation(GatedOperation::Discover, kLaptopId).allowed,
              "private mode admits trusted");

  auto error = caught([&]{ gate.require_authorized(GatedOperation::Exec, "cafe0000"); });
  ok &= check(ctx, error && error->kind() == ErrorKind::Integration &&
                   error->domain() == IntegrationDomain::Security, "require_authorized throws");
  return ok;
}

bool test_gate_trust_changes(TestContext& ctx) {
  auto security = std::make_shared<FakeSecurity>();
  bool answer = false;
  std::vector<std::string> questions;
  SecurityGate gate(security, [&](const std::string& question){
    questions.push_back(question);
    return answer;
  });

  bool ok = check(ctx, throws_kind(ErrorKind::Integration, [&]{ gate.add_trusted_peer(kLaptopId, "laptop"); }),
                  "declined confirmation");
  ok &= check(ctx, security->trusted.empty() && questions.size() == 1, "nothing trusted");
  ok &= check(ctx, contains(questions.front(), "laptop"), "question names the peer");

  gate.add_trusted_peer(kLaptopId, "laptop", true);
  ok &= check(ctx, security->trusted.count(kLaptopId) == 1 && questions.size() == 1, "assume yes skips prompt");

  answer = true;
  gate.block_peer(kLaptopId);
  ok &= check(ctx, gate.trust_status(kLaptopId) == TrustStatus::Blocked, "blocked");

  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ gate.remove_trusted_peer("cafe0000", true); }),
              "unknown peer removal");

  ok &= check(ctx, gate.generate_pairing_code().code == "123456", "pairing code");
  ok &= check(ctx, !gate.verify_and_trust_peer("000000", kPhoneId, "phone"), "wrong code");
  ok &= check(ctx, gate.verify_and_trust_peer("123456", kPhoneId, "phone"), "right code");
  ok &= check(ctx, gate.is_peer_trusted(kPhoneId), "verified peer trusted");
  ok &= check(ctx, gate.generate_invite_code(kPhoneId) == "invite-" + kPhoneId, "invite");
  return ok;
}

// ---- operation tracker -----------------------------------------------------

bool test_operation_tracker(TestContext& ctx) {
  OperationTracker tracker;
  auto updates = tracker.subscribe();

  OperationStatus transfer;
  transfer.operation_id = "op-1";
  transfer.kind = OperationKind::FileTransfer;
  ProgressInfo progress;
  progress.current = 10;
  progress.total = 100;
  transfer.progress = progress;
  tracker.insert(transfer);

  bool ok = check(ctx, !tracker.update("missing", [](OperationStatus&){}), "unknown id dropped");
  ok &= check(ctx, tracker.set_state("op-1", OperationState::in_progress()), "in progress");
  ok &= check(ctx, !tracker.set_state("op-1", OperationState::starting()) ||
                   tracker.get("op-1")->state.kind == OperationState::Kind::InProgress,
              "no regression to starting");

  tracker.update("op-1", [](OperationStatus& status){ status.progress->current = 5; });
  ok &= check(ctx, tracker.get("op-1")->progress->current == 10, "progress is monotonic");
  tracker.update("op-1", [](OperationStatus& status){ status.progress->current = 60; });
  ok &= check(ctx, tracker.get("op-1")->progress->current == 60, "progress advances");

  OperationStatus stream;
  stream.operation_id = "op-2";
  stream.kind = OperationKind::CameraStream;
  stream.state = OperationState::in_progress();
  stream.progress = ProgressInfo{};
  stream.progress->current = 3;
  tracker.insert(stream);
  tracker.update("op-2", [](OperationStatus& status){ status.progress->current = 2; });
  ok &= check(ctx, tracker.get("op-2")->progress->current == 2, "viewer count may shrink");

  ok &= check(ctx, !tracker.wait_for_terminal("op-1", std::chrono::milliseconds(20)), "not terminal yet");
  std::thread finisher([&]{
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    tracker.set_state("op-1", OperationState::completed());
  });
  ok &= check(ctx, tracker.wait_for_terminal("op-1", std::chrono::seconds(2)), "woken on completion");
  finisher.join();

  ok &= check(ctx, !tracker.set_state("op-1", OperationState::failed("late")), "terminal is final");
  ok &= check(ctx, tracker.get("op-1")->state.kind == OperationState::Kind::Completed, "still completed");
  ok &= check(ctx, tracker.active_count() == 1 && tracker.count(OperationState::Kind::Completed) == 1, "counts");
  ok &= check(ctx, tracker.snapshot().size() == 2, "snapshot");
  ok &= check(ctx, updates->size() >= 5, "updates published");
  ok &= check(ctx, tracker.remove("op-2") && !tracker.contains("op-2"), "removed");
  return ok;
}

// ---- discover / peers ------------------------------------------------------

bool test_discover_filters(TestContext& ctx) {
  Harness h;
  h.security->trusted.insert(kLaptopId);

  DiscoveryFilters mobile;
  mobile.device_type = "MOBILE";
  auto result = h.discover.discover(mobile);
  bool ok = check(ctx, result.peers.size() == 1 && result.peers.front().id == kPhoneId, "type filter");
  ok &= check(ctx, h.discover.get_cached_peers().size() == 2, "cache keeps everything");
  ok &= check(ctx, h.discovery->initialize_calls == 1, "initialized once");

  auto laptop = h.discover.find_peer("LAPTOP");
  ok &= check(ctx, laptop && laptop->id == kLaptopId, "find by name");
  ok &= check(ctx, laptop->trust_status == TrustStatus::Trusted, "trust looked up");
  ok &= check(ctx, laptop->connection_status == ConnectionStatus::Connected, "reachable");
  ok &= check(ctx, laptop->capabilities == std::vector<std::string>{"file_transfer", "exec"}, "capabilities");
  ok &= check(ctx, h.discover.find_peer("ffee")->id == kPhoneId, "find by id prefix");
  ok &= check(ctx, !h.discover.find_peer("nobody"), "unknown peer");

  h.discovery->records.push_back(FakeDiscovery::record("ffee9999", "tablet", "tablet"));
  h.discover.discover(DiscoveryFilters{});
  ok &= check(ctx, !h.discover.find_peer("ffee"), "ambiguous prefix");

  h.discovery->fail_queries = 1;
  auto error = caught([&]{ h.discover.discover(DiscoveryFilters{}); });
  ok &= check(ctx, error && error->domain() == IntegrationDomain::Discovery && error->is_transient(),
              "discovery failure is transient");
  return ok;
}

bool test_discover_empty(TestContext& ctx) {
  Harness h;
  h.discovery->records.clear();
  auto result = h.discover.discover(DiscoveryFilters{});
  bool ok = check(ctx, result.peers.empty(), "no peers");
  ok &= check(ctx, result.discovery_time.count() >= 0, "elapsed time recorded");
  ok &= check(ctx, h.discover.get_cached_peers().empty(), "cache empty");

  auto routed = h.run({"discover"});
  ok &= check(ctx, routed.success && routed.exit_code == kExitSuccess, "empty discovery succeeds");
  return ok;
}

bool test_discover_events(TestContext& ctx) {
  Harness h;
  ctx.logs.attach_components({"discover"});
  auto notifications = h.discover.subscribe();

  h.discover.start_continuous_discovery();
  bool ok = check(ctx, h.discover.continuous(), "continuous");
  ok &= check(ctx, ctx.logs.wait_for_substring("Continuous discovery started", std::chrono::seconds(1)),
              "start logged");
  ok &= check(ctx, notifications->size() == 2, "cached peers announced");
  notifications->drain();

  DiscoveryEvent found;
  found.type = DiscoveryEvent::Type::PeerDiscovered;
  found.record = FakeDiscovery::record("0badcafe", "desk");
  h.discovery->channel->send(found);
  auto discovered = notifications->receive_for(std::chrono::seconds(2));
  ok &= check(ctx, discovered && discovered->type == PeerNotification::Type::Discovered &&
                   discovered->peer.name == "desk", "discovered event");

  DiscoveryEvent lost;
  lost.type = DiscoveryEvent::Type::PeerLost;
  lost.peer_id = kLaptopId;
  h.discovery->channel->send(lost);
  auto gone = notifications->receive_for(std::chrono::seconds(2));
  ok &= check(ctx, gone && gone->type == PeerNotification::Type::Lost, "lost event");
  ok &= check(ctx, h.discover.find_peer(kLaptopId)->connection_status == ConnectionStatus::Disconnected,
              "lost peer disconnected");

  h.discover.stop_continuous_discovery();
  ok &= check(ctx, !h.discover.continuous() && h.discovery->shut_down, "stopped");
  return ok;
}

bool test_peers_handler(TestContext& ctx) {
  Harness h;
  h.populate();

  h.peers.trust("laptop", "", true);
  bool ok = check(ctx, h.security->trusted.count(kLaptopId) == 1, "trusted by name");
  ok &= check(ctx, h.discover.find_peer(kLaptopId)->trust_status == TrustStatus::Trusted, "cache refreshed");
  ok &= check(ctx, h.peers.trusted_peers().size() == 1, "trusted list");

  h.peers.untrust(kLaptopId, true);
  ok &= check(ctx, h.security->trusted.empty(), "untrusted");
  h.peers.block("phone", true);
  ok &= check(ctx, h.discover.find_peer(kPhoneId)->trust_status == TrustStatus::Blocked, "blocked");

  ok &= check(ctx, h.peers.resolve_peer_id("  CAFE0000 ") == "cafe0000", "opaque ids normalized");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ h.peers.get_peer_info("nobody"); }), "unknown info");
  ok &= check(ctx, h.peers.get_peers().size() == 2, "peer list");
  ok &= check(ctx, h.peers.invite("laptop") == "invite-" + kLaptopId, "invite");

  ok &= check(ctx, h.peers.pair().code == "123456", "pair");
  ok &= check(ctx, h.peers.verify("123456", "laptop", "work laptop"), "verify");
  ok &= check(ctx, h.discover.find_peer(kLaptopId)->trust_status == TrustStatus::Trusted, "verified trusted");

  h.peers.set_private_mode(true);
  ok &= check(ctx, h.peers.private_mode(), "private mode");
  return ok;
}

// ---- transfer --------------------------------------------------------------

bool test_transfer_send(TestContext& ctx) {
  Harness h;
  h.populate();
  auto file = h.file("notes.txt", "0123456789");

  SendRequest missing;
  missing.files = {h.scratch / "absent.txt"};
  missing.peer = "laptop";
  bool ok = check(ctx, throws_kind(ErrorKind::Io, [&]{ h.transfer.send(missing); }), "missing file");

  SendRequest request;
  request.files = {file};
  request.peer = "nobody";
  auto unknown = caught([&]{ h.transfer.send(request); });
  ok &= check(ctx, unknown && unknown->domain() == IntegrationDomain::Transfer, "unknown peer");

  request.peer = "laptop";
  auto untrusted = caught([&]{ h.transfer.send(request); });
  ok &= check(ctx, untrusted && untrusted->domain() == IntegrationDomain::Security, "untrusted peer");
  ok &= check(ctx, h.transfer_service->send_count() == 0, "nothing sent");

  h.security->trusted.insert(kLaptopId);
  request.compression = false;
  auto handle = h.transfer.send(request);
  ok &= check(ctx, handle.status.state.kind == OperationState::Kind::Starting, "starting");
  ok &= check(ctx, handle.status.progress && handle.status.progress->total == uint64_t{10}, "total bytes");
  auto sent = h.transfer_service->last_send();
  ok &= check(ctx, sent && sent->peer_id == kLaptopId && sent->peer_address == "127.0.0.1:47801", "address");
  ok &= check(ctx, sent && !sent->compression && sent->encryption, "compression override, encryption default");
  ok &= check(ctx, sent && sent->operation_id == handle.operation_id, "same operation id");
  ok &= check(ctx, h.gate.is_session_valid(), "session started on demand");

  h.security->trusted.insert(kPhoneId);
  h.transfer_service->rejected_files.insert("notes.txt");
  request.peer = "phone";
  auto refused = caught([&]{ h.transfer.send(request); });
  ok &= check(ctx, refused && refused->domain() == IntegrationDomain::Transfer, "collaborator refusal");
  auto operations = h.transfer.get_all_operations();
  ok &= check(ctx, operations.size() == 2 && operations.back().state.kind == OperationState::Kind::Failed,
              "refused operation recorded as failed");
  return ok;
}

bool test_transfer_events(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);
  SendRequest request;
  request.files = {h.file("a.bin", std::string(4096, 'x'))};
  request.peer = kLaptopId;
  auto id = h.transfer.send(request).operation_id;

  h.transfer.apply_event({TransferEvent::Type::Progress, id, 1024, 4096, 1024.0, ""});
  auto status = h.transfer.get_operation_status(id);
  bool ok = check(ctx, status->state.kind == OperationState::Kind::InProgress, "in progress");
  ok &= check(ctx, status->progress->current == 1024 && status->progress->eta == std::chrono::seconds(3), "eta");
  ok &= check(ctx, status->estimated_completion.has_value(), "completion estimate");

  h.transfer.apply_event({TransferEvent::Type::Progress, id, 512, 4096, 1024.0, ""});
  ok &= check(ctx, h.transfer.get_operation_status(id)->progress->current == 1024, "no going back");

  h.transfer.apply_event({TransferEvent::Type::Progress, "other", 1, 2, 1.0, ""});
  ok &= check(ctx, !h.transfer.get_operation_status("other"), "unknown id ignored");

  // Events from the collaborator's channel arrive through the runtime.
  h.transfer_service->emit(TransferEvent::Type::Completed, id);
  ok &= check(ctx, h.transfer.wait_for_terminal(id, std::chrono::seconds(2)), "pumped completion");
  status = h.transfer.get_operation_status(id);
  ok &= check(ctx, status->state.kind == OperationState::Kind::Completed, "completed");
  ok &= check(ctx, status->progress->current == 4096 && !status->progress->eta, "filled to total");

  h.transfer.apply_event({TransferEvent::Type::Failed, id, 0, 0, 0.0, "late failure"});
  ok &= check(ctx, h.transfer.get_operation_status(id)->state.kind == OperationState::Kind::Completed,
              "terminal state is sticky");
  return ok;
}

bool test_transfer_controls(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);
  SendRequest request;
  request.files = {h.file("a.txt")};
  request.peer = "laptop";
  auto id = h.transfer.send(request).operation_id;

  bool ok = check(ctx, throws_kind(ErrorKind::Integration, [&]{ h.transfer.cancel_operation("missing"); }),
                  "unknown cancel");
  h.transfer.pause_operation(id);
  ok &= check(ctx, h.transfer_service->paused == std::vector<std::string>{id}, "paused");
  ok &= check(ctx, h.transfer.get_operation_status(id)->progress->message == std::string("Paused"), "paused note");
  h.transfer.resume_operation(id);
  ok &= check(ctx, h.transfer_service->resumed == std::vector<std::string>{id}, "resumed");
  h.transfer.set_bandwidth_limit(id, uint64_t{2048});
  ok &= check(ctx, h.transfer_service->limits[id] == uint64_t{2048}, "limit");

  h.transfer.cancel_operation(id);
  ok &= check(ctx, h.transfer_service->cancelled == std::vector<std::string>{id}, "cancel forwarded");
  ok &= check(ctx, h.transfer.get_operation_status(id)->state.kind == OperationState::Kind::Cancelled, "cancelled");
  h.transfer.cancel_operation(id);
  ok &= check(ctx, h.transfer_service->cancelled.size() == 1, "second cancel is a no-op");
  return ok;
}

bool test_transfer_receive(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);
  h.security->blocked.insert(kPhoneId);

  ReceiveRequest request;
  request.output_dir = h.scratch / "inbox";
  request.auto_accept = true;
  auto handle = h.transfer.receive(request);
  bool ok = check(ctx, std::filesystem::is_directory(h.scratch / "inbox"), "output dir created");
  ok &= check(ctx, handle.status.progress->message == std::string("Waiting for incoming transfer..."), "waiting");
  ok &= check(ctx, h.transfer_service->receives.size() == 1, "collaborator armed");

  auto accept = h.transfer_service->receives.back().accept;
  ok &= check(ctx, accept(offer_from(kLaptopId)), "trusted auto-accepted");
  ok &= check(ctx, !accept(offer_from("cafe0000")), "untrusted needs a prompt");
  ok &= check(ctx, !accept(offer_from(kPhoneId)), "blocked refused");

  std::vector<std::string> asked;
  h.transfer.set_offer_prompt([&](const IncomingOffer& offer){
    asked.push_back(offer.peer_id);
    return true;
  });
  ok &= check(ctx, accept(offer_from("cafe0000")), "prompt accepts");
  ok &= check(ctx, !accept(offer_from(kPhoneId)) && asked.size() == 1, "blocked never prompts");

  ReceiveRequest only_laptop;
  only_laptop.output_dir = h.scratch / "inbox";
  only_laptop.from_peer = "laptop";
  h.transfer.receive(only_laptop);
  auto filtered = h.transfer_service->receives.back().accept;
  ok &= check(ctx, !filtered(offer_from("cafe0000")), "other sender rejected");
  ok &= check(ctx, filtered(offer_from(kLaptopId)), "named sender resolved");

  h.transfer.stop_receiving();
  ok &= check(ctx, h.transfer_service->stop_receiving_calls == 1, "stopped");
  return ok;
}

// ---- streaming -------------------------------------------------------------

bool test_streaming_handler(TestContext& ctx) {
  Harness h;
  StreamRequest request;
  request.quality = StreamQuality::High;
  request.record = true;
  auto result = h.streaming.handle_stream(request);

  bool ok = check(ctx, result.operation_id == "stream-1", "session id is operation id");
  ok &= check(ctx, result.stream_url == std::string("kizuna://stream/stream-1"), "url");
  ok &= check(ctx, result.recording == std::filesystem::path("recording.mp4"), "default recording");
  ok &= check(ctx, result.status.kind == OperationKind::CameraStream, "kind");
  ok &= check(ctx, result.status.state.kind == OperationState::Kind::InProgress, "active maps to in progress");
  ok &= check(ctx, h.streaming_service->sessions["stream-1"].config.camera == "default", "default camera");

  h.streaming.apply_event({StreamEvent::Type::ViewerConnected, "stream-1", StreamSessionState::Active, "v1", 0.0, ""});
  h.streaming.apply_event({StreamEvent::Type::ViewerConnected, "stream-1", StreamSessionState::Active, "v2", 0.0, ""});
  h.streaming.apply_event({StreamEvent::Type::ViewerDisconnected, "stream-1", StreamSessionState::Active, "v1", 0.0, ""});
  auto status = h.streaming.get_operation_status("stream-1");
  ok &= check(ctx, status->progress->current == 1, "viewer count");
  ok &= check(ctx, status->progress->message == std::string("1 viewers connected"), "viewer message");

  h.streaming.apply_event({StreamEvent::Type::StatsUpdated, "stream-1", StreamSessionState::Active, "", 2500.0, ""});
  ok &= check(ctx, h.streaming.get_operation_status("stream-1")->progress->rate == 2500.0, "bitrate");

  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ h.streaming.add_viewer("stream-1", kLaptopId); }),
              "untrusted viewer");
  h.security->trusted.insert(kLaptopId);
  ok &= check(ctx, h.streaming.add_viewer("stream-1", kLaptopId) == "viewer-" + kLaptopId, "viewer added");
  auto unknown = caught([&]{ h.streaming.stop_stream("stream-9"); });
  ok &= check(ctx, unknown && unknown->domain() == IntegrationDomain::Streaming, "unknown stream");

  h.streaming.pause_stream("stream-1");
  ok &= check(ctx, h.streaming_service->sessions["stream-1"].state == StreamSessionState::Paused, "paused");
  h.streaming.resume_stream("stream-1");
  h.streaming.stop_stream("stream-1");
  ok &= check(ctx, h.streaming_service->stopped == std::vector<std::string>{"stream-1"}, "stop forwarded");

  h.streaming_service->channel->send({StreamEvent::Type::SessionStopped, "stream-1", StreamSessionState::Stopped,
                                      "", 0.0, ""});
  ok &= check(ctx, h.streaming.wait_for_terminal("stream-1", std::chrono::seconds(2)), "pumped stop");
  ok &= check(ctx, h.streaming.get_operation_status("stream-1")->state.kind == OperationState::Kind::Completed,
              "completed");
  ok &= check(ctx, h.streaming.get_active_streams().empty(), "no active streams");
  ok &= check(ctx, StreamingHandler::map_state(StreamSessionState::Error).kind == OperationState::Kind::Failed,
              "error maps to failed");
  return ok;
}

// ---- exec ------------------------------------------------------------------

bool test_exec_handler(TestContext& ctx) {
  Harness h;
  h.populate();

  bool ok = check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{ h.exec.handle_exec({"  ", "laptop", {}}); }),
                  "empty command");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue,
                               [&]{ h.exec.handle_exec({"ls", "laptop", std::chrono::seconds(0)}); }),
              "zero timeout");
  auto unknown = caught([&]{ h.exec.handle_exec({"ls", "nobody", {}}); });
  ok &= check(ctx, unknown && unknown->domain() == IntegrationDomain::Security, "unknown peer");
  auto untrusted = caught([&]{ h.exec.handle_exec({"ls", "laptop", {}}); });
  ok &= check(ctx, untrusted && contains(untrusted->what(), "untrusted peer 'laptop'"), "untrusted refused");
  ok &= check(ctx, h.exec_service->requests.empty(), "nothing executed");

  h.security->trusted.insert(kLaptopId);
  auto result = h.exec.handle_exec({"echo hello", "laptop", std::chrono::seconds(5)});
  ok &= check(ctx, result.output == "hello\n" && result.exit_code == 0, "output");
  ok &= check(ctx, h.exec_service->requests.back().timeout == std::chrono::milliseconds(5000), "timeout passed");
  ok &= check(ctx, h.exec_service->requests.back().peer_address == "127.0.0.1:47801", "address passed");

  h.exec_service->fail = true;
  ok &= check(ctx, throws_kind(ErrorKind::Execution, [&]{ h.exec.handle_exec({"ls", "laptop", {}}); }),
              "execution failure");
  auto operations = h.exec.get_all_operations();
  ok &= check(ctx, operations.size() == 2, "both runs tracked");
  ok &= check(ctx, std::count_if(operations.begin(), operations.end(), [](const OperationStatus& op){
                     return op.state.kind == OperationState::Kind::Failed;
                   }) == 1, "one failed");
  return ok;
}

// ---- clipboard / status ----------------------------------------------------

bool test_clipboard_handler(TestContext& ctx) {
  Harness h;
  h.populate();

  auto toggled = h.clipboard.share(std::nullopt, std::nullopt);
  bool ok = check(ctx, toggled.sharing_enabled == true && h.clipboard_service->sharing, "toggled on");
  ok &= check(ctx, toggled.message == "Clipboard sharing enabled", "enabled message");
  h.clipboard.share(false, std::nullopt);
  ok &= check(ctx, !h.clipboard_service->sharing, "explicit disable");

  auto device = h.clipboard.share(true, std::string("laptop"));
  ok &= check(ctx, h.clipboard_service->devices == std::vector<std::string>{kLaptopId}, "device enabled");
  ok &= check(ctx, contains(device.message, kLaptopId), "device message");
  ok &= check(ctx, !h.clipboard_service->sharing, "global state unchanged");

  h.security->blocked.insert(kPhoneId);
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ h.clipboard.share(true, std::string("phone")); }),
              "blocked device refused");

  h.clipboard.set_content("first");
  h.clipboard.set_content("second snippet");
  ok &= check(ctx, h.clipboard.get_content().message == "second snippet", "content");
  auto history = h.clipboard.history(1);
  ok &= check(ctx, history.entries.size() == 1 && history.entries.front().content == "second snippet", "newest first");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{ h.clipboard.history(0); }), "zero limit");
  ok &= check(ctx, h.clipboard.search_history("SNIPPET").entries.size() == 1, "search");
  h.clipboard.restore("entry-1");
  ok &= check(ctx, h.clipboard_service->content == "first", "restored");
  auto missing = caught([&]{ h.clipboard.restore("entry-9"); });
  ok &= check(ctx, missing && missing->domain() == IntegrationDomain::Clipboard, "unknown entry");

  auto status = h.clipboard.status();
  ok &= check(ctx, contains(status.message, "Sharing: OFF") && contains(status.message, kLaptopId) &&
                   contains(status.message, "History entries: 2"), "status text");
  h.clipboard.clear_history();
  ok &= check(ctx, h.clipboard.get_status().history_size == 0, "cleared");
  return ok;
}

bool test_status_handler(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);
  h.clipboard_service->sharing = true;

  SendRequest request;
  request.files = {h.file("a.txt")};
  request.peer = "laptop";
  auto id = h.transfer.send(request).operation_id;
  h.transfer.apply_event({TransferEvent::Type::Started, id, 0, 7, 0.0, ""});
  h.streaming.handle_stream(StreamRequest{});

  auto status = h.status.get_system_status();
  bool ok = check(ctx, status.version == kizuna_version(), "version");
  ok &= check(ctx, status.connected_peers == 2, "connected peers");
  ok &= check(ctx, status.active_transfers == 1, "active transfers");
  ok &= check(ctx, status.active_streams == 1, "active streams");
  ok &= check(ctx, status.clipboard_sync_enabled && status.discovery_enabled, "flags");

  nlohmann::json j = status;
  ok &= check(ctx, j.at("connected_peers") == 2 && j.contains("uptime_seconds"), "json");
  return ok;
}

// ---- batch -----------------------------------------------------------------

bool test_batch_transfers(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted = {kLaptopId, kPhoneId};
  h.transfer_service->auto_complete = true;

  BatchRequest fanout;
  fanout.files = {h.file("a.txt"), h.file("b.txt")};
  fanout.peers = {"laptop", "phone"};
  auto result = h.batch.execute_batch_transfer(fanout);
  bool ok = check(ctx, result.total_operations == 4 && result.successful == 4, "files x peers");
  ok &= check(ctx, h.transfer_service->send_count() == 4, "one send per item");
  auto progress = h.batch.get_batch_progress(result.batch_id);
  ok &= check(ctx, progress.overall_progress == 100.0 && progress.in_progress_operations == 0, "progress");

  h.transfer_service->failing_files.insert("bad.txt");
  BatchRequest mixed;
  mixed.files = {h.file("good.txt"), h.file("bad.txt")};
  mixed.peers = {"laptop", "nobody"};
  mixed.parallel = true;
  mixed.max_concurrent = 2;
  result = h.batch.execute_batch_transfer(mixed);
  ok &= check(ctx, result.total_operations == 4, "four items");
  ok &= check(ctx, result.successful == 1 && result.failed == 3, "one success");
  auto failed_unknown = std::count_if(result.operations.begin(), result.operations.end(),
    [](const BatchOperationItem& item){
      return item.peer == "nobody" && item.error && contains(*item.error, "Unknown peer");
    });
  ok &= check(ctx, failed_unknown == 2, "unknown peer items failed");

  nlohmann::json j = result;
  ok &= check(ctx, j.at("operations").size() == 4 && j.at("failed") == 3, "json summary");

  ok &= check(ctx, BatchOrchestrator::effective_concurrency(BatchRequest{}) == 1, "sequential");
  BatchRequest parallel;
  parallel.parallel = true;
  ok &= check(ctx, BatchOrchestrator::effective_concurrency(parallel) == BatchOrchestrator::kDefaultConcurrency,
              "default concurrency");
  auto missing = caught([&]{ h.batch.cancel_batch("nope"); });
  ok &= check(ctx, missing && missing->domain() == IntegrationDomain::BatchOperation, "unknown batch");
  return ok;
}

bool test_batch_cancel(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);

  BatchRequest request;
  request.files = {h.file("a.txt"), h.file("b.txt")};
  request.peers = {"laptop"};
  auto id = h.batch.submit(request);

  bool ok = check(ctx, wait_for_condition([&]{ return h.transfer_service->send_count() == 1; },
                                          std::chrono::seconds(2)), "first item started");
  ok &= check(ctx, !h.batch.wait(id, std::chrono::milliseconds(50)), "still running");
  h.batch.cancel_batch(id);
  auto result = h.batch.wait(id, std::chrono::seconds(3));
  ok &= check(ctx, result.has_value(), "finished after cancel");
  ok &= check(ctx, result && result->cancelled == 2 && result->successful == 0, "both cancelled");
  ok &= check(ctx, h.transfer_service->cancelled.size() == 1, "running transfer cancelled");
  ok &= check(ctx, h.transfer_service->send_count() == 1, "second item never started");
  return ok;
}

bool test_batch_concurrency_limit(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);

  BatchRequest request;
  for(int i = 0; i < 5; ++i) request.files.push_back(h.file("part" + std::to_string(i) + ".bin"));
  request.peers = {"laptop"};
  request.parallel = true;
  request.max_concurrent = 2;
  auto id = h.batch.submit(request);

  bool ok = check(ctx, wait_for_condition([&]{ return h.transfer_service->in_flight() == 2; },
                                          std::chrono::seconds(2)), "two sends in flight");
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  ok &= check(ctx, h.transfer_service->send_count() == 2, "third send held back");

  std::optional<BatchResult> result;
  for(int round = 0; round < 100 && !result; ++round) {
    h.transfer_service->complete_next();
    result = h.batch.wait(id, std::chrono::milliseconds(100));
  }
  ok &= check(ctx, result && result->successful == 5, "all items completed");
  ok &= check(ctx, h.transfer_service->peak_in_flight() <= 2, "never more than max_concurrent at once");
  ok &= check(ctx, h.transfer_service->send_count() == 5, "every item sent");
  return ok;
}

bool test_batch_empty(TestContext& ctx) {
  Harness h;
  h.populate();

  BatchRequest no_files;
  no_files.peers = {"laptop"};
  auto result = h.batch.execute_batch_transfer(no_files);
  bool ok = check(ctx, result.total_operations == 0 && result.successful == 0 && result.failed == 0,
                  "nothing to do");
  auto status = h.batch.get_batch_status(result.batch_id);
  ok &= check(ctx, status.completed_at && *status.completed_at == status.started_at, "completed when started");
  ok &= check(ctx, h.batch.get_batch_progress(result.batch_id).overall_progress == 100.0, "progress full");

  BatchRequest no_peers;
  no_peers.files = {h.file("a.txt")};
  auto id = h.batch.submit(no_peers);
  auto waited = h.batch.wait(id, std::chrono::milliseconds(0));
  ok &= check(ctx, waited && waited->total_operations == 0, "finished without waiting");
  ok &= check(ctx, h.transfer_service->send_count() == 0, "nothing sent");
  return ok;
}

bool test_batch_housekeeping(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted.insert(kLaptopId);
  h.transfer_service->auto_complete = true;
  BatchOrchestrator batch(h.transfer, std::chrono::milliseconds(0));

  BatchRequest request;
  request.files = {h.file("a.txt")};
  request.peers = {"laptop"};
  std::vector<std::string> ids;
  for(int i = 0; i < 3; ++i) {
    ids.push_back(batch.submit(request));
    batch.wait(ids.back(), std::chrono::seconds(3));
  }
  bool ok = check(ctx, batch.tracked_batches() <= 2, "finished batches dropped on submit");
  ok &= check(ctx, batch.background_threads() == 1, "finished workers joined");
  auto gone = caught([&]{ batch.get_batch_status(ids.front()); });
  ok &= check(ctx, gone && gone->domain() == IntegrationDomain::BatchOperation, "expired batch forgotten");
  ok &= check(ctx, batch.wait(ids.back(), std::chrono::seconds(1)).has_value(), "latest batch kept");

  auto kept = h.batch.execute_batch_transfer(request);
  h.batch.execute_batch_transfer(request);
  ok &= check(ctx, h.batch.get_batch_status(kept.batch_id).batch_id == kept.batch_id,
              "default retention keeps recent batches");
  return ok;
}

// ---- router ----------------------------------------------------------------

bool test_router_peers(TestContext& ctx) {
  Harness h;
  h.populate();

  auto result = h.run({"peers", "--trust", "laptop", "--yes"});
  bool ok = check(ctx, result.success && result.exit_code == kExitSuccess, "trust succeeded");
  ok &= check(ctx, contains(result.output.text, "Peer laptop trusted"), "trust message");
  ok &= check(ctx, h.security->trusted.count(kLaptopId) == 1, "trusted");

  result = h.run({"peers", "--filter", "mob"});
  ok &= check(ctx, result.output.type == CommandOutput::Type::Table && result.output.table.rows.size() == 1,
              "filtered table");

  result = h.run({"peers", "--verify", "999999", "--peer", "phone"});
  ok &= check(ctx, !result.success && result.exit_code == kExitIntegration, "bad pairing code");
  ok &= check(ctx, contains(result.output.text, "Pairing code rejected"), "pairing message");

  result = h.run({"peers", "--private", "maybe"});
  ok &= check(ctx, result.exit_code == kExitUsage, "bad private value");
  return ok;
}

bool test_router_exec(TestContext& ctx) {
  Harness h;
  h.populate();

  auto result = h.run({"exec", "--peer", "laptop", "ls"});
  bool ok = check(ctx, !result.success && result.exit_code == kExitIntegration, "untrusted exec fails");
  ok &= check(ctx, contains(result.output.text, "untrusted"), "reason shown");

  h.security->trusted.insert(kLaptopId);
  result = h.run({"exec", "--peer", "laptop", "echo", "hello"});
  ok &= check(ctx, result.success && result.output.text == "hello", "output without trailing newline");
  ok &= check(ctx, h.exec_service->requests.back().command == "echo hello", "command joined");

  h.exec_service->outcome = {"boom\n", 3};
  result = h.run({"exec", "--peer", "laptop", "false"});
  ok &= check(ctx, result.success && contains(result.output.text, "exited with code 3"), "exit code reported");

  h.exec_service->outcome = {"ok\n", 0};
  h.run({"exec", "--peer", "laptop", "--interactive"}, "uptime\n\nwhoami\nexit\nnever\n");
  ok &= check(ctx, h.exec_service->requests.size() == 4, "interactive commands until exit");
  ok &= check(ctx, contains(h.out.str(), "ok\nok\n"), "interactive output");
  return ok;
}

bool test_router_send(TestContext& ctx) {
  Harness h;
  h.populate();
  h.transfer_service->auto_complete = true;
  auto file = h.file("report.txt", "0123456789").string();

  auto result = h.run({"send", file, "--peer", "laptop"});
  bool ok = check(ctx, !result.success && result.exit_code == kExitIntegration, "untrusted send");

  h.security->trusted = {kLaptopId, kPhoneId};
  result = h.run({"send", file, "--peer", "laptop"});
  ok &= check(ctx, result.success && contains(result.output.text, "Sent 1 file"), "single send");

  result = h.run({"send", file, "--peer", "laptop", "--no-wait"});
  ok &= check(ctx, result.success && contains(result.output.text, "started"), "no wait");

  result = h.run({"send", file, "--peer", "laptop,phone"});
  ok &= check(ctx, result.success && result.output.type == CommandOutput::Type::Table, "fan-out batch");
  ok &= check(ctx, result.output.table.rows.size() == 2, "one row per peer");

  h.transfer_service->failing_files.insert("bad.txt");
  auto bad = h.file("bad.txt").string();
  result = h.run({"send", file, bad, "--peer", "laptop", "--parallel"});
  ok &= check(ctx, !result.success && result.exit_code == kExitIntegration, "partial batch failure");

  auto batch = nlohmann::json{{"files", {file}}, {"peers", {"phone"}}}.dump();
  result = h.run({"send", "--batch"}, batch);
  ok &= check(ctx, result.success, "batch from stdin");

  h.config.output_format = OutputFormat::Json;
  result = h.run({"send", file, "--peer", "laptop"});
  ok &= check(ctx, result.output.type == CommandOutput::Type::Json &&
                   result.output.json.at("state") == "Completed", "json status");
  return ok;
}

bool test_router_partial_batch_output(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted = {kLaptopId, kPhoneId};
  h.transfer_service->auto_complete = true;
  h.transfer_service->failing_files.insert("bad.txt");
  auto batch = nlohmann::json{{"files", {h.file("good.txt").string(), h.file("bad.txt").string()}},
                              {"peers", {"laptop"}}}.dump();

  auto result = h.run({"send", "--batch"}, batch);
  bool ok = check(ctx, !result.success && result.exit_code == kExitIntegration, "partial failure");
  ok &= check(ctx, result.output.type == CommandOutput::Type::Table && result.output.table.rows.size() == 2,
              "table kept");
  ok &= check(ctx, contains(h.err.str(), "1 of 2 transfers failed"), "failure note");

  std::ostringstream out;
  std::ostringstream err;
  write_result(result, OutputFormatter(OutputFormat::Table, ColorMode::Never), out, err);
  ok &= check(ctx, contains(out.str(), "┌") && contains(out.str(), "└"), "table on stdout");
  ok &= check(ctx, err.str().empty(), "nothing else on stderr");

  h.config.output_format = OutputFormat::Json;
  result = h.run({"send", "--batch"}, batch);
  std::ostringstream json_out;
  std::ostringstream json_err;
  write_result(result, OutputFormatter(OutputFormat::Json, ColorMode::Never), json_out, json_err);
  auto parsed = nlohmann::json::parse(json_out.str());
  ok &= check(ctx, !result.success && parsed.at("failed") == 1 && parsed.at("successful") == 1,
              "json on stdout");

  auto failed = h.router().failure(KizunaError::cancelled(), std::chrono::milliseconds(0));
  std::ostringstream text_out;
  std::ostringstream text_err;
  write_result(failed, OutputFormatter(OutputFormat::Table, ColorMode::Never), text_out, text_err);
  ok &= check(ctx, text_out.str().empty() && contains(text_err.str(), "Operation cancelled"),
              "error text on stderr");
  return ok;
}

bool test_router_peers_from_stdin(TestContext& ctx) {
  Harness h;
  h.populate();
  h.security->trusted = {kLaptopId, kPhoneId};
  h.transfer_service->auto_complete = true;
  auto file = h.file("notes.txt").string();

  auto result = h.run({"send", file, "--peer", "-"}, "laptop\n\n  phone  \n");
  bool ok = check(ctx, result.success && result.output.type == CommandOutput::Type::Table, "fan-out from stdin");
  ok &= check(ctx, result.output.table.rows.size() == 2, "one row per listed peer");
  ok &= check(ctx, h.transfer_service->send_count() == 2, "both peers sent to");

  result = h.run({"send", file, "--peer", "-"}, "");
  ok &= check(ctx, !result.success && result.exit_code == kExitUsage, "empty peer list");

  auto shared = caught([&]{ h.context({"send", "-", "--peer", "-"}); });
  ok &= check(ctx, shared && shared->kind() == ErrorKind::InvalidArgumentValue, "stdin used twice");

  auto router = [&]{
    RouterIo io;
    io.in = &h.in;
    io.out = &h.out;
    io.err = &h.err;
    io.stdin_terminal = true;
    RouterDependencies deps{h.config, h.config_manager, h.parser, h.discover, h.transfer, h.streaming, h.exec,
                            h.peers, h.status, h.batch, h.queue, h.dispatcher, &h.clipboard, nullptr};
    return CommandRouter(deps, io);
  }();
  result = router.execute(h.context({"send", file, "--peer", "-"}));
  ok &= check(ctx, !result.success && contains(result.output.text, "terminal"), "refused on a terminal");
  return ok;
}

bool test_router_queue(TestContext& ctx) {
  Harness h;
  h.populate();
  auto file = h.file("queued.txt").string();

  auto result = h.run({"send", file, "--peer", "laptop", "--queue", "--priority", "high"});
  bool ok = check(ctx, result.success && result.output.table.rows.size() == 1, "queued");
  auto pending = h.queue.get_pending_items();
  ok &= check(ctx, pending.size() == 1 && pending.front().priority == QueuePriority::High, "high priority");
  ok &= check(ctx, pending.front().peer_id == kLaptopId, "peer resolved");

  result = h.run({"status", "--queue"});
  ok &= check(ctx, result.success && result.output.table.rows.front() ==
                   std::vector<std::string>{"Pending", "1"}, "queue statistics");
  return ok;
}

bool test_router_clipboard_and_status(TestContext& ctx) {
  Harness h;
  h.populate();

  auto result = h.run({"clipboard", "share", "--enable"});
  bool ok = check(ctx, result.success && result.output.text == "Clipboard sharing enabled", "share");
  result = h.run({"clipboard", "status"});
  ok &= check(ctx, contains(result.output.text, "Sharing: ON"), "status");
  h.clipboard.set_content("alpha");
  result = h.run({"clipboard", "history", "--limit", "5"});
  ok &= check(ctx, result.output.type == CommandOutput::Type::Table && result.output.table.rows.size() == 1,
              "history table");
  result = h.run({"clipboard", "history", "--restore", "entry-7"});
  ok &= check(ctx, result.exit_code == kExitIntegration, "restore failure");

  h.config.output_format = OutputFormat::Json;
  result = h.run({"status"});
  ok &= check(ctx, result.output.type == CommandOutput::Type::Json &&
                   result.output.json.at("version") == kizuna_version() &&
                   result.output.json.at("clipboard_sync_enabled") == true, "status json");
  result = h.run({"status", "--detailed"});
  ok &= check(ctx, result.output.json.contains("trusted_peers") && result.output.json.contains("queue"),
              "detailed json");
  return ok;
}

bool test_router_config(TestContext& ctx) {
  Harness h;
  auto result = h.run({"config", "set", "peer", "laptop"});
  bool ok = check(ctx, result.success && contains(result.output.text, "default_peer = laptop"), "set");
  ok &= check(ctx, h.config_manager.load().default_peer == std::string("laptop"), "persisted");

  result = h.run({"config", "set", "port", "70000"});
  ok &= check(ctx, !result.success && result.exit_code == kExitUsage, "invalid value");

  h.config.default_peer = std::string("laptop");
  result = h.run({"config", "get", "peer"});
  ok &= check(ctx, result.success && result.output.text == "laptop", "get");
  result = h.run({"config", "list"});
  ok &= check(ctx, result.output.type == CommandOutput::Type::Table &&
                   result.output.table.rows.size() == h.config_manager.keys().size(), "list");
  return ok;
}

bool test_router_recovery(TestContext& ctx) {
  Harness h;
  ctx.logs.attach_components({"router"});

  h.discovery->fail_queries = 1;
  auto result = h.router().execute_with_recovery(h.context({"discover"}));
  bool ok = check(ctx, result.success && h.discovery->query_calls == 2, "retried once");
  ok &= check(ctx, ctx.logs.wait_for_substring("retrying", std::chrono::seconds(1)), "retry logged");
  ok &= check(ctx, result.output.table.rows.size() == 2, "peers listed");

  h.discovery->fail_queries = 2;
  result = h.router().execute_with_recovery(h.context({"discover"}));
  ok &= check(ctx, !result.success && result.exit_code == kExitIntegration, "gives up after one retry");

  h.err.str("");
  h.discovery->fail_queries = 1;
  h.discovery->query_calls = 0;
  result = h.router().execute_with_recovery(h.context({"discover", "--type", "toaster"}));
  auto warned = h.err.str();
  auto first = warned.find("not a standard device type");
  ok &= check(ctx, result.success && h.discovery->query_calls == 2, "warned command retried");
  ok &= check(ctx, first != std::string::npos &&
                   warned.find("not a standard device type", first + 1) == std::string::npos,
              "warning printed once across the retry");

  h.populate();
  result = h.router().execute_with_recovery(h.context({"exec", "--peer", "laptop", "ls"}));
  ok &= check(ctx, h.exec_service->requests.empty() && result.exit_code == kExitIntegration,
              "security failures are not retried");
  return ok;
}

bool test_router_watch_interrupt(TestContext& ctx) {
  Harness h;
  std::thread stopper([&]{
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    h.interrupt = true;
  });
  auto result = h.run({"discover", "--watch"});
  stopper.join();
  bool ok = check(ctx, !result.success && result.exit_code == kExitCancelled, "cancelled exit");
  ok &= check(ctx, contains(h.out.str(), "laptop") && contains(h.out.str(), "phone"), "peers streamed");
  ok &= check(ctx, !h.discover.continuous(), "discovery stopped");
  return ok;
}

// ---- peer service ----------------------------------------------------------

LocalNode node(const std::string& peer_id, const std::string& name) {
  LocalNode local;
  local.peer_id = peer_id;
  local.name = name;
  local.capabilities = {"file_transfer", "exec"};
  local.service_port = 0;
  return local;
}

std::optional<TransferEvent> wait_terminal_event(Channel<TransferEvent>& events, const std::string& id) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while(std::chrono::steady_clock::now() < deadline) {
    auto event = events.receive_for(std::chrono::milliseconds(100));
    if(!event || event->operation_id != id) continue;
    if(event->type == TransferEvent::Type::Completed || event->type == TransferEvent::Type::Failed ||
       event->type == TransferEvent::Type::Cancelled) {
      return event;
    }
  }
  return std::nullopt;
}

bool test_peer_service_transfer(TestContext& ctx) {
  ScratchDir scratch("peer_service");
  auto receiver_security = std::make_shared<FakeSecurity>();
  PeerService receiver(node("bbbb", "receiver"), receiver_security);
  PeerService sender(node("aaaa", "sender"), std::make_shared<FakeSecurity>());
  receiver.listen(0);
  bool ok = check(ctx, receiver.listening() && receiver.port() != 0, "listening on an ephemeral port");

  auto inbox = scratch / "inbox";
  std::filesystem::create_directories(inbox);
  write_file(inbox / "hello.txt", "old");
  std::string payload(200000, 'k');
  write_file(scratch / "hello.txt", payload);

  std::vector<IncomingOffer> offers;
  ReceiveArgs receive;
  receive.operation_id = "recv-1";
  receive.output_dir = inbox;
  receive.accept = [&](const IncomingOffer& offer){
    offers.push_back(offer);
    return true;
  };
  receiver.start_receiving(receive);
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ receiver.start_receiving(receive); }),
              "one receive at a time");

  SendArgs send;
  send.operation_id = "send-1";
  send.files = {scratch / "hello.txt"};
  send.peer_id = "bbbb";
  send.peer_address = "127.0.0.1:" + std::to_string(receiver.port());
  sender.handle_send(send);

  auto sent = wait_terminal_event(*sender.events(), "send-1");
  ok &= check(ctx, sent && sent->type == TransferEvent::Type::Completed, "sender completed");
  ok &= check(ctx, sent && sent->bytes_transferred == payload.size(), "bytes sent");
  auto received = wait_terminal_event(*receiver.events(), "recv-1");
  ok &= check(ctx, received && received->type == TransferEvent::Type::Completed, "receiver completed");
  ok &= check(ctx, offers.size() == 1 && offers.front().peer_id == "aaaa" &&
                   offers.front().total_bytes == payload.size(), "offer seen");
  ok &= check(ctx, read_file(inbox / "hello-1.txt") == payload, "stored beside the existing file");
  ok &= check(ctx, read_file(inbox / "hello.txt") == "old", "existing file untouched");

  // The single-shot receive is spent; a second offer is declined.
  send.operation_id = "send-2";
  sender.handle_send(send);
  auto declined = wait_terminal_event(*sender.events(), "send-2");
  ok &= check(ctx, declined && declined->type == TransferEvent::Type::Failed &&
                   contains(declined->error, "Not accepting transfers"), "declined when not receiving");

  receiver_security->blocked.insert("aaaa");
  receive.operation_id = "recv-2";
  receiver.start_receiving(receive);
  send.operation_id = "send-3";
  sender.handle_send(send);
  auto refused = wait_terminal_event(*sender.events(), "send-3");
  ok &= check(ctx, refused && refused->type == TransferEvent::Type::Failed &&
                   contains(refused->error, "Connection not allowed"), "blocked sender refused");

  sender.stop();
  receiver.stop();
  return ok;
}

bool test_peer_service_exec(TestContext& ctx) {
  auto receiver_security = std::make_shared<FakeSecurity>();
  auto sender_security = std::make_shared<FakeSecurity>();
  PeerService receiver(node("bbbb", "receiver"), receiver_security);
  PeerService sender(node(sender_security->key_peer_id(), "sender"), sender_security);
  receiver.listen(0);

  ExecRequest request;
  request.command = "echo remote";
  request.peer_id = "bbbb";
  request.peer_address = "127.0.0.1:" + std::to_string(receiver.port());
  request.timeout = std::chrono::milliseconds(5000);

  auto disabled = caught([&]{ sender.execute(request); });
  bool ok = check(ctx, disabled && disabled->kind() == ErrorKind::Execution &&
                       contains(disabled->what(), "disabled"), "remote exec disabled by default");

  receiver.set_allow_remote_exec(true);
  auto untrusted = caught([&]{ sender.execute(request); });
  ok &= check(ctx, untrusted && contains(untrusted->what(), "not trusted"), "untrusted caller");

  receiver_security->trusted.insert(sender_security->key_peer_id());
  auto outcome = sender.execute(request);
  ok &= check(ctx, outcome.output == "remote\n" && outcome.exit_code == 0, "remote output");

  request.peer_address = "not an address";
  ok &= check(ctx, throws_kind(ErrorKind::Execution, [&]{ sender.execute(request); }), "bad address");

  auto local = PeerService::run_local_command("printf out; printf err 1>&2; exit 3");
  ok &= check(ctx, contains(local.output, "out") && contains(local.output, "err"), "merged streams");
  ok &= check(ctx, local.exit_code == 3, "exit status");

  receiver.stop();
  return ok;
}

// Speaks the exec exchange over a raw socket; auth answers the challenge nonce.
json exec_by_hand(unsigned short port, const json& request,
                  const std::function<json(const std::string&)>& auth) {
  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  asio::streambuf buffer;
  auto write = [&](const json& message){
    auto line = message.dump() + "\n";
    asio::write(socket, asio::buffer(line));
  };
  auto read = [&]{
    asio::read_until(socket, buffer, '\n');
    std::istream is(&buffer);
    std::string line;
    std::getline(is, line);
    return json::parse(line);
  };
  write(request);
  auto reply = read();
  if(reply.value("type", "") != "exec_challenge") return reply;
  write(auth(reply.value("nonce", "")));
  return read();
}

bool test_peer_service_exec_authentication(TestContext& ctx) {
  auto receiver_security = std::make_shared<FakeSecurity>();
  auto owner_security = std::make_shared<FakeSecurity>();
  auto trusted_id = owner_security->key_peer_id();
  receiver_security->trusted.insert(trusted_id);
  PeerService receiver(node("bbbb", "receiver"), receiver_security);
  receiver.set_allow_remote_exec(true);
  receiver.listen(0);
  auto port = receiver.port();

  ExecRequest request;
  request.command = "echo remote";
  request.peer_id = "bbbb";
  request.peer_address = "127.0.0.1:" + std::to_string(port);
  request.timeout = std::chrono::milliseconds(5000);

  // Same trusted peer id, different device key.
  PeerService impostor(node(trusted_id, "impostor"), std::make_shared<FakeSecurity>());
  auto refused = caught([&]{ impostor.execute(request); });
  bool ok = check(ctx, refused && refused->kind() == ErrorKind::Execution &&
                       contains(refused->what(), "does not match its key"), "trusted id with foreign key refused");

  auto bare = exec_by_hand(port, {{"type", "exec_request"}, {"peer_id", trusted_id}, {"command", "echo x"}},
                           [](const std::string&){ return json::object(); });
  ok &= check(ctx, bare.value("type", "") == "error", "trusted id without a key refused");

  auto claim = make_exec_request(trusted_id, owner_security->key.public_key(), "echo x", std::nullopt);
  auto forged = exec_by_hand(port, claim, [](const std::string&){
    return make_exec_auth(std::string(DeviceKey::kSignatureBytes * 2, '0'));
  });
  ok &= check(ctx, forged.value("type", "") == "error" &&
                   contains(forged.value("message", ""), "authentication failed"), "forged signature refused");

  auto replayed = exec_by_hand(port, claim, [&](const std::string&){
    return make_exec_auth(owner_security->sign(exec_signing_payload("stale", "bbbb", "echo x")));
  });
  ok &= check(ctx, replayed.value("type", "") == "error", "signature over another nonce refused");

  auto signed_reply = exec_by_hand(port, claim, [&](const std::string& nonce){
    return make_exec_auth(owner_security->sign(exec_signing_payload(nonce, "bbbb", "echo x")));
  });
  ok &= check(ctx, signed_reply.value("type", "") == "exec_result" &&
                   signed_reply.value("output", "") == "x\n", "signed request runs");

  PeerService owner(node(trusted_id, "owner"), owner_security);
  auto outcome = owner.execute(request);
  ok &= check(ctx, outcome.output == "remote\n", "key owner runs commands");

  receiver.stop();
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"periodic_task_cancel", test_periodic_task_cancel},
    {"gate_session", test_gate_session},
    {"gate_policy", test_gate_policy},
    {"gate_trust_changes", test_gate_trust_changes},
    {"operation_tracker", test_operation_tracker},
    {"discover_filters", test_discover_filters},
    {"discover_empty", test_discover_empty},
    {"discover_events", test_discover_events},
    {"peers_handler", test_peers_handler},
    {"transfer_send", test_transfer_send},
    {"transfer_events", test_transfer_events},
    {"transfer_controls", test_transfer_controls},
    {"transfer_receive", test_transfer_receive},
    {"streaming_handler", test_streaming_handler},
    {"exec_handler", test_exec_handler},
    {"clipboard_handler", test_clipboard_handler},
    {"status_handler", test_status_handler},
    {"batch_transfers", test_batch_transfers},
    {"batch_cancel", test_batch_cancel},
    {"batch_concurrency_limit", test_batch_concurrency_limit},
    {"batch_empty", test_batch_empty},
    {"batch_housekeeping", test_batch_housekeeping},
    {"router_peers", test_router_peers},
    {"router_exec", test_router_exec},
    {"router_send", test_router_send},
    {"router_partial_batch_output", test_router_partial_batch_output},
    {"router_peers_from_stdin", test_router_peers_from_stdin},
    {"router_queue", test_router_queue},
    {"router_clipboard_and_status", test_router_clipboard_and_status},
    {"router_config", test_router_config},
    {"router_recovery", test_router_recovery},
    {"router_watch_interrupt", test_router_watch_interrupt},
    {"peer_service_transfer", test_peer_service_transfer},
    {"peer_service_exec", test_peer_service_exec},
    {"peer_service_exec_authentication", test_peer_service_exec_authentication},
  };
  return kizuna::test::run_tests("handler", tests, argc, argv);
}
