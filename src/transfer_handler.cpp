#include "transfer_handler.hpp"

#include <system_error>

#include "errors.hpp"
#include "security_gate.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kMaxEventsPerTick = 512;

template<typename Fn>
auto integration_call(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Transfer, std::string(what) + ": " + e.what());
  }
}

} // namespace

TransferHandler::TransferHandler(Runtime& runtime,
                                 std::shared_ptr<TransferService> service,
                                 SecurityGate& gate,
                                 PeerResolver resolver)
  : runtime_(runtime),
    service_(std::move(service)),
    gate_(gate),
    resolver_(std::move(resolver)),
    logger_(component_logger("transfer")),
    download_dir_(std::filesystem::current_path()) {}

TransferHandler::~TransferHandler() {
  stop();
}

void TransferHandler::set_defaults(bool compression, bool encryption) {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  default_compression_ = compression;
  default_encryption_ = encryption;
}

void TransferHandler::set_download_dir(std::filesystem::path dir) {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  download_dir_ = std::move(dir);
}

void TransferHandler::set_offer_prompt(OfferPrompt prompt) {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  prompt_ = std::move(prompt);
}

void TransferHandler::start() {
  std::lock_guard<std::mutex> lock(pump_mutex_);
  if(pump_) return;
  events_ = service_->events();
  pump_ = runtime_.every(std::chrono::milliseconds(20), [this]{ pump_events(); });
}

void TransferHandler::stop() {
  std::shared_ptr<PeriodicTask> pump;
  {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    pump = std::move(pump_);
  }
  if(pump) pump->cancel();
}

void TransferHandler::pump_events() {
  std::shared_ptr<Channel<TransferEvent>> events;
  {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    events = events_;
  }
  if(!events) return;
  for(auto& event : events->drain(kMaxEventsPerTick)) {
    try {
      apply_event(event);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Dropped transfer event for {}: {}", event.operation_id, e.what());
    }
  }
}

PeerInfo TransferHandler::resolve_peer(const std::string& peer) const {
  if(resolver_) {
    if(auto resolved = resolver_(peer)) return *resolved;
  }
  throw KizunaError::integration(IntegrationDomain::Transfer,
                                 "Unknown peer '" + peer + "'; run 'kizuna discover' to find peers");
}

OperationHandle TransferHandler::send(const SendRequest& request) {
  if(request.files.empty()) {
    throw KizunaError::missing_argument("file (at least one file to send)");
  }
  uint64_t total = 0;
  for(const auto& file : request.files) {
    std::error_code ec;
    if(!std::filesystem::is_regular_file(file, ec)) {
      throw KizunaError::io("file not found: " + file.string());
    }
    total += std::filesystem::file_size(file, ec);
  }

  auto peer = resolve_peer(request.peer);
  gate_.require_authorized(GatedOperation::Send, peer.id);

  SendArgs args;
  args.operation_id = new_uuid();
  args.files = request.files;
  args.peer_id = peer.id;
  if(!peer.addresses.empty()) args.peer_address = peer.addresses.front();
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    args.compression = request.compression.value_or(default_compression_);
    args.encryption = request.encryption.value_or(default_encryption_);
  }

  OperationStatus status;
  status.operation_id = args.operation_id;
  status.kind = OperationKind::FileTransfer;
  status.peer_id = peer.id;
  status.state = OperationState::starting();
  ProgressInfo progress;
  progress.total = total;
  progress.message = "Transferring " + std::to_string(request.files.size()) + " files";
  status.progress = progress;
  tracker_.insert(status);

  try {
    integration_call("Failed to start transfer", [&]{ service_->handle_send(args); });
  } catch(const KizunaError& e) {
    tracker_.set_state(args.operation_id, OperationState::failed(e.detail()));
    throw;
  }
  log_info(logger_.get(), "Transfer {} to {} started ({} files, {} bytes)",
           args.operation_id, peer.name, request.files.size(), total);
  return {args.operation_id, tracker_.get(args.operation_id).value_or(status)};
}

bool TransferHandler::decide_offer(const IncomingOffer& offer, const ReceiveRequest& request) {
  if(request.from_peer && to_lower(*request.from_peer) != to_lower(offer.peer_id)) {
    auto resolved = resolver_ ? resolver_(*request.from_peer) : std::nullopt;
    if(!resolved || resolved->id != offer.peer_id) {
      log_info(logger_.get(), "Rejected offer from {} (waiting for {})", offer.peer_id, *request.from_peer);
      return false;
    }
  }
  auto decision = gate_.authorize_operation(GatedOperation::Receive, offer.peer_id);
  if(!decision.allowed) {
    log_warn(logger_.get(), "Rejected offer from {}: {}", offer.peer_id, decision.reason);
    return false;
  }
  if(request.auto_accept && gate_.is_peer_trusted(offer.peer_id)) {
    return true;
  }
  OfferPrompt prompt;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    prompt = prompt_;
  }
  if(prompt) return prompt(offer);
  log_info(logger_.get(), "Rejected offer from {}: not auto-accepted", offer.peer_id);
  return false;
}

OperationHandle TransferHandler::receive(const ReceiveRequest& request) {
  gate_.ensure_session();

  ReceiveArgs args;
  args.operation_id = new_uuid();
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    args.output_dir = request.output_dir.value_or(download_dir_);
  }
  std::error_code ec;
  std::filesystem::create_directories(args.output_dir, ec);
  if(ec) {
    throw KizunaError::io("unable to create " + args.output_dir.string() + ": " + ec.message());
  }
  args.from_peer = request.from_peer;
  args.accept = [this, request](const IncomingOffer& offer){ return decide_offer(offer, request); };

  OperationStatus status;
  status.operation_id = args.operation_id;
  status.kind = OperationKind::FileTransfer;
  status.peer_id = request.from_peer.value_or("");
  status.state = OperationState::starting();
  ProgressInfo progress;
  progress.message = "Waiting for incoming transfer...";
  status.progress = progress;
  tracker_.insert(status);

  try {
    integration_call("Failed to start receiving", [&]{ service_->start_receiving(args); });
  } catch(const KizunaError& e) {
    tracker_.set_state(args.operation_id, OperationState::failed(e.detail()));
    throw;
  }
  log_info(logger_.get(), "Waiting for transfers into {}", args.output_dir.string());
  return {args.operation_id, tracker_.get(args.operation_id).value_or(status)};
}

void TransferHandler::stop_receiving() {
  integration_call("Failed to stop receiving", [&]{ service_->stop_receiving(); });
}

std::vector<OperationStatus> TransferHandler::get_all_operations() const {
  return tracker_.snapshot();
}

std::optional<OperationStatus> TransferHandler::get_operation_status(const std::string& operation_id) const {
  return tracker_.get(operation_id);
}

void TransferHandler::require_known(const std::string& operation_id) const {
  if(!tracker_.contains(operation_id)) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Operation " + operation_id + " not found");
  }
}

void TransferHandler::cancel_operation(const std::string& operation_id) {
  require_known(operation_id);
  if(!tracker_.cancel(operation_id)) return;
  log_info(logger_.get(), "Cancelled transfer {}", operation_id);
  try {
    service_->cancel(operation_id);
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Collaborator failed to cancel {}: {}", operation_id, e.what());
  }
}

void TransferHandler::pause_operation(const std::string& operation_id) {
  require_known(operation_id);
  integration_call("Failed to pause transfer", [&]{ service_->pause(operation_id); });
  tracker_.update(operation_id, [](OperationStatus& status){
    if(!status.progress) status.progress = ProgressInfo{};
    status.progress->message = "Paused";
    status.progress->rate = 0.0;
  });
}

void TransferHandler::resume_operation(const std::string& operation_id) {
  require_known(operation_id);
  integration_call("Failed to resume transfer", [&]{ service_->resume(operation_id); });
  tracker_.update(operation_id, [](OperationStatus& status){
    if(status.progress) status.progress->message.reset();
  });
}

void TransferHandler::set_bandwidth_limit(const std::string& operation_id, std::optional<uint64_t> bytes_per_sec) {
  require_known(operation_id);
  integration_call("Failed to set bandwidth limit",
                   [&]{ service_->set_bandwidth_limit(operation_id, bytes_per_sec); });
}

bool TransferHandler::wait_for_terminal(const std::string& operation_id,
                                        std::optional<std::chrono::milliseconds> timeout) {
  return tracker_.wait_for_terminal(operation_id, timeout);
}

void TransferHandler::apply_event(const TransferEvent& event) {
  bool applied = false;
  switch(event.type) {
    case TransferEvent::Type::Started:
      applied = tracker_.update(event.operation_id, [&](OperationStatus& status){
        status.state = OperationState::in_progress();
        if(!status.progress) status.progress = ProgressInfo{};
        if(event.total_bytes > 0) status.progress->total = event.total_bytes;
      });
      break;
    case TransferEvent::Type::Progress:
      applied = tracker_.update(event.operation_id, [&](OperationStatus& status){
        status.state = OperationState::in_progress();
        ProgressInfo progress = status.progress.value_or(ProgressInfo{});
        progress.current = event.bytes_transferred;
        if(event.total_bytes > 0) progress.total = event.total_bytes;
        progress.rate = event.rate;
        progress.eta.reset();
        status.estimated_completion.reset();
        if(event.rate > 0.0 && progress.total && *progress.total > progress.current) {
          auto remaining = static_cast<double>(*progress.total - progress.current) / event.rate;
          progress.eta = std::chrono::seconds(static_cast<long long>(remaining + 0.5));
          status.estimated_completion = std::chrono::system_clock::now() + *progress.eta;
        }
        status.progress = progress;
      });
      break;
    case TransferEvent::Type::Completed:
      applied = tracker_.update(event.operation_id, [&](OperationStatus& status){
        status.state = OperationState::completed();
        if(status.progress) {
          if(status.progress->total) status.progress->current = *status.progress->total;
          status.progress->eta.reset();
        }
      });
      if(applied) log_info(logger_.get(), "Transfer {} completed", event.operation_id);
      break;
    case TransferEvent::Type::Failed:
      applied = tracker_.set_state(event.operation_id, OperationState::failed(event.error));
      if(applied) log_warn(logger_.get(), "Transfer {} failed: {}", event.operation_id, event.error);
      break;
    case TransferEvent::Type::Cancelled:
      applied = tracker_.cancel(event.operation_id);
      break;
  }
  if(!applied) {
    log_debug(logger_.get(), "Ignored transfer event for {}", event.operation_id);
  }
}

std::shared_ptr<Channel<OperationStatus>> TransferHandler::subscribe(std::size_t capacity) {
  return tracker_.subscribe(capacity);
}
