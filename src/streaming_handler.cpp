#include "streaming_handler.hpp"

#include <algorithm>

#include "errors.hpp"
#include "security_gate.hpp"

namespace {

constexpr std::size_t kMaxEventsPerTick = 256;

std::string viewers_message(uint64_t count) {
  return std::to_string(count) + " viewers connected";
}

template<typename Fn>
auto streaming_call(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch(const KizunaError&) {
    throw;
  } catch(const std::exception& e) {
    throw KizunaError::integration(IntegrationDomain::Streaming, std::string(what) + ": " + e.what());
  }
}

} // namespace

StreamingHandler::StreamingHandler(Runtime& runtime,
                                   std::shared_ptr<StreamingService> service,
                                   SecurityGate& gate)
  : runtime_(runtime),
    service_(std::move(service)),
    gate_(gate),
    logger_(component_logger("streaming")) {}

StreamingHandler::~StreamingHandler() {
  stop();
}

void StreamingHandler::start() {
  std::lock_guard<std::mutex> lock(pump_mutex_);
  if(pump_) return;
  events_ = service_->events();
  pump_ = runtime_.every(std::chrono::milliseconds(20), [this]{ pump_events(); });
}

void StreamingHandler::stop() {
  std::shared_ptr<PeriodicTask> pump;
  {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    pump = std::move(pump_);
  }
  if(pump) pump->cancel();
}

void StreamingHandler::pump_events() {
  std::shared_ptr<Channel<StreamEvent>> events;
  {
    std::lock_guard<std::mutex> lock(pump_mutex_);
    events = events_;
  }
  if(!events) return;
  for(auto& event : events->drain(kMaxEventsPerTick)) {
    try {
      apply_event(event);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Dropped stream event for {}: {}", event.session_id, e.what());
    }
  }
}

OperationState StreamingHandler::map_state(StreamSessionState state) {
  switch(state) {
    case StreamSessionState::Starting: return OperationState::starting();
    case StreamSessionState::Active:
    case StreamSessionState::Paused:
    case StreamSessionState::Stopping: return OperationState::in_progress();
    case StreamSessionState::Stopped: return OperationState::completed();
    case StreamSessionState::Error: return OperationState::failed("Stream error");
  }
  return OperationState::starting();
}

std::string StreamingHandler::stream_url(const std::string& operation_id) {
  return "kizuna://stream/" + operation_id;
}

StreamResult StreamingHandler::handle_stream(const StreamRequest& request) {
  gate_.ensure_session();

  StreamConfig config;
  config.camera = request.camera.value_or("default");
  config.quality = request.quality;
  auto session = streaming_call("Failed to start stream", [&]{ return service_->start_camera_stream(config); });

  OperationStatus status;
  status.operation_id = session.session_id;
  status.kind = OperationKind::CameraStream;
  status.state = map_state(session.state);
  ProgressInfo progress;
  progress.message = viewers_message(0);
  status.progress = progress;
  tracker_.insert(status);
  log_info(logger_.get(), "Stream {} started on camera '{}' ({})",
           session.session_id, config.camera, to_string(config.quality));

  StreamResult result;
  result.operation_id = session.session_id;
  result.stream_url = stream_url(session.session_id);

  if(request.record) {
    auto output = request.output.value_or(std::filesystem::path(kDefaultRecording));
    try {
      streaming_call("Failed to start recording", [&]{ service_->start_recording(session.session_id, output); });
    } catch(const KizunaError& e) {
      log_warn(logger_.get(), "{}", e.what());
      try {
        service_->stop_stream(session.session_id);
      } catch(const std::exception& stop_error) {
        log_warn(logger_.get(), "Failed to stop stream {}: {}", session.session_id, stop_error.what());
      }
      tracker_.set_state(session.session_id, OperationState::failed(e.detail()));
      throw;
    }
    result.recording = output;
    log_info(logger_.get(), "Recording stream {} to {}", session.session_id, output.string());
  }

  result.status = tracker_.get(session.session_id).value_or(status);
  return result;
}

void StreamingHandler::require_known(const std::string& session_id) const {
  if(!tracker_.contains(session_id)) {
    throw KizunaError::integration(IntegrationDomain::Streaming, "Stream " + session_id + " not found");
  }
}

std::string StreamingHandler::add_viewer(const std::string& session_id, const std::string& peer_id) {
  require_known(session_id);
  gate_.require_authorized(GatedOperation::StreamViewerAdd, peer_id);
  auto viewer = streaming_call("Failed to add viewer", [&]{ return service_->add_viewer(session_id, peer_id); });
  log_info(logger_.get(), "Viewer {} ({}) joined stream {}", viewer, peer_id, session_id);
  return viewer;
}

void StreamingHandler::remove_viewer(const std::string& session_id, const std::string& viewer_id) {
  require_known(session_id);
  streaming_call("Failed to remove viewer", [&]{ service_->remove_viewer(session_id, viewer_id); });
}

void StreamingHandler::pause_stream(const std::string& session_id) {
  require_known(session_id);
  streaming_call("Failed to pause stream", [&]{ service_->pause_stream(session_id); });
}

void StreamingHandler::resume_stream(const std::string& session_id) {
  require_known(session_id);
  streaming_call("Failed to resume stream", [&]{ service_->resume_stream(session_id); });
}

void StreamingHandler::stop_stream(const std::string& session_id) {
  require_known(session_id);
  streaming_call("Failed to stop stream", [&]{ service_->stop_stream(session_id); });
}

std::vector<OperationStatus> StreamingHandler::get_all_operations() const {
  return tracker_.snapshot();
}

std::vector<OperationStatus> StreamingHandler::get_active_streams() const {
  auto all = tracker_.snapshot();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [](const OperationStatus& status){ return status.state.is_terminal(); }),
            all.end());
  return all;
}

std::optional<OperationStatus> StreamingHandler::get_operation_status(const std::string& operation_id) const {
  return tracker_.get(operation_id);
}

bool StreamingHandler::wait_for_terminal(const std::string& operation_id,
                                         std::optional<std::chrono::milliseconds> timeout) {
  return tracker_.wait_for_terminal(operation_id, timeout);
}

void StreamingHandler::apply_event(const StreamEvent& event) {
  const auto& id = event.session_id;
  bool applied = false;
  switch(event.type) {
    case StreamEvent::Type::SessionStarted:
      applied = tracker_.set_state(id, OperationState::in_progress());
      break;
    case StreamEvent::Type::StateChanged:
      applied = tracker_.set_state(id, map_state(event.state));
      break;
    case StreamEvent::Type::ViewerConnected:
      applied = tracker_.update(id, [](OperationStatus& status){
        if(!status.progress) status.progress = ProgressInfo{};
        status.progress->current += 1;
        status.progress->message = viewers_message(status.progress->current);
      });
      break;
    case StreamEvent::Type::ViewerDisconnected:
      applied = tracker_.update(id, [](OperationStatus& status){
        if(!status.progress) status.progress = ProgressInfo{};
        if(status.progress->current > 0) status.progress->current -= 1;
        status.progress->message = viewers_message(status.progress->current);
      });
      break;
    case StreamEvent::Type::StatsUpdated:
      applied = tracker_.update(id, [&](OperationStatus& status){
        if(!status.progress) status.progress = ProgressInfo{};
        status.progress->rate = event.bitrate;
      });
      break;
    case StreamEvent::Type::SessionStopped:
      applied = tracker_.set_state(id, OperationState::completed());
      if(applied) log_info(logger_.get(), "Stream {} stopped", id);
      break;
    case StreamEvent::Type::Error:
      applied = tracker_.set_state(id, OperationState::failed(event.error.empty() ? "Stream error" : event.error));
      if(applied) log_warn(logger_.get(), "Stream {} failed: {}", id, event.error);
      break;
  }
  if(!applied) {
    log_debug(logger_.get(), "Ignored stream event for {}", id);
  }
}

std::shared_ptr<Channel<OperationStatus>> StreamingHandler::subscribe(std::size_t capacity) {
  return tracker_.subscribe(capacity);
}
