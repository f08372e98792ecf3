#include "stream_registry.hpp"

#include <system_error>

#include "errors.hpp"
#include "utils.hpp"

StreamRegistry::StreamRegistry()
  : logger_(component_logger("streaming")),
    events_(std::make_shared<Channel<StreamEvent>>()) {}

double StreamRegistry::nominal_bitrate(StreamQuality quality) {
  switch(quality) {
    case StreamQuality::Low: return 64'000.0;
    case StreamQuality::Medium: return 192'000.0;
    case StreamQuality::High: return 512'000.0;
    case StreamQuality::Ultra: return 1'000'000.0;
  }
  return 192'000.0;
}

StreamRegistry::Entry& StreamRegistry::require(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if(it == sessions_.end()) {
    throw KizunaError::integration(IntegrationDomain::Streaming, "Unknown stream session " + session_id);
  }
  return it->second;
}

void StreamRegistry::transition(Entry& entry, StreamSessionState state) {
  entry.session.state = state;
  StreamEvent event;
  event.type = StreamEvent::Type::StateChanged;
  event.session_id = entry.session.session_id;
  event.state = state;
  events_->send(event);
}

StreamSession StreamRegistry::start_camera_stream(const StreamConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry entry;
  entry.session.session_id = new_uuid();
  entry.session.state = StreamSessionState::Starting;
  entry.session.config = config;
  auto session = entry.session;
  auto& stored = sessions_[session.session_id] = std::move(entry);

  StreamEvent started;
  started.type = StreamEvent::Type::SessionStarted;
  started.session_id = session.session_id;
  started.state = StreamSessionState::Starting;
  events_->send(started);
  transition(stored, StreamSessionState::Active);

  StreamEvent stats;
  stats.type = StreamEvent::Type::StatsUpdated;
  stats.session_id = session.session_id;
  stats.bitrate = nominal_bitrate(config.quality);
  events_->send(stats);

  log_debug(logger_.get(), "Registered stream {} for camera '{}'", session.session_id, config.camera);
  return session;
}

void StreamRegistry::start_recording(const std::string& session_id, const std::filesystem::path& output) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  auto directory = output.has_parent_path() ? output.parent_path() : std::filesystem::path(".");
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if(ec) {
    throw KizunaError::integration(IntegrationDomain::Streaming,
                                   "Cannot record to " + output.string() + ": " + ec.message());
  }
  entry.recording = output;
}

std::string StreamRegistry::add_viewer(const std::string& session_id, const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  if(entry.session.state == StreamSessionState::Stopped || entry.session.state == StreamSessionState::Error) {
    throw KizunaError::integration(IntegrationDomain::Streaming, "Stream " + session_id + " is not running");
  }
  auto viewer = new_uuid();
  entry.viewers[viewer] = peer_id;
  StreamEvent event;
  event.type = StreamEvent::Type::ViewerConnected;
  event.session_id = session_id;
  event.viewer_id = viewer;
  events_->send(event);
  return viewer;
}

void StreamRegistry::remove_viewer(const std::string& session_id, const std::string& viewer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  if(entry.viewers.erase(viewer_id) == 0) {
    throw KizunaError::integration(IntegrationDomain::Streaming, "Unknown viewer " + viewer_id);
  }
  StreamEvent event;
  event.type = StreamEvent::Type::ViewerDisconnected;
  event.session_id = session_id;
  event.viewer_id = viewer_id;
  events_->send(event);
}

void StreamRegistry::stop_stream(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  if(entry.session.state == StreamSessionState::Stopped) return;
  transition(entry, StreamSessionState::Stopping);
  for(const auto& viewer : entry.viewers) {
    StreamEvent event;
    event.type = StreamEvent::Type::ViewerDisconnected;
    event.session_id = session_id;
    event.viewer_id = viewer.first;
    events_->send(event);
  }
  entry.viewers.clear();
  entry.session.state = StreamSessionState::Stopped;
  StreamEvent stopped;
  stopped.type = StreamEvent::Type::SessionStopped;
  stopped.session_id = session_id;
  stopped.state = StreamSessionState::Stopped;
  events_->send(stopped);
}

void StreamRegistry::pause_stream(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  if(entry.session.state != StreamSessionState::Active) {
    throw KizunaError::integration(IntegrationDomain::Streaming,
                                   std::string("Cannot pause a stream that is ") + to_string(entry.session.state));
  }
  transition(entry, StreamSessionState::Paused);
}

void StreamRegistry::resume_stream(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = require(session_id);
  if(entry.session.state != StreamSessionState::Paused) {
    throw KizunaError::integration(IntegrationDomain::Streaming,
                                   std::string("Cannot resume a stream that is ") + to_string(entry.session.state));
  }
  transition(entry, StreamSessionState::Active);
}

std::optional<StreamSession> StreamRegistry::session(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if(it == sessions_.end()) return std::nullopt;
  return it->second.session;
}

std::optional<std::filesystem::path> StreamRegistry::recording(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if(it == sessions_.end()) return std::nullopt;
  return it->second.recording;
}

std::size_t StreamRegistry::viewer_count(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? 0 : it->second.viewers.size();
}
