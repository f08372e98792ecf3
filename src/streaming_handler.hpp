#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "operation_tracker.hpp"
#include "runtime.hpp"
#include "types.hpp"

class SecurityGate;

struct StreamRequest {
  std::optional<std::string> camera;
  StreamQuality quality = StreamQuality::Medium;
  bool record = false;
  std::optional<std::filesystem::path> output;
};

struct StreamResult {
  std::string operation_id;
  OperationStatus status;
  std::optional<std::string> stream_url;
  std::optional<std::filesystem::path> recording;
};

// Operation id of a stream is the collaborator's session id.
class StreamingHandler {
public:
  static constexpr const char* kDefaultRecording = "recording.mp4";

  StreamingHandler(Runtime& runtime,
                   std::shared_ptr<StreamingService> service,
                   SecurityGate& gate);
  ~StreamingHandler();

  StreamingHandler(const StreamingHandler&) = delete;
  StreamingHandler& operator=(const StreamingHandler&) = delete;

  void start();
  void stop();

  StreamResult handle_stream(const StreamRequest& request);

  std::string add_viewer(const std::string& session_id, const std::string& peer_id);
  void remove_viewer(const std::string& session_id, const std::string& viewer_id);
  void pause_stream(const std::string& session_id);
  void resume_stream(const std::string& session_id);
  void stop_stream(const std::string& session_id);

  std::vector<OperationStatus> get_all_operations() const;
  std::vector<OperationStatus> get_active_streams() const;
  std::optional<OperationStatus> get_operation_status(const std::string& operation_id) const;
  bool wait_for_terminal(const std::string& operation_id, std::optional<std::chrono::milliseconds> timeout);

  void apply_event(const StreamEvent& event);

  std::shared_ptr<Channel<OperationStatus>> subscribe(std::size_t capacity = 0);
  std::shared_ptr<Logger> logger() const { return logger_; }

  static OperationState map_state(StreamSessionState state);
  static std::string stream_url(const std::string& operation_id);

private:
  void pump_events();
  void require_known(const std::string& session_id) const;

  Runtime& runtime_;
  std::shared_ptr<StreamingService> service_;
  SecurityGate& gate_;
  std::shared_ptr<Logger> logger_;

  OperationTracker tracker_;

  std::mutex pump_mutex_;
  std::shared_ptr<Channel<StreamEvent>> events_;
  std::shared_ptr<PeriodicTask> pump_;
};
