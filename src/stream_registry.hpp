#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "channel.hpp"
#include "collaborators.hpp"
#include "log.hpp"

// Session bookkeeping for camera streams: lifecycle, viewers and recording
// targets. Capture and encoding live outside this process.
class StreamRegistry : public StreamingService {
public:
  StreamRegistry();

  StreamSession start_camera_stream(const StreamConfig& config) override;
  void start_recording(const std::string& session_id, const std::filesystem::path& output) override;
  std::string add_viewer(const std::string& session_id, const std::string& peer_id) override;
  void remove_viewer(const std::string& session_id, const std::string& viewer_id) override;
  void stop_stream(const std::string& session_id) override;
  void pause_stream(const std::string& session_id) override;
  void resume_stream(const std::string& session_id) override;
  std::shared_ptr<Channel<StreamEvent>> events() override { return events_; }

  std::optional<StreamSession> session(const std::string& session_id) const;
  std::optional<std::filesystem::path> recording(const std::string& session_id) const;
  std::size_t viewer_count(const std::string& session_id) const;

  // Nominal bytes per second reported for a quality level.
  static double nominal_bitrate(StreamQuality quality);

private:
  struct Entry {
    StreamSession session;
    std::map<std::string, std::string> viewers; // viewer id -> peer id
    std::optional<std::filesystem::path> recording;
  };

  Entry& require(const std::string& session_id);
  void transition(Entry& entry, StreamSessionState state);

  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Channel<StreamEvent>> events_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> sessions_;
};
