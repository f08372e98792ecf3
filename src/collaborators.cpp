#include "collaborators.hpp"

#include "utils.hpp"

std::string DeviceIdentity::derive_peer_id() const {
  return to_lower(key_fingerprint.substr(0, 32));
}

const char* to_string(TrustLevel level) {
  switch(level) {
    case TrustLevel::Verified: return "Verified";
    case TrustLevel::Trusted: return "Trusted";
    case TrustLevel::Blocked: return "Blocked";
  }
  return "Trusted";
}

const char* to_string(StreamQuality quality) {
  switch(quality) {
    case StreamQuality::Low: return "low";
    case StreamQuality::Medium: return "medium";
    case StreamQuality::High: return "high";
    case StreamQuality::Ultra: return "ultra";
  }
  return "medium";
}

std::optional<StreamQuality> stream_quality_from_string(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "low") return StreamQuality::Low;
  if(v == "medium") return StreamQuality::Medium;
  if(v == "high") return StreamQuality::High;
  if(v == "ultra") return StreamQuality::Ultra;
  return std::nullopt;
}

const char* to_string(StreamSessionState state) {
  switch(state) {
    case StreamSessionState::Starting: return "Starting";
    case StreamSessionState::Active: return "Active";
    case StreamSessionState::Paused: return "Paused";
    case StreamSessionState::Stopping: return "Stopping";
    case StreamSessionState::Stopped: return "Stopped";
    case StreamSessionState::Error: return "Error";
  }
  return "Error";
}
