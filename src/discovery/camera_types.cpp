#include "discovery/camera_types.hpp"

#include <tuple>

namespace camscout::discovery {

bool operator==(const CameraCandidate& lhs, const CameraCandidate& rhs) {
  return lhs.host == rhs.host && lhs.port == rhs.port && lhs.path == rhs.path;
}

bool operator!=(const CameraCandidate& lhs, const CameraCandidate& rhs) {
  return !(lhs == rhs);
}

bool operator<(const CameraCandidate& lhs, const CameraCandidate& rhs) {
  return std::tie(lhs.host, lhs.port, lhs.path) < std::tie(rhs.host, rhs.port, rhs.path);
}

const char* ToString(const StreamProtocol protocol) {
  switch (protocol) {
  case StreamProtocol::kMjpeg:
    return "mjpeg";
  case StreamProtocol::kRtsp:
    return "rtsp";
  case StreamProtocol::kUnknown:
    return "unknown";
  }
  return "unknown";
}

int ProtocolSpecificity(const StreamProtocol protocol) {
  switch (protocol) {
  case StreamProtocol::kRtsp:
    return 2;
  case StreamProtocol::kMjpeg:
    return 1;
  case StreamProtocol::kUnknown:
    return 0;
  }
  return 0;
}

const char* ToString(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kConnectFailed:
    return "connect_failed";
  case ErrorKind::kTimeout:
    return "timeout";
  case ErrorKind::kConnectionReset:
    return "connection_reset";
  case ErrorKind::kClassificationFailed:
    return "classification_failed";
  case ErrorKind::kValidationFailed:
    return "validation_failed";
  case ErrorKind::kScanPrerequisiteFailed:
    return "scan_prerequisite_failed";
  }
  return "unknown";
}

bool IsUnconfirmed(const ProbeResult& result) {
  return result.reachable && !result.validated && result.protocol != StreamProtocol::kUnknown;
}

std::string BuildStreamUrl(const StreamProtocol protocol, std::string_view host,
                           const std::uint16_t port, std::string_view path) {
  std::string scheme;
  if (protocol == StreamProtocol::kMjpeg) {
    scheme = "http://";
  } else if (protocol == StreamProtocol::kRtsp) {
    scheme = "rtsp://";
  } else {
    return "";
  }
  std::string url = scheme + std::string(host) + ":" + std::to_string(port);
  if (path.empty() || path.front() != '/') {
    url.push_back('/');
  }
  url.append(path);
  return url;
}

DiscoveredCamera MakeDiscoveredCamera(const ProbeResult& result) {
  DiscoveredCamera camera;
  camera.host = result.candidate.host;
  camera.port = result.candidate.port;
  camera.path = result.candidate.path;
  camera.protocol = result.protocol;
  camera.url = result.url.empty() ? BuildStreamUrl(result.protocol, camera.host, camera.port,
                                                   camera.path)
                                  : result.url;
  camera.manufacturer = result.manufacturer.value_or("generic");
  camera.discovered_at = result.finished_at;
  camera.last_validated_at = result.finished_at;
  return camera;
}

const char* ToString(const ScanState state) {
  switch (state) {
  case ScanState::kIdle:
    return "idle";
  case ScanState::kRunning:
    return "running";
  case ScanState::kCompleted:
    return "completed";
  case ScanState::kCancelled:
    return "cancelled";
  case ScanState::kFailed:
    return "failed";
  }
  return "idle";
}

} // namespace camscout::discovery
