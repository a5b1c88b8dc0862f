#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace camscout::discovery {

// One hypothesized camera location. Equality is structural over
// (host, port, path); `index` only records generation order for tie-breaks.
// `address` carries the resolved dotted quad when `host` is a name; the
// probe connects to it and never resolves names itself.
struct CameraCandidate {
  std::string host;
  std::string address;
  std::uint16_t port = 0;
  std::string path = "/";
  std::uint64_t index = 0;
};

bool operator==(const CameraCandidate& lhs, const CameraCandidate& rhs);
bool operator!=(const CameraCandidate& lhs, const CameraCandidate& rhs);
bool operator<(const CameraCandidate& lhs, const CameraCandidate& rhs);

enum class StreamProtocol {
  kUnknown = 0,
  kMjpeg,
  kRtsp,
};

const char* ToString(StreamProtocol protocol);

// Higher wins when two validated candidates share one (host, port).
int ProtocolSpecificity(StreamProtocol protocol);

// Per-probe failure kinds plus the single scan-level kind. Stable string forms
// are used in events and `scan.json` error counts.
enum class ErrorKind {
  kConnectFailed = 0,
  kTimeout,
  kConnectionReset,
  kClassificationFailed,
  kValidationFailed,
  kScanPrerequisiteFailed,
};

const char* ToString(ErrorKind kind);

struct ProbeResult {
  CameraCandidate candidate;
  bool reachable = false;
  StreamProtocol protocol = StreamProtocol::kUnknown;
  std::optional<std::string> manufacturer;
  bool validated = false;
  std::optional<ErrorKind> error;

  std::string url;
  std::string detail;
  std::size_t bytes_read = 0;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// "Seen but unconfirmed": the endpoint answered in a known protocol but the
// stream could not be validated. Never published to the registry.
bool IsUnconfirmed(const ProbeResult& result);

// `http://host:port/path` or `rtsp://host:port/path`; empty for kUnknown.
std::string BuildStreamUrl(StreamProtocol protocol, std::string_view host, std::uint16_t port,
                           std::string_view path);

struct DiscoveredCamera {
  std::string host;
  std::uint16_t port = 0;
  std::string path;
  std::string url;
  StreamProtocol protocol = StreamProtocol::kUnknown;
  std::string manufacturer;
  std::chrono::system_clock::time_point discovered_at{};
  std::chrono::system_clock::time_point last_validated_at{};
};

DiscoveredCamera MakeDiscoveredCamera(const ProbeResult& result);

enum class ScanState {
  kIdle = 0,
  kRunning,
  kCompleted,
  kCancelled,
  kFailed,
};

const char* ToString(ScanState state);

struct ScanJob {
  std::uint64_t id = 0;
  ScanState state = ScanState::kIdle;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> finished_at;
  std::uint64_t candidates_total = 0;
  std::uint64_t candidates_checked = 0;
  std::uint64_t cameras_found = 0;
  std::uint64_t cameras_unconfirmed = 0;
  std::map<ErrorKind, std::uint64_t> error_counts;
  std::optional<std::string> failure_reason;
};

} // namespace camscout::discovery
