#pragma once

#include "discovery/camera_types.hpp"
#include "discovery/signature_table.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace camscout::discovery {

// Longest a probe may sleep on the network before re-checking its abort flag.
inline constexpr std::chrono::milliseconds kAbortPollInterval(50);

struct ProbeOptions {
  // Ports that get an RTSP DESCRIBE; every other port gets an HTTP GET.
  std::set<std::uint16_t> rtsp_ports = {554, 8554};
  std::size_t max_response_bytes = 16384U;
  std::chrono::milliseconds validation_window{1000};
  bool rtsp_frame_grab = false;
};

// One network attempt per call. Implementations touch no shared mutable state,
// always return a ProbeResult, and return within `timeout` plus one abort
// poll interval.
class IProbeExecutor {
public:
  virtual ~IProbeExecutor() = default;

  virtual ProbeResult Probe(const CameraCandidate& candidate, std::chrono::milliseconds timeout,
                            const std::atomic<bool>& abort) const = 0;
};

// POSIX TCP implementation: non-blocking connect, one request, bounded read,
// classification against the signature table, then stream validation.
class TcpProbeExecutor final : public IProbeExecutor {
public:
  explicit TcpProbeExecutor(std::shared_ptr<const SignatureTable> signatures,
                            ProbeOptions options = {});

  ProbeResult Probe(const CameraCandidate& candidate, std::chrono::milliseconds timeout,
                    const std::atomic<bool>& abort) const override;

  const ProbeOptions& Options() const;

private:
  std::shared_ptr<const SignatureTable> signatures_;
  ProbeOptions options_;
};

bool IsRtspCandidate(const CameraCandidate& candidate, const ProbeOptions& options);

std::string BuildHttpGetRequest(const CameraCandidate& candidate);
std::string BuildRtspDescribeRequest(const CameraCandidate& candidate);

} // namespace camscout::discovery
