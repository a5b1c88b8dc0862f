#include "discovery/probe_executor.hpp"

#include "core/time_utils.hpp"
#include "core/version.hpp"
#include "discovery/opencv_frame_check.hpp"
#include "discovery/stream_inspection.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string_view>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace camscout::discovery {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::size_t kReadChunkBytes = 4096U;

// Owns one socket descriptor for the lifetime of a probe.
class ScopedSocket {
public:
  ScopedSocket() = default;
  explicit ScopedSocket(int fd) : fd_(fd) {}
  ~ScopedSocket() {
    Close();
  }

  ScopedSocket(const ScopedSocket&) = delete;
  ScopedSocket& operator=(const ScopedSocket&) = delete;

  int Get() const {
    return fd_;
  }
  bool Valid() const {
    return fd_ >= 0;
  }
  void Close() {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

enum class WaitOutcome {
  kReady = 0,
  kTimeout,
  kAborted,
  kError,
};

enum class ReadOutcome {
  kData = 0,
  kClosed,
  kReset,
  kTimeout,
  kAborted,
  kFull,
};

// Sleeps on `fd` in slices of at most kAbortPollInterval until `events` fire,
// the deadline passes or `abort` is raised.
WaitOutcome WaitForSocket(const int fd, const short events, const SteadyClock::time_point deadline,
                          const std::atomic<bool>& abort) {
  while (true) {
    if (abort.load(std::memory_order_relaxed)) {
      return WaitOutcome::kAborted;
    }
    const std::chrono::milliseconds remaining = core::RemainingUntil(deadline);
    if (remaining.count() <= 0) {
      return WaitOutcome::kTimeout;
    }

    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = events;
    const auto slice = std::min(remaining, kAbortPollInterval);
    const int status = ::poll(&descriptor, 1, static_cast<int>(slice.count()));
    if (status < 0) {
      if (errno == EINTR) {
        continue;
      }
      return WaitOutcome::kError;
    }
    if (status > 0) {
      return WaitOutcome::kReady;
    }
  }
}

// Numeric addresses only; host names are resolved once per scan, before any
// probe runs.
bool ParseNumericAddress(const std::string& host, const std::uint16_t port, sockaddr_in& address,
                         std::string& error) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

  addrinfo* resolved = nullptr;
  const std::string service = std::to_string(port);
  const int status = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved);
  if (status != 0 || resolved == nullptr) {
    error = "'" + host + "' is not a numeric IPv4 address: " + ::gai_strerror(status);
    if (resolved != nullptr) {
      ::freeaddrinfo(resolved);
    }
    return false;
  }
  std::memcpy(&address, resolved->ai_addr, sizeof(sockaddr_in));
  ::freeaddrinfo(resolved);
  return true;
}

// Non-blocking connect bounded by `deadline`.
WaitOutcome ConnectWithDeadline(const int fd, const sockaddr_in& address,
                                const SteadyClock::time_point deadline,
                                const std::atomic<bool>& abort, std::string& error) {
  int status = 0;
  do {
    status = ::connect(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
  } while (status != 0 && errno == EINTR);
  if (status == 0) {
    return WaitOutcome::kReady;
  }
  if (errno != EINPROGRESS) {
    error = std::string("connect failed: ") + std::strerror(errno);
    return WaitOutcome::kError;
  }

  const WaitOutcome outcome = WaitForSocket(fd, POLLOUT, deadline, abort);
  if (outcome == WaitOutcome::kTimeout) {
    error = "connect timed out";
    return outcome;
  }
  if (outcome == WaitOutcome::kError) {
    error = std::string("poll failed during connect: ") + std::strerror(errno);
    return outcome;
  }
  if (outcome != WaitOutcome::kReady) {
    return outcome;
  }

  int socket_error = 0;
  socklen_t length = sizeof(socket_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0) {
    error = std::string("getsockopt(SO_ERROR) failed: ") + std::strerror(errno);
    return WaitOutcome::kError;
  }
  if (socket_error != 0) {
    error = std::string("connect failed: ") + std::strerror(socket_error);
    return WaitOutcome::kError;
  }
  return WaitOutcome::kReady;
}

WaitOutcome SendAll(const int fd, std::string_view payload, const SteadyClock::time_point deadline,
                    const std::atomic<bool>& abort, std::string& error) {
  while (!payload.empty()) {
    const ssize_t sent = ::send(fd, payload.data(), payload.size(), MSG_NOSIGNAL);
    if (sent > 0) {
      payload.remove_prefix(static_cast<std::size_t>(sent));
      continue;
    }
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      const WaitOutcome outcome = WaitForSocket(fd, POLLOUT, deadline, abort);
      if (outcome != WaitOutcome::kReady) {
        error = "request send did not complete";
        return outcome;
      }
      continue;
    }
    error = std::string("send failed: ") + std::strerror(errno);
    return WaitOutcome::kError;
  }
  return WaitOutcome::kReady;
}

// Appends at most one chunk to `buffer`, never growing it past `cap`.
ReadOutcome ReadMore(const int fd, std::string& buffer, const std::size_t cap,
                     const SteadyClock::time_point deadline, const std::atomic<bool>& abort) {
  if (buffer.size() >= cap) {
    return ReadOutcome::kFull;
  }

  std::array<char, kReadChunkBytes> chunk{};
  while (true) {
    const WaitOutcome outcome = WaitForSocket(fd, POLLIN, deadline, abort);
    if (outcome == WaitOutcome::kAborted) {
      return ReadOutcome::kAborted;
    }
    if (outcome == WaitOutcome::kTimeout) {
      return ReadOutcome::kTimeout;
    }
    if (outcome == WaitOutcome::kError) {
      return ReadOutcome::kReset;
    }

    const std::size_t wanted = std::min(chunk.size(), cap - buffer.size());
    const ssize_t received = ::recv(fd, chunk.data(), wanted, 0);
    if (received > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(received));
      return ReadOutcome::kData;
    }
    if (received == 0) {
      return ReadOutcome::kClosed;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    return ReadOutcome::kReset;
  }
}

// True while a short buffer may still turn into an `HTTP/` or `RTSP/` line.
bool MayBecomeResponse(std::string_view buffer) {
  constexpr std::string_view kHttp = "HTTP/";
  constexpr std::string_view kRtsp = "RTSP/";
  return buffer.size() < kHttp.size() &&
         (kHttp.substr(0, buffer.size()) == buffer || kRtsp.substr(0, buffer.size()) == buffer);
}

ProbeResult Finish(ProbeResult& result, std::optional<ErrorKind> error, std::string detail) {
  result.error = error;
  result.detail = std::move(detail);
  result.finished_at = std::chrono::system_clock::now();
  return std::move(result);
}

// One connection: send `request`, read the head, classify, then validate.
// `answered` reports which protocol the peer spoke, if any.
ProbeResult RunExchange(const SignatureTable& signatures, const ProbeOptions& options,
                        ProbeResult result, const sockaddr_in& address, const std::string& request,
                        const SteadyClock::time_point deadline, const std::atomic<bool>& abort,
                        ResponseKind& answered) {
  const std::size_t cap = options.max_response_bytes;
  std::string error;
  ScopedSocket sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP));
  if (!sock.Valid()) {
    return Finish(result, ErrorKind::kConnectFailed,
                  std::string("socket() failed: ") + std::strerror(errno));
  }

  const WaitOutcome connected = ConnectWithDeadline(sock.Get(), address, deadline, abort, error);
  if (connected == WaitOutcome::kAborted) {
    return Finish(result, ErrorKind::kTimeout, "abandoned");
  }
  if (connected != WaitOutcome::kReady) {
    return Finish(result, ErrorKind::kConnectFailed, error);
  }
  result.reachable = true;

  const WaitOutcome sent = SendAll(sock.Get(), request, deadline, abort, error);
  if (sent == WaitOutcome::kAborted) {
    return Finish(result, ErrorKind::kTimeout, "abandoned");
  }
  if (sent == WaitOutcome::kTimeout) {
    return Finish(result, ErrorKind::kTimeout, error);
  }
  if (sent != WaitOutcome::kReady) {
    return Finish(result, ErrorKind::kConnectionReset, error);
  }

  // Header phase: read until the blank line, the cap, or the deadline.
  std::string buffer;
  buffer.reserve(std::min(cap, kReadChunkBytes));
  ResponseHead head;
  std::string parse_error;
  bool parsed = false;
  ReadOutcome last = ReadOutcome::kData;
  while (true) {
    if (!buffer.empty()) {
      parsed = ParseResponseHead(buffer, head, parse_error);
      if ((parsed && head.complete) || (!parsed && !MayBecomeResponse(buffer))) {
        break;
      }
    }
    last = ReadMore(sock.Get(), buffer, cap, deadline, abort);
    if (last != ReadOutcome::kData) {
      break;
    }
  }
  result.bytes_read = buffer.size();

  if (last == ReadOutcome::kAborted) {
    return Finish(result, ErrorKind::kTimeout, "abandoned");
  }
  if (buffer.empty()) {
    if (last == ReadOutcome::kClosed) {
      return Finish(result, std::nullopt, "peer closed without sending a response");
    }
    if (last == ReadOutcome::kReset) {
      return Finish(result, ErrorKind::kConnectionReset, "connection reset before any response");
    }
    return Finish(result, ErrorKind::kTimeout, "no response within probe timeout");
  }

  const ResponseKind kind = DetectResponseKind(buffer);
  answered = kind;
  std::optional<SignatureMatch> match;
  if (kind == ResponseKind::kHttp) {
    match = signatures.MatchHttp(buffer);
  } else if (kind == ResponseKind::kRtsp) {
    match = signatures.MatchRtsp(buffer);
  }
  if (match.has_value()) {
    result.protocol = kind == ResponseKind::kRtsp ? StreamProtocol::kRtsp : StreamProtocol::kMjpeg;
    if (match->name != kGenericSignatureName) {
      result.manufacturer = match->name;
    }
    result.url = BuildStreamUrl(result.protocol, result.candidate.host, result.candidate.port,
                                result.candidate.path);
  }

  const bool peer_gone = last == ReadOutcome::kClosed || last == ReadOutcome::kReset;
  if (!parsed) {
    if (!match.has_value()) {
      return Finish(result, ErrorKind::kClassificationFailed,
                    kind == ResponseKind::kNone ? "response is neither HTTP nor RTSP"
                                                : parse_error);
    }
    return Finish(result, ErrorKind::kValidationFailed, parse_error);
  }
  if (!head.complete) {
    if (peer_gone) {
      return Finish(result, ErrorKind::kConnectionReset, "peer closed mid-response");
    }
    if (!match.has_value()) {
      if (last == ReadOutcome::kTimeout) {
        return Finish(result, ErrorKind::kTimeout, "response head incomplete at timeout");
      }
      return Finish(result, ErrorKind::kClassificationFailed, "no signature matched");
    }
    return Finish(result, ErrorKind::kValidationFailed, "response head incomplete");
  }
  if (!match.has_value()) {
    return Finish(result, ErrorKind::kClassificationFailed, "no signature matched");
  }

  // Validation phase: bounded by the window and the remaining probe budget.
  const SteadyClock::time_point window_deadline =
      std::min(deadline, SteadyClock::now() + options.validation_window);
  bool peer_closed = peer_gone;
  std::string detail;
  while (true) {
    const std::string_view body = std::string_view(buffer).substr(head.body_offset);
    if (result.protocol == StreamProtocol::kRtsp) {
      const std::optional<std::size_t> content_length = head.ContentLength();
      if (peer_closed && content_length.has_value() && body.size() < *content_length) {
        return Finish(result, ErrorKind::kConnectionReset,
                      "peer closed before the full session description arrived");
      }
    }

    const ValidationVerdict verdict = result.protocol == StreamProtocol::kRtsp
                                          ? ValidateRtspDescribe(head, body, peer_closed, detail)
                                          : ValidateMjpegResponse(head, body, detail);
    if (verdict == ValidationVerdict::kValid) {
      break;
    }
    if (verdict == ValidationVerdict::kInvalid || peer_closed) {
      return Finish(result, ErrorKind::kValidationFailed, detail);
    }
    if (buffer.size() >= cap) {
      return Finish(result, ErrorKind::kValidationFailed, detail + " (response cap reached)");
    }

    last = ReadMore(sock.Get(), buffer, cap, window_deadline, abort);
    result.bytes_read = buffer.size();
    if (last == ReadOutcome::kAborted) {
      return Finish(result, ErrorKind::kTimeout, "abandoned");
    }
    if (last == ReadOutcome::kTimeout) {
      return Finish(result, ErrorKind::kValidationFailed, detail);
    }
    if (last == ReadOutcome::kReset) {
      return Finish(result, ErrorKind::kConnectionReset, "connection reset during validation");
    }
    if (last == ReadOutcome::kClosed) {
      peer_closed = true;
    }
  }
  sock.Close();

  if (result.protocol == StreamProtocol::kRtsp && options.rtsp_frame_grab) {
    std::string grab_error;
    if (!GrabFirstFrame(result.url, core::RemainingUntil(deadline), grab_error)) {
      return Finish(result, ErrorKind::kValidationFailed, grab_error);
    }
  }

  result.validated = true;
  return Finish(result, std::nullopt, "");
}

} // namespace

TcpProbeExecutor::TcpProbeExecutor(std::shared_ptr<const SignatureTable> signatures,
                                   ProbeOptions options)
    : signatures_(std::move(signatures)), options_(std::move(options)) {
  if (!signatures_) {
    signatures_ = std::make_shared<const SignatureTable>(SignatureTable::BuiltIn());
  }
  if (options_.max_response_bytes == 0U) {
    options_.max_response_bytes = kReadChunkBytes;
  }
}

const ProbeOptions& TcpProbeExecutor::Options() const {
  return options_;
}

ProbeResult TcpProbeExecutor::Probe(const CameraCandidate& candidate,
                                    const std::chrono::milliseconds timeout,
                                    const std::atomic<bool>& abort) const {
  ProbeResult result;
  result.candidate = candidate;
  result.started_at = std::chrono::system_clock::now();
  const SteadyClock::time_point deadline = SteadyClock::now() + timeout;

  std::string error;
  sockaddr_in address{};
  const std::string& numeric = candidate.address.empty() ? candidate.host : candidate.address;
  if (!ParseNumericAddress(numeric, candidate.port, address, error)) {
    return Finish(result, ErrorKind::kConnectFailed, error);
  }

  const bool describe_first = IsRtspCandidate(candidate, options_);
  ResponseKind answered = ResponseKind::kNone;
  ProbeResult first = RunExchange(
      *signatures_, options_, result, address,
      describe_first ? BuildRtspDescribeRequest(candidate) : BuildHttpGetRequest(candidate),
      deadline, abort, answered);
  if (describe_first || first.validated || answered != ResponseKind::kRtsp || abort.load() ||
      SteadyClock::now() >= deadline) {
    return first;
  }

  // An RTSP server on a port outside rtsp_ports answered the GET; ask again
  // with DESCRIBE on a fresh connection within the same budget.
  ProbeResult second = RunExchange(*signatures_, options_, result, address,
                                   BuildRtspDescribeRequest(candidate), deadline, abort, answered);
  second.bytes_read += first.bytes_read;
  return second;
}

bool IsRtspCandidate(const CameraCandidate& candidate, const ProbeOptions& options) {
  return options.rtsp_ports.count(candidate.port) != 0U;
}

std::string BuildHttpGetRequest(const CameraCandidate& candidate) {
  const std::string path = candidate.path.empty() ? "/" : candidate.path;
  return "GET " + path + " HTTP/1.1\r\n" + "Host: " + candidate.host + ":" +
         std::to_string(candidate.port) + "\r\n" + "User-Agent: camscout/" +
         std::string(core::kVersion) + "\r\n" + "Accept: */*\r\n" + "Connection: close\r\n\r\n";
}

std::string BuildRtspDescribeRequest(const CameraCandidate& candidate) {
  const std::string url =
      BuildStreamUrl(StreamProtocol::kRtsp, candidate.host, candidate.port, candidate.path);
  return "DESCRIBE " + url + " RTSP/1.0\r\n" + "CSeq: 1\r\n" + "Accept: application/sdp\r\n" +
         "User-Agent: camscout/" + std::string(core::kVersion) + "\r\n\r\n";
}

} // namespace camscout::discovery
