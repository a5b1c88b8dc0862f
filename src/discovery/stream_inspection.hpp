#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camscout::discovery {

enum class ResponseKind {
  kNone = 0,
  kHttp,
  kRtsp,
};

// Status line plus headers of an HTTP/1.x or RTSP/1.0 response. Header names
// are lowercased; repeated headers keep the last value.
struct ResponseHead {
  ResponseKind kind = ResponseKind::kNone;
  int status_code = 0;
  std::string reason;
  std::map<std::string, std::string> headers;
  // True once the blank line ending the header block was seen.
  bool complete = false;
  // Offset of the first body byte; valid only when `complete`.
  std::size_t body_offset = 0;

  const std::string* Header(std::string_view lowercase_name) const;
  std::optional<std::size_t> ContentLength() const;
};

// Kind from the first bytes only; usable before the status line is complete.
ResponseKind DetectResponseKind(std::string_view buffer);

// Parses whatever header bytes are present. Returns false when the status line
// is complete but malformed, or when the buffer does not start with a known
// protocol token.
bool ParseResponseHead(std::string_view buffer, ResponseHead& head, std::string& error);

// Lowercased media type without parameters, e.g. `multipart/x-mixed-replace`.
std::string MediaType(std::string_view content_type);

// `boundary=` parameter with surrounding quotes removed.
std::optional<std::string> ExtractMultipartBoundary(std::string_view content_type);

// Body contains `--<boundary>` (or the boundary itself when it already carries
// the leading dashes, as some firmwares declare it).
bool ContainsBoundaryMarker(std::string_view body, std::string_view boundary);

// JPEG start-of-image marker FF D8 FF.
bool ContainsJpegStartOfImage(std::string_view body);

struct SdpMedia {
  std::string media;
  std::string port;
  std::string protocol;
  std::vector<std::string> formats;
};

struct SdpSession {
  std::string origin;
  std::string session_name;
  std::vector<SdpMedia> media;

  bool HasVideo() const;
};

// Minimal SDP (RFC 4566) reader: first line `v=0`, every non-empty line
// `<letter>=<value>`, media lines split into their fields.
bool ParseSdp(std::string_view text, SdpSession& session, std::string& error);

enum class ValidationVerdict {
  kValid = 0,
  // More bytes could still make the stream valid.
  kNeedMore,
  kInvalid,
};

// MJPEG: 200 plus either a multipart boundary seen in the body or an
// image/jpeg body with a JPEG SOI.
ValidationVerdict ValidateMjpegResponse(const ResponseHead& head, std::string_view body,
                                        std::string& detail);

// RTSP DESCRIBE: 200, application/sdp, and a body that parses as SDP with at
// least one video media description. The body is bounded by Content-Length.
ValidationVerdict ValidateRtspDescribe(const ResponseHead& head, std::string_view body,
                                       bool peer_closed, std::string& detail);

} // namespace camscout::discovery
