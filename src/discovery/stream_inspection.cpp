#include "discovery/stream_inspection.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace camscout::discovery {

namespace {

constexpr std::string_view kHttpToken = "HTTP/";
constexpr std::string_view kRtspToken = "RTSP/";

std::string ToLower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.remove_suffix(1);
  }
  return value;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Splits on LF and strips a trailing CR per line.
std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1U;
  }
  return lines;
}

// Index just past the blank line ending the header block, if present.
std::optional<std::size_t> FindHeaderEnd(std::string_view buffer) {
  const std::size_t crlf = buffer.find("\r\n\r\n");
  const std::size_t lf = buffer.find("\n\n");
  if (crlf == std::string_view::npos && lf == std::string_view::npos) {
    return std::nullopt;
  }
  if (lf == std::string_view::npos || (crlf != std::string_view::npos && crlf < lf)) {
    return crlf + 4U;
  }
  return lf + 2U;
}

std::vector<std::string_view> SplitFields(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && text[start] == ' ') {
      ++start;
    }
    if (start >= text.size()) {
      break;
    }
    std::size_t end = text.find(' ', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    fields.push_back(text.substr(start, end - start));
    start = end;
  }
  return fields;
}

} // namespace

const std::string* ResponseHead::Header(std::string_view lowercase_name) const {
  const auto it = headers.find(std::string(lowercase_name));
  return it == headers.end() ? nullptr : &it->second;
}

std::optional<std::size_t> ResponseHead::ContentLength() const {
  const std::string* raw = Header("content-length");
  if (raw == nullptr) {
    return std::nullopt;
  }
  const std::string_view trimmed = Trim(*raw);
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
    return std::nullopt;
  }
  return value;
}

ResponseKind DetectResponseKind(std::string_view buffer) {
  if (StartsWith(buffer, kHttpToken)) {
    return ResponseKind::kHttp;
  }
  if (StartsWith(buffer, kRtspToken)) {
    return ResponseKind::kRtsp;
  }
  return ResponseKind::kNone;
}

bool ParseResponseHead(std::string_view buffer, ResponseHead& head, std::string& error) {
  head = ResponseHead{};
  head.kind = DetectResponseKind(buffer);
  if (head.kind == ResponseKind::kNone) {
    error = "response does not start with HTTP/ or RTSP/";
    return false;
  }

  const std::optional<std::size_t> header_end = FindHeaderEnd(buffer);
  const std::string_view header_block =
      header_end.has_value() ? buffer.substr(0, *header_end) : buffer;
  const std::vector<std::string_view> lines = SplitLines(header_block);
  if (lines.empty()) {
    return true;
  }

  const bool status_line_complete = header_block.find('\n') != std::string_view::npos;
  if (status_line_complete) {
    const std::vector<std::string_view> fields = SplitFields(lines.front());
    int status = 0;
    if (fields.size() < 2U) {
      error = "malformed status line";
      return false;
    }
    const auto [ptr, ec] =
        std::from_chars(fields[1].data(), fields[1].data() + fields[1].size(), status);
    if (ec != std::errc() || ptr != fields[1].data() + fields[1].size() || status < 100 ||
        status > 999) {
      error = "malformed status code in status line";
      return false;
    }
    head.status_code = status;
    const std::size_t reason_at =
        static_cast<std::size_t>(fields[1].data() - lines.front().data()) + fields[1].size();
    head.reason = std::string(Trim(lines.front().substr(reason_at)));
  }

  // The last line may be cut mid-header unless the block is complete.
  const std::size_t usable =
      header_end.has_value() ? lines.size() : (lines.size() > 0U ? lines.size() - 1U : 0U);
  for (std::size_t i = 1; i < usable; ++i) {
    const std::string_view line = lines[i];
    if (line.empty()) {
      continue;
    }
    const std::size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    head.headers[ToLower(Trim(line.substr(0, colon)))] =
        std::string(Trim(line.substr(colon + 1U)));
  }

  if (header_end.has_value()) {
    head.complete = true;
    head.body_offset = *header_end;
  }
  return true;
}

std::string MediaType(std::string_view content_type) {
  const std::size_t semicolon = content_type.find(';');
  return ToLower(Trim(content_type.substr(0, semicolon)));
}

std::optional<std::string> ExtractMultipartBoundary(std::string_view content_type) {
  const std::string lowered = ToLower(content_type);
  const std::size_t key = lowered.find("boundary=");
  if (key == std::string::npos) {
    return std::nullopt;
  }
  std::string_view value = content_type.substr(key + 9U);
  const std::size_t semicolon = value.find(';');
  value = Trim(value.substr(0, semicolon));
  if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
    value = value.substr(1U, value.size() - 2U);
  }
  if (value.empty()) {
    return std::nullopt;
  }
  return std::string(value);
}

bool ContainsBoundaryMarker(std::string_view body, std::string_view boundary) {
  if (boundary.empty()) {
    return false;
  }
  const std::string marker = "--" + std::string(boundary);
  if (body.find(marker) != std::string_view::npos) {
    return true;
  }
  return StartsWith(boundary, "--") && body.find(boundary) != std::string_view::npos;
}

bool ContainsJpegStartOfImage(std::string_view body) {
  constexpr char kSoi[] = {static_cast<char>(0xFF), static_cast<char>(0xD8),
                           static_cast<char>(0xFF)};
  return body.find(std::string_view(kSoi, sizeof(kSoi))) != std::string_view::npos;
}

bool SdpSession::HasVideo() const {
  return std::any_of(media.begin(), media.end(),
                     [](const SdpMedia& entry) { return entry.media == "video"; });
}

bool ParseSdp(std::string_view text, SdpSession& session, std::string& error) {
  session = SdpSession{};
  bool saw_version = false;
  std::size_t line_number = 0;
  for (const std::string_view line : SplitLines(text)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    if (line.size() < 2U || line[1] != '=' ||
        std::islower(static_cast<unsigned char>(line[0])) == 0) {
      error = "SDP line " + std::to_string(line_number) + " is not <type>=<value>";
      return false;
    }
    const char type = line[0];
    const std::string_view value = line.substr(2U);
    if (!saw_version) {
      if (type != 'v' || Trim(value) != "0") {
        error = "SDP must start with v=0";
        return false;
      }
      saw_version = true;
      continue;
    }

    switch (type) {
    case 'o':
      session.origin = std::string(value);
      break;
    case 's':
      session.session_name = std::string(value);
      break;
    case 'm': {
      const std::vector<std::string_view> fields = SplitFields(value);
      if (fields.size() < 3U) {
        error = "SDP media line " + std::to_string(line_number) + " is incomplete";
        return false;
      }
      SdpMedia media;
      media.media = ToLower(fields[0]);
      media.port = std::string(fields[1]);
      media.protocol = std::string(fields[2]);
      for (std::size_t i = 3; i < fields.size(); ++i) {
        media.formats.emplace_back(fields[i]);
      }
      session.media.push_back(std::move(media));
      break;
    }
    default:
      break;
    }
  }

  if (!saw_version) {
    error = "SDP body is empty";
    return false;
  }
  return true;
}

ValidationVerdict ValidateMjpegResponse(const ResponseHead& head, std::string_view body,
                                        std::string& detail) {
  if (head.kind != ResponseKind::kHttp || !head.complete) {
    detail = "incomplete HTTP response head";
    return ValidationVerdict::kNeedMore;
  }
  if (head.status_code != 200) {
    detail = "HTTP status " + std::to_string(head.status_code);
    return ValidationVerdict::kInvalid;
  }

  const std::string* content_type = head.Header("content-type");
  if (content_type == nullptr) {
    detail = "missing Content-Type";
    return ValidationVerdict::kInvalid;
  }
  const std::string media_type = MediaType(*content_type);
  if (StartsWith(media_type, "multipart/")) {
    const std::optional<std::string> boundary = ExtractMultipartBoundary(*content_type);
    if (!boundary.has_value()) {
      detail = "multipart response without boundary parameter";
      return ValidationVerdict::kInvalid;
    }
    if (ContainsBoundaryMarker(body, *boundary)) {
      return ValidationVerdict::kValid;
    }
    detail = "no frame boundary '--" + *boundary + "' within the validation window";
    return ValidationVerdict::kNeedMore;
  }
  if (media_type == "image/jpeg") {
    if (ContainsJpegStartOfImage(body)) {
      return ValidationVerdict::kValid;
    }
    detail = "no JPEG start-of-image marker within the validation window";
    return ValidationVerdict::kNeedMore;
  }

  detail = "content type '" + media_type + "' is not an MJPEG stream";
  return ValidationVerdict::kInvalid;
}

ValidationVerdict ValidateRtspDescribe(const ResponseHead& head, std::string_view body,
                                       const bool peer_closed, std::string& detail) {
  if (head.kind != ResponseKind::kRtsp || !head.complete) {
    detail = "incomplete RTSP response head";
    return ValidationVerdict::kNeedMore;
  }
  if (head.status_code != 200) {
    detail = "RTSP status " + std::to_string(head.status_code);
    return ValidationVerdict::kInvalid;
  }
  const std::string* content_type = head.Header("content-type");
  if (content_type == nullptr || MediaType(*content_type) != "application/sdp") {
    detail = "DESCRIBE response is not application/sdp";
    return ValidationVerdict::kInvalid;
  }

  std::string_view sdp = body;
  const std::optional<std::size_t> content_length = head.ContentLength();
  if (content_length.has_value()) {
    if (body.size() < *content_length) {
      detail = "SDP body shorter than Content-Length";
      return peer_closed ? ValidationVerdict::kInvalid : ValidationVerdict::kNeedMore;
    }
    sdp = body.substr(0, *content_length);
  } else if (!peer_closed) {
    // Without Content-Length the body ends at close; try what we have first.
    SdpSession partial;
    std::string ignored;
    if (ParseSdp(sdp, partial, ignored) && partial.HasVideo()) {
      return ValidationVerdict::kValid;
    }
    detail = "SDP body not yet complete";
    return ValidationVerdict::kNeedMore;
  }

  SdpSession session;
  std::string parse_error;
  if (!ParseSdp(sdp, session, parse_error)) {
    detail = "invalid SDP: " + parse_error;
    return ValidationVerdict::kInvalid;
  }
  if (!session.HasVideo()) {
    detail = "SDP has no m=video media description";
    return ValidationVerdict::kInvalid;
  }
  return ValidationVerdict::kValid;
}

} // namespace camscout::discovery
