#include "discovery/stream_inspection.hpp"

#include "../common/assertions.hpp"

#include <optional>
#include <string>

namespace {

using camscout::discovery::ResponseHead;
using camscout::discovery::ResponseKind;
using camscout::discovery::ValidationVerdict;
using camscout::tests::common::AssertContains;
using camscout::tests::common::AssertEq;
using camscout::tests::common::AssertTrue;
using camscout::tests::common::Fail;

ResponseHead ParseOrFail(const std::string& buffer) {
  ResponseHead head;
  std::string error;
  if (!camscout::discovery::ParseResponseHead(buffer, head, error)) {
    Fail("ParseResponseHead failed: " + error);
  }
  return head;
}

std::string Body(const std::string& buffer, const ResponseHead& head) {
  return buffer.substr(head.body_offset);
}

const std::string kSdp = "v=0\r\no=- 1 1 IN IP4 10.0.0.5\r\ns=Live\r\nt=0 0\r\n"
                         "m=audio 0 RTP/AVP 0\r\nm=video 0 RTP/AVP 96\r\n";

} // namespace

int main() {
  // Response head parsing.
  {
    const std::string buffer = "HTTP/1.1 200 OK\r\nContent-Type: image/jpeg\r\n"
                               "X-Trailing:   spaced  \r\n\r\nBODY";
    const ResponseHead head = ParseOrFail(buffer);
    AssertTrue(head.kind == ResponseKind::kHttp, "http kind");
    AssertTrue(head.complete, "complete head");
    AssertEq(head.status_code, 200, "status code");
    AssertEq(head.reason, std::string("OK"), "reason phrase");
    AssertTrue(head.Header("content-type") != nullptr, "lowercased header lookup");
    AssertEq(*head.Header("x-trailing"), std::string("spaced"), "trimmed header value");
    AssertEq(Body(buffer, head), std::string("BODY"), "body offset");
  }
  {
    // Cut mid-header: only finished lines are kept.
    const ResponseHead head = ParseOrFail("RTSP/1.0 200 OK\r\nCSeq: 1\r\nContent-Ty");
    AssertTrue(head.kind == ResponseKind::kRtsp, "rtsp kind");
    AssertTrue(!head.complete, "incomplete head");
    AssertTrue(head.Header("cseq") != nullptr, "finished header kept");
    AssertTrue(head.Header("content-ty") == nullptr, "partial header dropped");
  }
  {
    ResponseHead head;
    std::string error;
    AssertTrue(!camscout::discovery::ParseResponseHead("SSH-2.0-OpenSSH\r\n", head, error),
               "non-http prefix must fail");
    AssertTrue(!camscout::discovery::ParseResponseHead("HTTP/1.1 abc\r\n\r\n", head, error),
               "bad status code must fail");
    AssertContains(error, "status");
  }
  {
    const ResponseHead head = ParseOrFail("RTSP/1.0 200 OK\r\nContent-Length: 42\r\n\r\n");
    AssertTrue(head.ContentLength().has_value() && *head.ContentLength() == 42U,
               "content length");
    const ResponseHead bad = ParseOrFail("RTSP/1.0 200 OK\r\nContent-Length: 4x\r\n\r\n");
    AssertTrue(!bad.ContentLength().has_value(), "bad content length");
  }

  // Multipart boundary extraction.
  AssertEq(camscout::discovery::ExtractMultipartBoundary(
               "multipart/x-mixed-replace; boundary=\"myboundary\"")
               .value_or("<none>"),
           std::string("myboundary"), "quoted boundary");
  AssertEq(camscout::discovery::ExtractMultipartBoundary(
               "multipart/x-mixed-replace;Boundary=--frame; charset=x")
               .value_or("<none>"),
           std::string("--frame"), "boundary with dashes");
  AssertTrue(!camscout::discovery::ExtractMultipartBoundary("multipart/x-mixed-replace")
                  .has_value(),
             "missing boundary");
  AssertEq(camscout::discovery::MediaType(" Multipart/X-Mixed-Replace ;boundary=a"),
           std::string("multipart/x-mixed-replace"), "media type");
  AssertTrue(camscout::discovery::ContainsBoundaryMarker("\r\n--frame\r\n", "--frame"),
             "boundary already carrying dashes");
  AssertTrue(camscout::discovery::ContainsBoundaryMarker("--frame\r\n", "frame"),
             "boundary marker");
  AssertTrue(!camscout::discovery::ContainsBoundaryMarker("frame\r\n", "frame"),
             "bare boundary without dashes");

  // MJPEG validation.
  {
    std::string detail;
    const std::string multipart = "HTTP/1.0 200 OK\r\nContent-Type: multipart/x-mixed-replace;"
                                  "boundary=frame\r\n\r\n";
    const ResponseHead head = ParseOrFail(multipart);
    AssertTrue(camscout::discovery::ValidateMjpegResponse(head, "--frame\r\n", detail) ==
                   ValidationVerdict::kValid,
               "multipart with marker");
    AssertTrue(camscout::discovery::ValidateMjpegResponse(head, "", detail) ==
                   ValidationVerdict::kNeedMore,
               "multipart waiting for marker");

    const ResponseHead jpeg = ParseOrFail("HTTP/1.1 200 OK\r\nContent-Type: image/jpeg\r\n\r\n");
    AssertTrue(camscout::discovery::ValidateMjpegResponse(jpeg, std::string("\xFF\xD8\xFF\xE0", 4),
                                                          detail) == ValidationVerdict::kValid,
               "jpeg start-of-image");

    const ResponseHead not_found = ParseOrFail("HTTP/1.1 404 Not Found\r\n\r\n");
    AssertTrue(camscout::discovery::ValidateMjpegResponse(not_found, "", detail) ==
                   ValidationVerdict::kInvalid,
               "404 is invalid");
    AssertContains(detail, "404");

    const ResponseHead html = ParseOrFail("HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n");
    AssertTrue(camscout::discovery::ValidateMjpegResponse(html, "<html>", detail) ==
                   ValidationVerdict::kInvalid,
               "html is invalid");
  }

  // SDP parsing.
  {
    camscout::discovery::SdpSession session;
    std::string error;
    AssertTrue(camscout::discovery::ParseSdp(kSdp, session, error), "valid sdp");
    AssertEq(session.session_name, std::string("Live"), "session name");
    AssertEq(session.media.size(), 2U, "media count");
    AssertTrue(session.HasVideo(), "video media");
    AssertEq(session.media[1].formats.size(), 1U, "video formats");

    AssertTrue(!camscout::discovery::ParseSdp("o=- 1 1 IN IP4 x\r\nv=0\r\n", session, error),
               "sdp must start with v=0");
    AssertTrue(!camscout::discovery::ParseSdp("v=0\r\nm=video\r\n", session, error),
               "short media line");
    AssertTrue(!camscout::discovery::ParseSdp("", session, error), "empty sdp");
  }

  // RTSP DESCRIBE validation.
  {
    std::string detail;
    const std::string prefix = "RTSP/1.0 200 OK\r\nCSeq: 1\r\nContent-Type: application/sdp\r\n";
    const ResponseHead sized =
        ParseOrFail(prefix + "Content-Length: " + std::to_string(kSdp.size()) + "\r\n\r\n");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(sized, kSdp, false, detail) ==
                   ValidationVerdict::kValid,
               "complete describe");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(sized, kSdp.substr(0, 10), false,
                                                         detail) == ValidationVerdict::kNeedMore,
               "short body while open");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(sized, kSdp.substr(0, 10), true,
                                                         detail) == ValidationVerdict::kInvalid,
               "short body after close");

    const ResponseHead unsized = ParseOrFail(prefix + "\r\n");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(unsized, kSdp, true, detail) ==
                   ValidationVerdict::kValid,
               "unsized body ended by close");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(unsized, "v=0\r\n", false, detail) ==
                   ValidationVerdict::kNeedMore,
               "unsized body still arriving");

    const std::string audio_only = "v=0\r\ns=x\r\nm=audio 0 RTP/AVP 0\r\n";
    AssertTrue(camscout::discovery::ValidateRtspDescribe(unsized, audio_only, true, detail) ==
                   ValidationVerdict::kInvalid,
               "audio-only session");
    AssertContains(detail, "video");

    const ResponseHead unauthorized = ParseOrFail("RTSP/1.0 401 Unauthorized\r\nCSeq: 1\r\n\r\n");
    AssertTrue(camscout::discovery::ValidateRtspDescribe(unauthorized, "", true, detail) ==
                   ValidationVerdict::kInvalid,
               "401 is invalid");
  }

  return 0;
}
