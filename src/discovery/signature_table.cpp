#include "discovery/signature_table.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace camscout::discovery {

namespace {

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::vector<std::string> LowerAll(const std::set<std::string>& fingerprints) {
  std::vector<std::string> lowered;
  lowered.reserve(fingerprints.size());
  for (const auto& fingerprint : fingerprints) {
    if (!fingerprint.empty()) {
      lowered.push_back(ToLowerAscii(fingerprint));
    }
  }
  return lowered;
}

bool ContainsAny(std::string_view haystack, const std::vector<std::string>& needles) {
  return std::any_of(needles.begin(), needles.end(), [haystack](const std::string& needle) {
    return haystack.find(needle) != std::string_view::npos;
  });
}

// Paths and fingerprints below come from vendor documentation defaults and
// the common firmware builds seen on lab networks. The generic entry's paths
// are the usual unbranded MJPEG/RTSP endpoints.
std::vector<ManufacturerSignature> BuiltInSignatures() {
  return {
      {.name = "axis",
       .candidate_ports = {80, 554, 8080},
       .candidate_paths = {"/axis-cgi/mjpg/video.cgi", "/mjpg/video.mjpg",
                           "/axis-media/media.amp"},
       .http_fingerprints = {"Server: AXIS", "axis-cgi", "AXIS Communications"},
       .rtsp_fingerprints = {"Server: AXIS", "axis-media"}},
      {.name = "hikvision",
       .candidate_ports = {80, 554},
       .candidate_paths = {"/ISAPI/Streaming/channels/101/httpPreview",
                           "/Streaming/Channels/101"},
       .http_fingerprints = {"Hikvision", "DNVRS-Webs", "App-webs"},
       .rtsp_fingerprints = {"Hikvision", "HikVision Media Server"}},
      {.name = "dahua",
       .candidate_ports = {80, 554},
       .candidate_paths = {"/cam/realmonitor?channel=1&subtype=0", "/cgi-bin/mjpg/video.cgi"},
       .http_fingerprints = {"Dahua", "DH_WEB"},
       .rtsp_fingerprints = {"Dahua"}},
      {.name = "foscam",
       .candidate_ports = {88, 8080},
       .candidate_paths = {"/videostream.cgi", "/video.cgi"},
       .http_fingerprints = {"Foscam", "Netwave IP Camera"},
       .rtsp_fingerprints = {"Foscam"}},
      {.name = "vivotek",
       .candidate_ports = {80, 554},
       .candidate_paths = {"/video.mjpg", "/live.sdp"},
       .http_fingerprints = {"Vivotek"},
       .rtsp_fingerprints = {"Vivotek"}},
      {.name = "cp_plus",
       .candidate_ports = {80, 554},
       .candidate_paths = {"/cam/realmonitor?channel=1&subtype=0"},
       .http_fingerprints = {"CP Plus", "cpplus", "cp-plus"},
       .rtsp_fingerprints = {"cpplus"}},
      {.name = "mjpg_streamer",
       .candidate_ports = {8080},
       .candidate_paths = {"/?action=stream"},
       .http_fingerprints = {"MJPG-Streamer"},
       .rtsp_fingerprints = {}},
      {.name = "esp32_cam",
       .candidate_ports = {80, 81},
       .candidate_paths = {"/stream", "/mjpeg/1"},
       .http_fingerprints = {"123456789000000000000987654321"},
       .rtsp_fingerprints = {}},
      {.name = std::string(kGenericSignatureName),
       .candidate_ports = {80, 554, 8080, 8081, 8554},
       .candidate_paths = {"/video", "/mjpeg", "/mjpg/video.mjpg", "/video.cgi",
                           "/videostream.cgi", "/live", "/stream",
                           "/cam/realmonitor?channel=1&subtype=0",
                           "/axis-cgi/mjpg/video.cgi", "/cgi-bin/mjpg/video.cgi"},
       .http_fingerprints = {"multipart/x-mixed-replace", "image/jpeg"},
       .rtsp_fingerprints = {"application/sdp", "RTSP/1.0 200"}},
  };
}

} // namespace

SignatureTable::SignatureTable(std::vector<ManufacturerSignature> signatures)
    : signatures_(std::move(signatures)) {
  lowered_.reserve(signatures_.size());
  for (const auto& signature : signatures_) {
    lowered_.push_back({LowerAll(signature.http_fingerprints),
                        LowerAll(signature.rtsp_fingerprints)});
  }
}

SignatureTable SignatureTable::BuiltIn() {
  return SignatureTable(BuiltInSignatures());
}

const std::vector<ManufacturerSignature>& SignatureTable::Signatures() const {
  return signatures_;
}

bool SignatureTable::Empty() const {
  return signatures_.empty();
}

std::optional<SignatureMatch> SignatureTable::MatchHttp(std::string_view response_prefix) const {
  const std::string haystack = ToLowerAscii(response_prefix);
  for (std::size_t i = 0; i < lowered_.size(); ++i) {
    if (ContainsAny(haystack, lowered_[i].http)) {
      return SignatureMatch{.index = i, .name = signatures_[i].name};
    }
  }
  return std::nullopt;
}

std::optional<SignatureMatch> SignatureTable::MatchRtsp(std::string_view response_prefix) const {
  const std::string haystack = ToLowerAscii(response_prefix);
  for (std::size_t i = 0; i < lowered_.size(); ++i) {
    if (ContainsAny(haystack, lowered_[i].rtsp)) {
      return SignatureMatch{.index = i, .name = signatures_[i].name};
    }
  }
  return std::nullopt;
}

std::set<std::uint16_t> SignatureTable::CandidatePorts() const {
  std::set<std::uint16_t> ports;
  for (const auto& signature : signatures_) {
    ports.insert(signature.candidate_ports.begin(), signature.candidate_ports.end());
  }
  return ports;
}

std::set<std::string> SignatureTable::CandidatePaths() const {
  std::set<std::string> paths;
  for (const auto& signature : signatures_) {
    paths.insert(signature.candidate_paths.begin(), signature.candidate_paths.end());
  }
  return paths;
}

bool ValidateSignature(const ManufacturerSignature& signature, std::string& error) {
  if (signature.name.empty()) {
    error = "signature name must not be empty";
    return false;
  }
  const auto has_non_empty = [](const std::set<std::string>& values) {
    return std::any_of(values.begin(), values.end(),
                       [](const std::string& value) { return !value.empty(); });
  };
  if (!has_non_empty(signature.http_fingerprints) && !has_non_empty(signature.rtsp_fingerprints)) {
    error = "signature '" + signature.name + "' needs at least one http or rtsp fingerprint";
    return false;
  }
  if (signature.candidate_ports.count(0U) != 0U) {
    error = "signature '" + signature.name + "' lists port 0";
    return false;
  }
  for (const auto& path : signature.candidate_paths) {
    if (path.empty() || path.front() != '/') {
      error = "signature '" + signature.name + "' path '" + path + "' must start with '/'";
      return false;
    }
  }
  return true;
}

} // namespace camscout::discovery
