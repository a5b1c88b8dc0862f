#include "config/discovery_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <utility>

namespace camscout::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kKnownKeys[] = {
    "targets",
    "ports",
    "rtsp_ports",
    "paths",
    "concurrency",
    "probe_timeout_ms",
    "validation_window_ms",
    "max_response_bytes",
    "max_hosts",
    "rtsp_frame_grab",
    "signatures",
};

constexpr std::string_view kSignatureKeys[] = {
    "name", "ports", "paths", "http_fingerprints", "rtsp_fingerprints",
};

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string_view Trim(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
    raw.remove_suffix(1);
  }
  return raw;
}

template <std::size_t N>
void ReportUnknownKeys(const JsonValue& object, const std::string_view (&known)[N],
                       const std::string& prefix, ValidationReport& report) {
  for (const auto& [key, value] : object.object_value) {
    (void)value;
    if (std::find(std::begin(known), std::end(known), key) == std::end(known)) {
      AddIssue(report, prefix + key, "is not a recognized key");
    }
  }
}

bool ReadPositiveInteger(const JsonValue& root, std::string_view key, std::uint64_t minimum,
                         std::uint64_t& out, ValidationReport& report,
                         std::uint64_t maximum = std::numeric_limits<std::uint64_t>::max()) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr) {
    return false;
  }
  std::uint64_t value = 0;
  if (!field->AsUint64(value)) {
    AddIssue(report, std::string(key), "must be a non-negative integer");
    return false;
  }
  if (value < minimum) {
    AddIssue(report, std::string(key), "must be >= " + std::to_string(minimum));
    return false;
  }
  if (value > maximum) {
    AddIssue(report, std::string(key), "must be <= " + std::to_string(maximum));
    return false;
  }
  out = value;
  return true;
}

bool ReadPortArray(const JsonValue& field, const std::string& path, std::set<std::uint16_t>& out,
                   ValidationReport& report) {
  if (!field.IsArray()) {
    AddIssue(report, path, "must be an array of port numbers");
    return false;
  }
  bool ok = true;
  std::set<std::uint16_t> ports;
  for (std::size_t i = 0; i < field.array_value.size(); ++i) {
    std::uint64_t port = 0;
    if (!field.array_value[i].AsUint64(port) || port == 0U || port > 65535U) {
      AddIssue(report, path + "[" + std::to_string(i) + "]", "must be an integer in 1..65535");
      ok = false;
      continue;
    }
    ports.insert(static_cast<std::uint16_t>(port));
  }
  if (ok) {
    out = std::move(ports);
  }
  return ok;
}

bool ReadStringArray(const JsonValue& field, const std::string& path, std::set<std::string>& out,
                     ValidationReport& report) {
  if (!field.IsArray()) {
    AddIssue(report, path, "must be an array of strings");
    return false;
  }
  bool ok = true;
  std::set<std::string> values;
  for (std::size_t i = 0; i < field.array_value.size(); ++i) {
    const JsonValue& entry = field.array_value[i];
    if (!entry.IsString() || entry.string_value.empty()) {
      AddIssue(report, path + "[" + std::to_string(i) + "]", "must be a non-empty string");
      ok = false;
      continue;
    }
    values.insert(entry.string_value);
  }
  if (ok) {
    out = std::move(values);
  }
  return ok;
}

void ReadSignatures(const JsonValue& field, std::vector<discovery::ManufacturerSignature>& out,
                    ValidationReport& report) {
  if (!field.IsArray() || field.array_value.empty()) {
    AddIssue(report, "signatures", "must be a non-empty array of signature objects");
    return;
  }

  std::vector<discovery::ManufacturerSignature> signatures;
  std::set<std::string> names;
  for (std::size_t i = 0; i < field.array_value.size(); ++i) {
    const std::string prefix = "signatures[" + std::to_string(i) + "]";
    const JsonValue& entry = field.array_value[i];
    if (!entry.IsObject()) {
      AddIssue(report, prefix, "must be an object");
      continue;
    }
    ReportUnknownKeys(entry, kSignatureKeys, prefix + ".", report);

    discovery::ManufacturerSignature signature;
    const JsonValue* name = entry.Find("name");
    if (name == nullptr || !name->IsString()) {
      AddIssue(report, prefix + ".name", "is required and must be a string");
      continue;
    }
    signature.name = name->string_value;
    if (!names.insert(signature.name).second) {
      AddIssue(report, prefix + ".name", "duplicates an earlier signature name");
    }

    bool ok = true;
    if (const JsonValue* ports = entry.Find("ports"); ports != nullptr) {
      ok = ReadPortArray(*ports, prefix + ".ports", signature.candidate_ports, report) && ok;
    }
    if (const JsonValue* paths = entry.Find("paths"); paths != nullptr) {
      ok = ReadStringArray(*paths, prefix + ".paths", signature.candidate_paths, report) && ok;
    }
    if (const JsonValue* http = entry.Find("http_fingerprints"); http != nullptr) {
      ok = ReadStringArray(*http, prefix + ".http_fingerprints", signature.http_fingerprints,
                           report) &&
           ok;
    }
    if (const JsonValue* rtsp = entry.Find("rtsp_fingerprints"); rtsp != nullptr) {
      ok = ReadStringArray(*rtsp, prefix + ".rtsp_fingerprints", signature.rtsp_fingerprints,
                           report) &&
           ok;
    }
    if (!ok) {
      continue;
    }

    std::string signature_error;
    if (!discovery::ValidateSignature(signature, signature_error)) {
      AddIssue(report, prefix, signature_error);
      continue;
    }
    signatures.push_back(std::move(signature));
  }
  out = std::move(signatures);
}

} // namespace

DiscoveryConfig DefaultDiscoveryConfig() {
  DiscoveryConfig config;
  const discovery::SignatureTable table = discovery::SignatureTable::BuiltIn();
  config.signatures = table.Signatures();
  config.ports = table.CandidatePorts();
  config.paths = table.CandidatePaths();
  return config;
}

bool ParseDiscoveryConfigText(std::string_view json_text, DiscoveryConfig& config,
                              ValidationReport& report, std::string& error) {
  (void)error;
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", "invalid JSON: " + parse_error);
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    return true;
  }
  ReportUnknownKeys(root, kKnownKeys, "", report);

  DiscoveryConfig parsed = DefaultDiscoveryConfig();

  if (const JsonValue* signatures = root.Find("signatures"); signatures != nullptr) {
    ReadSignatures(*signatures, parsed.signatures, report);
    const discovery::SignatureTable table(parsed.signatures);
    parsed.ports = table.CandidatePorts();
    parsed.paths = table.CandidatePaths();
  }

  if (const JsonValue* targets = root.Find("targets"); targets != nullptr) {
    if (!targets->IsString()) {
      AddIssue(report, "targets", "must be a string (CIDR, range, host list or \"auto\")");
    } else {
      parsed.targets = targets->string_value;
    }
  }
  if (const JsonValue* ports = root.Find("ports"); ports != nullptr) {
    (void)ReadPortArray(*ports, "ports", parsed.ports, report);
  }
  if (const JsonValue* rtsp_ports = root.Find("rtsp_ports"); rtsp_ports != nullptr) {
    (void)ReadPortArray(*rtsp_ports, "rtsp_ports", parsed.rtsp_ports, report);
  }
  if (const JsonValue* paths = root.Find("paths"); paths != nullptr) {
    (void)ReadStringArray(*paths, "paths", parsed.paths, report);
  }

  std::uint64_t value = 0;
  if (ReadPositiveInteger(root, "concurrency", 1U, value, report)) {
    parsed.concurrency = static_cast<std::size_t>(value);
  }
  if (ReadPositiveInteger(root, "probe_timeout_ms", 1U, value, report, kMaxDurationMs)) {
    parsed.probe_timeout = std::chrono::milliseconds(value);
  }
  if (ReadPositiveInteger(root, "validation_window_ms", 1U, value, report, kMaxDurationMs)) {
    parsed.validation_window = std::chrono::milliseconds(value);
  }
  if (ReadPositiveInteger(root, "max_response_bytes", kMinResponseBytes, value, report)) {
    parsed.max_response_bytes = static_cast<std::size_t>(value);
  }
  if (ReadPositiveInteger(root, "max_hosts", 1U, value, report)) {
    parsed.max_hosts = value;
  }
  if (const JsonValue* frame_grab = root.Find("rtsp_frame_grab"); frame_grab != nullptr) {
    if (!frame_grab->IsBool()) {
      AddIssue(report, "rtsp_frame_grab", "must be a boolean");
    } else {
      parsed.rtsp_frame_grab = frame_grab->bool_value;
    }
  }

  report.valid = report.issues.empty();
  if (report.valid) {
    config = std::move(parsed);
  }
  return true;
}

bool LoadDiscoveryConfigFile(const std::filesystem::path& path, DiscoveryConfig& config,
                             ValidationReport& report, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }
  return ParseDiscoveryConfigText(contents, config, report, error);
}

bool ParsePortList(std::string_view text, std::set<std::uint16_t>& ports, std::string& error) {
  std::set<std::uint16_t> parsed;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t comma = text.find(',', start);
    const std::size_t stop = comma == std::string_view::npos ? text.size() : comma;
    const std::string_view item = Trim(text.substr(start, stop - start));
    if (!item.empty()) {
      unsigned int port = 0;
      const auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), port);
      if (ec != std::errc() || ptr != item.data() + item.size() || port == 0U || port > 65535U) {
        error = "invalid port '" + std::string(item) + "' (expected 1-65535)";
        return false;
      }
      parsed.insert(static_cast<std::uint16_t>(port));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1U;
  }
  ports = std::move(parsed);
  return true;
}

bool ParsePathList(std::string_view text, std::set<std::string>& paths, std::string& error) {
  std::set<std::string> parsed;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t comma = text.find(',', start);
    const std::size_t stop = comma == std::string_view::npos ? text.size() : comma;
    const std::string_view item = Trim(text.substr(start, stop - start));
    if (!item.empty()) {
      if (std::any_of(item.begin(), item.end(),
                      [](unsigned char c) { return std::isspace(c) != 0; })) {
        error = "path '" + std::string(item) + "' must not contain whitespace";
        return false;
      }
      parsed.insert(item.front() == '/' ? std::string(item) : "/" + std::string(item));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1U;
  }
  paths = std::move(parsed);
  return true;
}

discovery::ProbeOptions ToProbeOptions(const DiscoveryConfig& config) {
  discovery::ProbeOptions options;
  options.rtsp_ports = config.rtsp_ports;
  options.max_response_bytes = config.max_response_bytes;
  options.validation_window = config.validation_window;
  options.rtsp_frame_grab = config.rtsp_frame_grab;
  return options;
}

} // namespace camscout::config
