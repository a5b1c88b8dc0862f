#pragma once

#include "discovery/probe_executor.hpp"
#include "discovery/signature_table.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace camscout::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Engine construction settings. `ports` and `paths` default to the union of
// the signature table's candidate sets.
struct DiscoveryConfig {
  std::string targets = "auto";
  std::set<std::uint16_t> ports;
  std::set<std::string> paths;
  std::set<std::uint16_t> rtsp_ports = {554, 8554};
  std::size_t concurrency = 32U;
  std::chrono::milliseconds probe_timeout{2000};
  std::chrono::milliseconds validation_window{1000};
  std::size_t max_response_bytes = 16384U;
  std::uint64_t max_hosts = 4096U;
  bool rtsp_frame_grab = false;
  std::vector<discovery::ManufacturerSignature> signatures;
};

inline constexpr std::size_t kMinResponseBytes = 512U;
// Upper bound for probe_timeout_ms and validation_window_ms (one hour).
inline constexpr std::uint64_t kMaxDurationMs = 3600000U;

DiscoveryConfig DefaultDiscoveryConfig();

// Parses and validates config JSON on top of DefaultDiscoveryConfig().
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Populates `report.valid` and `report.issues`; parse errors land under `$`.
// - `config` is only updated when `report.valid` is true.
bool ParseDiscoveryConfigText(std::string_view json_text, DiscoveryConfig& config,
                              ValidationReport& report, std::string& error);

// Returns false only when the file cannot be read.
bool LoadDiscoveryConfigFile(const std::filesystem::path& path, DiscoveryConfig& config,
                             ValidationReport& report, std::string& error);

// Comma separated CLI lists, e.g. `80,554` or `/video,/mjpeg`.
bool ParsePortList(std::string_view text, std::set<std::uint16_t>& ports, std::string& error);
bool ParsePathList(std::string_view text, std::set<std::string>& paths, std::string& error);

discovery::ProbeOptions ToProbeOptions(const DiscoveryConfig& config);

} // namespace camscout::config
