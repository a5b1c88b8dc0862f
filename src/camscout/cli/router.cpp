#include "camscout/cli/router.hpp"

#include "artifacts/scan_artifacts_writer.hpp"
#include "config/discovery_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/version.hpp"
#include "discovery/candidate_generator.hpp"
#include "discovery/discovery_service.hpp"
#include "discovery/opencv_frame_check.hpp"
#include "discovery/probe_executor.hpp"
#include "discovery/signature_table.hpp"
#include "events/emitter.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace camscout::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitScanPrerequisiteFailed =
    core::errors::ToInt(core::errors::ExitCode::kScanPrerequisiteFailed);

constexpr std::chrono::seconds kScanWaitSlice(1);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camscout scan [--config <file>] [--targets <spec>] [--ports <list>] "
         "[--paths <list>] [--concurrency <n>] [--timeout-ms <n>] [--out <dir>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camscout candidates --targets <spec> [--ports <list>] [--paths <list>] "
         "[--config <file>] [--limit <n>]\n"
      << "  camscout signatures [--config <file>]\n"
      << "  camscout validate <config.json>\n"
      << "  camscout version\n";
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t minimum,
                   std::uint64_t& value, std::string& error,
                   std::uint64_t maximum = std::numeric_limits<std::uint64_t>::max()) {
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) + "'";
    return false;
  }
  if (parsed < minimum) {
    error = std::string(flag) + " must be >= " + std::to_string(minimum);
    return false;
  }
  if (parsed > maximum) {
    error = std::string(flag) + " must be <= " + std::to_string(maximum);
    return false;
  }
  value = parsed;
  return true;
}

// Consumes the value following `args[i]`; advances `i` on success.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

void PrintValidationIssues(std::ostream& out, const fs::path& path,
                           const config::ValidationReport& report) {
  out << "invalid config: " << path.string() << '\n';
  for (const auto& issue : report.issues) {
    out << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Built-in defaults when `path` is unset. Returns an exit code; anything other
// than kExitSuccess has already been reported on stderr.
int LoadConfig(const std::optional<fs::path>& path, config::DiscoveryConfig& config) {
  config = config::DefaultDiscoveryConfig();
  if (!path.has_value()) {
    return kExitSuccess;
  }

  std::string error;
  config::ValidationReport report;
  if (!config::LoadDiscoveryConfigFile(*path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintValidationIssues(std::cerr, *path, report);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

template <typename Container>
std::string JoinValues(const Container& values) {
  std::ostringstream out;
  bool first = true;
  for (const auto& value : values) {
    if (!first) {
      out << ',';
    }
    out << value;
    first = false;
  }
  return out.str();
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camscout " << core::kVersion << '\n';
  std::cout << "opencv_frame_grab: " << discovery::OpenCvFrameCheckStatusText() << " ("
            << discovery::OpenCvFrameCheckDetail() << ")\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path config_path(args.front());
  std::string error;
  config::DiscoveryConfig config;
  config::ValidationReport report;
  if (!config::LoadDiscoveryConfigFile(config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintValidationIssues(std::cerr, config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

// Parse `scan` args. Every flag takes a value; positional args are rejected.
bool ParseScanOptions(const std::vector<std::string_view>& args, ScanOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--targets") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.targets = value;
      continue;
    }
    if (token == "--ports") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.ports = value;
      continue;
    }
    if (token == "--paths") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.paths = value;
      continue;
    }
    if (token == "--concurrency") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, 1U, parsed, error)) {
        return false;
      }
      options.concurrency = parsed;
      continue;
    }
    if (token == "--timeout-ms") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, 1U, parsed, error, config::kMaxDurationMs)) {
        return false;
      }
      options.timeout_ms = parsed;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "scan does not accept positional arguments: " + std::string(token);
    }
    return false;
  }
  return true;
}

// Flag overrides for `scan`; parse failures are usage errors.
bool BuildRescanOverrides(const ScanOptions& options, discovery::RescanOverrides& overrides,
                          std::string& error) {
  if (options.targets.has_value()) {
    overrides.targets = *options.targets;
  }
  if (options.ports.has_value()) {
    std::set<std::uint16_t> ports;
    if (!config::ParsePortList(*options.ports, ports, error)) {
      return false;
    }
    overrides.ports = std::move(ports);
  }
  if (options.paths.has_value()) {
    std::set<std::string> paths;
    if (!config::ParsePathList(*options.paths, paths, error)) {
      return false;
    }
    overrides.paths = std::move(paths);
  }
  if (options.concurrency.has_value()) {
    overrides.concurrency = static_cast<std::size_t>(*options.concurrency);
  }
  if (options.timeout_ms.has_value()) {
    overrides.probe_timeout = std::chrono::milliseconds(*options.timeout_ms);
  }
  return true;
}

void PrintScanReport(const discovery::ScanJob& job,
                     const std::vector<discovery::DiscoveredCamera>& cameras) {
  std::cout << "scan_id: " << job.id << '\n';
  std::cout << "state: " << discovery::ToString(job.state) << '\n';
  std::cout << "candidates_total: " << job.candidates_total << '\n';
  std::cout << "candidates_checked: " << job.candidates_checked << '\n';
  std::cout << "cameras_found: " << job.cameras_found << '\n';
  std::cout << "cameras_unconfirmed: " << job.cameras_unconfirmed << '\n';
  for (const auto& [kind, count] : job.error_counts) {
    std::cout << "errors." << discovery::ToString(kind) << ": " << count << '\n';
  }
  for (const auto& camera : cameras) {
    std::cout << "camera: " << camera.url << " protocol=" << discovery::ToString(camera.protocol)
              << " manufacturer=" << camera.manufacturer << '\n';
  }
}

int CommandScan(const std::vector<std::string_view>& args) {
  ScanOptions options;
  std::string error;
  if (!ParseScanOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteScan(options);
}

struct CandidatesOptions {
  std::optional<fs::path> config_path;
  std::string targets;
  std::optional<std::string> ports;
  std::optional<std::string> paths;
  std::uint64_t limit = std::numeric_limits<std::uint64_t>::max();
};

bool ParseCandidatesOptions(const std::vector<std::string_view>& args,
                            CandidatesOptions& options, std::string& error) {
  bool has_targets = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--targets") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.targets = value;
      has_targets = true;
      continue;
    }
    if (token == "--ports") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.ports = value;
      continue;
    }
    if (token == "--paths") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.paths = value;
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--limit") {
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, 0U, options.limit, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (!has_targets) {
    error = "candidates requires --targets <spec>";
    return false;
  }
  return true;
}

// Dry run: prints the candidate space a scan with the same inputs would probe.
int CommandCandidates(const std::vector<std::string_view>& args) {
  CandidatesOptions options;
  std::string error;
  if (!ParseCandidatesOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::DiscoveryConfig config;
  if (const int code = LoadConfig(options.config_path, config); code != kExitSuccess) {
    return code;
  }
  std::set<std::uint16_t> ports = config.ports;
  if (options.ports.has_value() && !config::ParsePortList(*options.ports, ports, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  std::set<std::string> paths = config.paths;
  if (options.paths.has_value() && !config::ParsePathList(*options.paths, paths, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  discovery::CandidateSpace space;
  if (!discovery::BuildCandidateSpace(options.targets, ports, paths, config.max_hosts, space,
                                      error)) {
    std::cerr << "error: " << error << '\n';
    return kExitScanPrerequisiteFailed;
  }

  const discovery::ProbeOptions probe_options = config::ToProbeOptions(config);
  std::cout << "hosts: " << space.Hosts().Size() << '\n';
  std::cout << "candidates_total: " << space.Size() << '\n';
  for (const auto& candidate : space.Materialize(options.limit)) {
    const discovery::StreamProtocol protocol = discovery::IsRtspCandidate(candidate, probe_options)
                                                   ? discovery::StreamProtocol::kRtsp
                                                   : discovery::StreamProtocol::kMjpeg;
    std::cout << "candidate: " << candidate.index << ' '
              << discovery::BuildStreamUrl(protocol, candidate.host, candidate.port,
                                           candidate.path)
              << '\n';
  }
  if (options.limit < space.Size()) {
    std::cout << "truncated: " << (space.Size() - options.limit) << " more\n";
  }
  return kExitSuccess;
}

int CommandSignatures(const std::vector<std::string_view>& args) {
  std::optional<fs::path> config_path;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string value;
    std::string error;
    if (args[i] == "--config") {
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      config_path = fs::path(value);
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  config::DiscoveryConfig config;
  if (const int code = LoadConfig(config_path, config); code != kExitSuccess) {
    return code;
  }

  const discovery::SignatureTable table(config.signatures);
  for (const auto& signature : table.Signatures()) {
    std::cout << "signature: " << signature.name << '\n';
    std::cout << "  ports: " << JoinValues(signature.candidate_ports) << '\n';
    std::cout << "  paths: " << JoinValues(signature.candidate_paths) << '\n';
    std::cout << "  http_fingerprints: " << JoinValues(signature.http_fingerprints) << '\n';
    std::cout << "  rtsp_fingerprints: " << JoinValues(signature.rtsp_fingerprints) << '\n';
  }
  std::cout << "default_ports: " << JoinValues(config.ports) << '\n';
  std::cout << "default_paths: " << JoinValues(config.paths) << '\n';
  return kExitSuccess;
}

} // namespace

int ExecuteScan(const ScanOptions& options) {
  core::logging::Logger logger(options.log_level);

  config::DiscoveryConfig config;
  if (const int code = LoadConfig(options.config_path, config); code != kExitSuccess) {
    return code;
  }

  std::string error;
  discovery::RescanOverrides overrides;
  if (!BuildRescanOverrides(options, overrides, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  // Events are only recorded when an output directory was requested.
  fs::path events_path;
  std::optional<events::Emitter> emitter;
  std::optional<events::ScanEventRecorder> recorder;
  if (options.output_dir.has_value()) {
    if (!core::EnsureDirectory(*options.output_dir, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    // events.jsonl is append-only; start each scan from an empty timeline.
    std::error_code ec;
    fs::remove(*options.output_dir / "events.jsonl", ec);
    if (ec) {
      std::cerr << "error: failed to reset events.jsonl: " << ec.message() << '\n';
      return kExitFailure;
    }
    emitter.emplace(*options.output_dir, events_path);
    recorder.emplace(*emitter);
  }

  discovery::DiscoveryService service(config, &logger, recorder.has_value() ? &*recorder : nullptr);
  const std::uint64_t scan_id = service.TriggerRescan(overrides);
  logger.SetScanId(std::to_string(scan_id));
  logger.Debug("scan triggered",
               {{"targets", service.BuildScanRequest(overrides).targets},
                {"output_dir", options.output_dir.has_value() ? options.output_dir->string()
                                                               : std::string("-")}});

  while (!service.WaitForScan(scan_id, kScanWaitSlice)) {
  }

  const discovery::ScanJob job = service.CurrentJob();
  const std::vector<discovery::DiscoveredCamera> cameras = service.ListCameras();
  PrintScanReport(job, cameras);

  if (options.output_dir.has_value()) {
    fs::path cameras_path;
    if (!artifacts::WriteCamerasJson(cameras, *options.output_dir, cameras_path, error)) {
      std::cerr << "error: failed to write cameras.json: " << error << '\n';
      return kExitFailure;
    }
    fs::path scan_path;
    if (!artifacts::WriteScanJson(job, *options.output_dir, scan_path, error)) {
      std::cerr << "error: failed to write scan.json: " << error << '\n';
      return kExitFailure;
    }
    if (const std::optional<std::string> event_error = recorder->FirstError();
        event_error.has_value()) {
      std::cerr << "error: failed to write events.jsonl: " << *event_error << '\n';
      return kExitFailure;
    }
    std::cout << "cameras_json: " << cameras_path.string() << '\n';
    std::cout << "scan_json: " << scan_path.string() << '\n';
    std::cout << "events_jsonl: " << events_path.string() << '\n';
  }

  switch (job.state) {
  case discovery::ScanState::kCompleted:
    return kExitSuccess;
  case discovery::ScanState::kFailed:
    std::cerr << "error: scan failed: " << job.failure_reason.value_or("unknown reason") << '\n';
    return kExitScanPrerequisiteFailed;
  default:
    std::cerr << "error: scan ended in state " << discovery::ToString(job.state) << '\n';
    return kExitFailure;
  }
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "scan") {
    return CommandScan(args);
  }

  if (command == "candidates") {
    return CommandCandidates(args);
  }

  if (command == "signatures") {
    return CommandSignatures(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camscout::cli
