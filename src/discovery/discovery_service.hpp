#pragma once

#include "config/discovery_config.hpp"
#include "core/logging/logger.hpp"
#include "discovery/camera_registry.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "discovery/probe_executor.hpp"
#include "discovery/signature_table.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace camscout::discovery {

// Per-call overrides for TriggerRescan; unset fields fall back to the config
// the service was constructed with.
struct RescanOverrides {
  std::optional<std::string> targets;
  std::optional<std::set<std::uint16_t>> ports;
  std::optional<std::set<std::string>> paths;
  std::optional<std::size_t> concurrency;
  std::optional<std::chrono::milliseconds> probe_timeout;
};

struct ScanStatusView {
  std::uint64_t scan_id = 0;
  ScanState state = ScanState::kIdle;
  std::uint64_t candidates_total = 0;
  std::uint64_t candidates_checked = 0;
  std::uint64_t cameras_found = 0;
};

// The engine's outward face: list, rescan and status over one coordinator and
// registry pair built from a DiscoveryConfig.
class DiscoveryService {
public:
  explicit DiscoveryService(config::DiscoveryConfig config,
                            core::logging::Logger* logger = nullptr,
                            ScanObserver* observer = nullptr);

  // Injects the probe implementation; tests use scripted executors.
  DiscoveryService(config::DiscoveryConfig config, std::shared_ptr<const IProbeExecutor> executor,
                   core::logging::Logger* logger = nullptr, ScanObserver* observer = nullptr);

  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  std::vector<DiscoveredCamera> ListCameras() const;

  // Non-blocking; returns the new job id.
  std::uint64_t TriggerRescan(const RescanOverrides& overrides = {});

  ScanStatusView ScanStatus() const;
  ScanJob CurrentJob() const;

  bool WaitForScan(std::uint64_t scan_id, std::chrono::milliseconds timeout) const;
  void CancelScan();

  const SignatureTable& Signatures() const;
  const config::DiscoveryConfig& Config() const;

  // Request TriggerRescan would issue for `overrides`.
  ScanRequest BuildScanRequest(const RescanOverrides& overrides) const;

private:
  config::DiscoveryConfig config_;
  std::shared_ptr<const SignatureTable> signatures_;
  std::shared_ptr<CameraRegistry> registry_;
  std::unique_ptr<DiscoveryCoordinator> coordinator_;
};

} // namespace camscout::discovery
