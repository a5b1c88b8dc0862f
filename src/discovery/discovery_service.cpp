#include "discovery/discovery_service.hpp"

#include <utility>

namespace camscout::discovery {

DiscoveryService::DiscoveryService(config::DiscoveryConfig config, core::logging::Logger* logger,
                                   ScanObserver* observer)
    : config_(std::move(config)),
      signatures_(std::make_shared<const SignatureTable>(config_.signatures)),
      registry_(std::make_shared<CameraRegistry>()) {
  coordinator_ = std::make_unique<DiscoveryCoordinator>(
      std::make_shared<const TcpProbeExecutor>(signatures_, config::ToProbeOptions(config_)),
      registry_, logger, observer);
}

DiscoveryService::DiscoveryService(config::DiscoveryConfig config,
                                   std::shared_ptr<const IProbeExecutor> executor,
                                   core::logging::Logger* logger, ScanObserver* observer)
    : config_(std::move(config)),
      signatures_(std::make_shared<const SignatureTable>(config_.signatures)),
      registry_(std::make_shared<CameraRegistry>()),
      coordinator_(std::make_unique<DiscoveryCoordinator>(std::move(executor), registry_, logger,
                                                          observer)) {}

std::vector<DiscoveredCamera> DiscoveryService::ListCameras() const {
  return registry_->SnapshotCopy();
}

ScanRequest DiscoveryService::BuildScanRequest(const RescanOverrides& overrides) const {
  ScanRequest request;
  request.targets = overrides.targets.value_or(config_.targets);
  request.ports = overrides.ports.value_or(config_.ports);
  request.paths = overrides.paths.value_or(config_.paths);
  request.concurrency = overrides.concurrency.value_or(config_.concurrency);
  request.probe_timeout = overrides.probe_timeout.value_or(config_.probe_timeout);
  request.max_hosts = config_.max_hosts;
  return request;
}

std::uint64_t DiscoveryService::TriggerRescan(const RescanOverrides& overrides) {
  return coordinator_->StartScan(BuildScanRequest(overrides));
}

ScanStatusView DiscoveryService::ScanStatus() const {
  const ScanJob job = coordinator_->Status();
  return ScanStatusView{
      .scan_id = job.id,
      .state = job.state,
      .candidates_total = job.candidates_total,
      .candidates_checked = job.candidates_checked,
      .cameras_found = job.cameras_found,
  };
}

ScanJob DiscoveryService::CurrentJob() const {
  return coordinator_->Status();
}

bool DiscoveryService::WaitForScan(const std::uint64_t scan_id,
                                   const std::chrono::milliseconds timeout) const {
  return coordinator_->Wait(scan_id, timeout);
}

void DiscoveryService::CancelScan() {
  coordinator_->Cancel();
}

const SignatureTable& DiscoveryService::Signatures() const {
  return *signatures_;
}

const config::DiscoveryConfig& DiscoveryService::Config() const {
  return config_;
}

} // namespace camscout::discovery
