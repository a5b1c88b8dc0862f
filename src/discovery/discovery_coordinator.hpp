#pragma once

#include "core/logging/logger.hpp"
#include "discovery/camera_registry.hpp"
#include "discovery/camera_types.hpp"
#include "discovery/candidate_generator.hpp"
#include "discovery/probe_executor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace camscout::discovery {

struct ScanRequest {
  std::string targets;
  std::set<std::uint16_t> ports;
  std::set<std::string> paths;
  std::size_t concurrency = 32U;
  std::chrono::milliseconds probe_timeout{2000};
  std::uint64_t max_hosts = kDefaultMaxHosts;
};

// Scan lifecycle hooks. All calls come from the scan's supervising thread, in
// order: started, zero or more results, finished. A scan that fails before
// generating candidates only reports finished.
class ScanObserver {
public:
  virtual ~ScanObserver() = default;

  virtual void OnScanStarted(const ScanJob& job) {
    (void)job;
  }
  virtual void OnProbeResult(const ScanJob& job, const ProbeResult& result) {
    (void)job;
    (void)result;
  }
  virtual void OnScanFinished(const ScanJob& job) {
    (void)job;
  }
};

// Scan state machine. Owns the current ScanJob and is the only writer of the
// CameraRegistry.
//
// Contract:
// - StartScan() returns at once; a running scan is cancelled first.
// - Status() never waits on probe progress.
// - Results of a cancelled scan never reach the registry.
// - Destruction cancels the current scan and joins every scan thread.
class DiscoveryCoordinator {
public:
  DiscoveryCoordinator(std::shared_ptr<const IProbeExecutor> executor,
                       std::shared_ptr<CameraRegistry> registry,
                       core::logging::Logger* logger = nullptr,
                       ScanObserver* observer = nullptr);
  ~DiscoveryCoordinator();

  DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
  DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

  std::uint64_t StartScan(const ScanRequest& request);

  // Current job; an `idle` job with id 0 before the first scan.
  ScanJob Status() const;

  // No-op when nothing is running.
  void Cancel();

  // Blocks until scan `job_id` has finished (including observer callbacks) or
  // `timeout` expires. False on timeout or for an id that was never issued.
  bool Wait(std::uint64_t job_id, std::chrono::milliseconds timeout) const;

  const CameraRegistry& Registry() const;

private:
  struct ScanRun;

  void Supervise(const std::shared_ptr<ScanRun>& run);
  void FailRun(ScanRun& run, const std::string& reason);
  void CancelRun(ScanRun& run, const char* reason);
  void FinishRun(ScanRun& run);
  void ReapFinishedLocked();
  std::shared_ptr<ScanRun> FindRun(std::uint64_t job_id) const;

  std::shared_ptr<const IProbeExecutor> executor_;
  std::shared_ptr<CameraRegistry> registry_;
  core::logging::Logger* logger_ = nullptr;
  ScanObserver* observer_ = nullptr;

  mutable std::mutex runs_mutex_;
  std::shared_ptr<ScanRun> current_;
  std::vector<std::shared_ptr<ScanRun>> retired_;
  std::uint64_t next_id_ = 1U;
};

} // namespace camscout::discovery
