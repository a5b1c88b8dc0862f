#pragma once

#include "discovery/camera_types.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "events/event_model.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace camscout::events {

// Thin event facade that keeps scan payload contracts in one place while
// writing the shared JSONL format.
class Emitter {
public:
  struct ScanStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t scan_id = 0;
    std::uint64_t candidates_total = 0;
  };

  // CAMERA_CONFIRMED for validated results, CAMERA_UNCONFIRMED for endpoints
  // that answered in a known protocol but did not validate.
  struct ProbeOutcomeEvent {
    std::chrono::system_clock::time_point ts{};
    std::uint64_t scan_id = 0;
    const discovery::ProbeResult* result = nullptr;
  };

  struct ScanFinishedEvent {
    std::chrono::system_clock::time_point ts{};
    const discovery::ScanJob* job = nullptr;
  };

  Emitter(std::filesystem::path output_dir, std::filesystem::path& events_path);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitScanStarted(const ScanStartedEvent& event, std::string& error) const;
  // Results that are neither confirmed nor unconfirmed produce no event.
  bool EmitProbeOutcome(const ProbeOutcomeEvent& event, std::string& error) const;
  bool EmitScanFinished(const ScanFinishedEvent& event, std::string& error) const;

private:
  std::filesystem::path output_dir_;
  std::filesystem::path& events_path_;
};

// Coordinator observer that records the scan timeline through an Emitter.
// Keeps the first write failure; later events are still attempted.
class ScanEventRecorder final : public discovery::ScanObserver {
public:
  explicit ScanEventRecorder(const Emitter& emitter);

  void OnScanStarted(const discovery::ScanJob& job) override;
  void OnProbeResult(const discovery::ScanJob& job, const discovery::ProbeResult& result) override;
  void OnScanFinished(const discovery::ScanJob& job) override;

  std::optional<std::string> FirstError() const;

private:
  void Record(bool ok, const std::string& error);

  const Emitter& emitter_;
  mutable std::mutex mutex_;
  std::optional<std::string> first_error_;
};

} // namespace camscout::events
