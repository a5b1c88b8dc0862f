#include "events/emitter.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace camscout::events {

namespace {

EventType ToEventType(const discovery::ScanState state) {
  switch (state) {
  case discovery::ScanState::kCancelled:
    return EventType::kScanCancelled;
  case discovery::ScanState::kFailed:
    return EventType::kScanFailed;
  case discovery::ScanState::kIdle:
  case discovery::ScanState::kRunning:
  case discovery::ScanState::kCompleted:
  default:
    return EventType::kScanCompleted;
  }
}

} // namespace

Emitter::Emitter(std::filesystem::path output_dir, std::filesystem::path& events_path)
    : output_dir_(std::move(output_dir)), events_path_(events_path) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  return AppendEventJsonl(event, output_dir_, events_path_, error);
}

bool Emitter::EmitScanStarted(const ScanStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kScanStarted, event.ts,
                 {
                     {"scan_id", std::to_string(event.scan_id)},
                     {"candidates_total", std::to_string(event.candidates_total)},
                 },
                 error);
}

bool Emitter::EmitProbeOutcome(const ProbeOutcomeEvent& event, std::string& error) const {
  if (event.result == nullptr) {
    error = "probe outcome event requires a result";
    return false;
  }
  const discovery::ProbeResult& result = *event.result;
  const bool confirmed = result.validated;
  if (!confirmed && !discovery::IsUnconfirmed(result)) {
    return true;
  }

  std::map<std::string, std::string> payload = {
      {"scan_id", std::to_string(event.scan_id)},
      {"host", result.candidate.host},
      {"port", std::to_string(result.candidate.port)},
      {"path", result.candidate.path},
      {"protocol", discovery::ToString(result.protocol)},
      {"manufacturer", result.manufacturer.value_or(std::string(discovery::kGenericSignatureName))},
      {"url", result.url},
  };
  if (!confirmed) {
    payload["error_kind"] = result.error.has_value() ? discovery::ToString(*result.error) : "none";
    payload["detail"] = result.detail;
  }
  return EmitRaw(confirmed ? EventType::kCameraConfirmed : EventType::kCameraUnconfirmed, event.ts,
                 std::move(payload), error);
}

bool Emitter::EmitScanFinished(const ScanFinishedEvent& event, std::string& error) const {
  if (event.job == nullptr) {
    error = "scan finished event requires a job";
    return false;
  }
  const discovery::ScanJob& job = *event.job;
  std::map<std::string, std::string> payload = {
      {"scan_id", std::to_string(job.id)},
      {"state", discovery::ToString(job.state)},
      {"candidates_total", std::to_string(job.candidates_total)},
      {"candidates_checked", std::to_string(job.candidates_checked)},
      {"cameras_found", std::to_string(job.cameras_found)},
      {"cameras_unconfirmed", std::to_string(job.cameras_unconfirmed)},
  };
  // Error counts are flattened so the payload stays a flat string map.
  for (const auto& [kind, count] : job.error_counts) {
    payload[std::string("errors.") + discovery::ToString(kind)] = std::to_string(count);
  }
  if (job.failure_reason.has_value()) {
    payload["failure_reason"] = *job.failure_reason;
  }
  return EmitRaw(ToEventType(job.state), event.ts, std::move(payload), error);
}

ScanEventRecorder::ScanEventRecorder(const Emitter& emitter) : emitter_(emitter) {}

void ScanEventRecorder::OnScanStarted(const discovery::ScanJob& job) {
  std::string error;
  const bool ok = emitter_.EmitScanStarted(
      {
          .ts = std::chrono::system_clock::now(),
          .scan_id = job.id,
          .candidates_total = job.candidates_total,
      },
      error);
  Record(ok, error);
}

void ScanEventRecorder::OnProbeResult(const discovery::ScanJob& job,
                                      const discovery::ProbeResult& result) {
  std::string error;
  const bool ok = emitter_.EmitProbeOutcome(
      {
          .ts = result.finished_at,
          .scan_id = job.id,
          .result = &result,
      },
      error);
  Record(ok, error);
}

void ScanEventRecorder::OnScanFinished(const discovery::ScanJob& job) {
  std::string error;
  const bool ok = emitter_.EmitScanFinished(
      {
          .ts = job.finished_at.value_or(std::chrono::system_clock::now()),
          .job = &job,
      },
      error);
  Record(ok, error);
}

std::optional<std::string> ScanEventRecorder::FirstError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return first_error_;
}

void ScanEventRecorder::Record(const bool ok, const std::string& error) {
  if (ok) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!first_error_.has_value()) {
    first_error_ = error;
  }
}

} // namespace camscout::events
