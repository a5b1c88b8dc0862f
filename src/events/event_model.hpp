#pragma once

#include <chrono>
#include <map>
#include <string>

namespace camscout::events {

// Scan timeline event categories. String forms are part of the
// `events.jsonl` contract.
enum class EventType {
  kScanStarted,
  kCameraConfirmed,
  kCameraUnconfirmed,
  kScanCompleted,
  kScanCancelled,
  kScanFailed,
};

// Canonical timeline event contract.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: normalized category.
// - `payload`: string key/value attributes; std::map keeps key order stable.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kScanStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace camscout::events
