#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace camscout::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kScanStarted:
    return "SCAN_STARTED";
  case EventType::kCameraConfirmed:
    return "CAMERA_CONFIRMED";
  case EventType::kCameraUnconfirmed:
    return "CAMERA_UNCONFIRMED";
  case EventType::kScanCompleted:
    return "SCAN_COMPLETED";
  case EventType::kScanCancelled:
    return "SCAN_CANCELLED";
  case EventType::kScanFailed:
    return "SCAN_FAILED";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":\"" << core::FormatUtcTimestamp(event.ts) << "\","
      << "\"type\":\"" << ToJson(event.type) << "\","
      << "\"payload\":{";

  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace camscout::events
