#include "core/schema/camera_contract.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace camscout::core::schema {

std::string ToJson(const discovery::DiscoveredCamera& camera) {
  std::ostringstream out;
  out << "{"
      << "\"host\":" << QuoteJson(camera.host) << ","
      << "\"port\":" << camera.port << ","
      << "\"url\":" << QuoteJson(camera.url) << ","
      << "\"path\":" << QuoteJson(camera.path) << ","
      << "\"protocol\":" << QuoteJson(discovery::ToString(camera.protocol)) << ","
      << "\"manufacturer\":" << QuoteJson(camera.manufacturer) << ","
      << "\"discovered_at_utc\":" << QuoteJson(FormatUtcTimestamp(camera.discovered_at)) << ","
      << "\"last_validated_at_utc\":" << QuoteJson(FormatUtcTimestamp(camera.last_validated_at))
      << "}";
  return out.str();
}

std::string CameraListToJson(const std::vector<discovery::DiscoveredCamera>& cameras) {
  std::ostringstream out;
  out << "{\"cameras_found\":" << cameras.size() << ",\"cameras\":[";
  for (std::size_t i = 0; i < cameras.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << ToJson(cameras[i]);
  }
  out << "]}";
  return out.str();
}

std::string ToJson(const discovery::ScanJob& job) {
  std::ostringstream out;
  out << "{"
      << "\"scan_id\":" << job.id << ","
      << "\"state\":" << QuoteJson(discovery::ToString(job.state)) << ","
      << "\"started_at_utc\":" << QuoteJson(FormatUtcTimestamp(job.started_at)) << ","
      << "\"finished_at_utc\":"
      << (job.finished_at.has_value() ? QuoteJson(FormatUtcTimestamp(*job.finished_at)) : "null")
      << ","
      << "\"candidates_total\":" << job.candidates_total << ","
      << "\"candidates_checked\":" << job.candidates_checked << ","
      << "\"cameras_found\":" << job.cameras_found << ","
      << "\"cameras_unconfirmed\":" << job.cameras_unconfirmed << ","
      << "\"error_counts\":{";
  bool first = true;
  for (const auto& [kind, count] : job.error_counts) {
    if (!first) {
      out << ',';
    }
    out << QuoteJson(discovery::ToString(kind)) << ':' << count;
    first = false;
  }
  out << "},"
      << "\"failure_reason\":"
      << (job.failure_reason.has_value() ? QuoteJson(*job.failure_reason) : "null") << "}";
  return out.str();
}

} // namespace camscout::core::schema
