#pragma once

#include "discovery/camera_types.hpp"

#include <string>
#include <vector>

namespace camscout::core::schema {

// One camera object:
// {"host","port","url","path","protocol","manufacturer","discovered_at_utc",
//  "last_validated_at_utc"}
std::string ToJson(const discovery::DiscoveredCamera& camera);

// `cameras.json` document: {"cameras_found":N,"cameras":[...]} in snapshot
// order.
std::string CameraListToJson(const std::vector<discovery::DiscoveredCamera>& cameras);

// `scan.json` document. Unset `finished_at` and `failure_reason` serialize as
// null; `error_counts` keys use the stable error kind names.
std::string ToJson(const discovery::ScanJob& job);

} // namespace camscout::core::schema
