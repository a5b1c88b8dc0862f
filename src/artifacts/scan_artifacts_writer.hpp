#pragma once

#include "discovery/camera_types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace camscout::artifacts {

// Emits `cameras.json` (registry snapshot) for a scan output directory.
//
// Contract:
// - Creates `output_dir` if needed.
// - Publishes `<output_dir>/cameras.json` atomically (temp file + rename).
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`.
bool WriteCamerasJson(const std::vector<discovery::DiscoveredCamera>& cameras,
                      const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

// Emits `scan.json` (final ScanJob state) with the same contract.
bool WriteScanJson(const discovery::ScanJob& job, const std::filesystem::path& output_dir,
                   std::filesystem::path& written_path, std::string& error);

} // namespace camscout::artifacts
