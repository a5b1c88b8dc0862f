#include "artifacts/scan_artifacts_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/schema/camera_contract.hpp"

namespace fs = std::filesystem;

namespace camscout::artifacts {

bool WriteCamerasJson(const std::vector<discovery::DiscoveredCamera>& cameras,
                      const fs::path& output_dir, fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "cameras.json";
  // Trailing newline keeps the file shell-friendly (`cat`, diffs).
  return core::WriteTextFileAtomic(written_path, core::schema::CameraListToJson(cameras) + "\n",
                                   error);
}

bool WriteScanJson(const discovery::ScanJob& job, const fs::path& output_dir,
                   fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "scan.json";
  return core::WriteTextFileAtomic(written_path, core::schema::ToJson(job) + "\n", error);
}

} // namespace camscout::artifacts
