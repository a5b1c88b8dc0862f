#include "artifacts/scan_artifacts_writer.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using camscout::tests::common::AssertContains;
using camscout::tests::common::AssertNotContains;
using camscout::tests::common::AssertTrue;
using camscout::tests::common::Fail;
using camscout::tests::common::ReadFileToString;

int main() {
  using camscout::discovery::DiscoveredCamera;
  using camscout::discovery::ErrorKind;
  using camscout::discovery::ScanJob;
  using camscout::discovery::ScanState;
  using camscout::discovery::StreamProtocol;

  const auto base =
      std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'000));
  const fs::path out_dir =
      camscout::tests::common::CreateUniqueTempDir("camscout-scan-artifacts-smoke") / "scan";

  std::vector<DiscoveredCamera> cameras = {
      {
          .host = "192.168.1.20",
          .port = 554,
          .path = "/Streaming/Channels/101",
          .url = "rtsp://192.168.1.20:554/Streaming/Channels/101",
          .protocol = StreamProtocol::kRtsp,
          .manufacturer = "hikvision",
          .discovered_at = base,
          .last_validated_at = base + std::chrono::seconds(30),
      },
      {
          .host = "192.168.1.31",
          .port = 8080,
          .path = "/video",
          .url = "http://192.168.1.31:8080/video",
          .protocol = StreamProtocol::kMjpeg,
          .manufacturer = "generic",
          .discovered_at = base,
          .last_validated_at = base,
      },
  };

  fs::path written_path;
  std::string error;
  if (!camscout::artifacts::WriteCamerasJson(cameras, out_dir, written_path, error)) {
    Fail("WriteCamerasJson failed: " + error);
  }
  AssertTrue(written_path == out_dir / "cameras.json", "cameras.json path mismatch");

  const std::string cameras_json = ReadFileToString(written_path);
  AssertContains(cameras_json, "\"cameras_found\":2");
  AssertContains(cameras_json, "\"host\":\"192.168.1.20\"");
  AssertContains(cameras_json, "\"port\":554");
  AssertContains(cameras_json, "\"url\":\"rtsp://192.168.1.20:554/Streaming/Channels/101\"");
  AssertContains(cameras_json, "\"protocol\":\"mjpeg\"");
  AssertContains(cameras_json, "\"manufacturer\":\"hikvision\"");
  AssertContains(cameras_json, "\"discovered_at_utc\":\"2023-11-14T22:13:20.000Z\"");
  AssertContains(cameras_json, "\"last_validated_at_utc\":\"2023-11-14T22:13:50.000Z\"");
  AssertTrue(cameras_json.find("192.168.1.20") < cameras_json.find("192.168.1.31"),
             "cameras must keep snapshot order");
  AssertTrue(!cameras_json.empty() && cameras_json.back() == '\n',
             "cameras.json must end with a newline");

  // Rewriting replaces the previous document in place.
  if (!camscout::artifacts::WriteCamerasJson({}, out_dir, written_path, error)) {
    Fail("WriteCamerasJson(empty) failed: " + error);
  }
  const std::string empty_json = ReadFileToString(written_path);
  AssertContains(empty_json, "{\"cameras_found\":0,\"cameras\":[]}");
  AssertNotContains(empty_json, "192.168.1.20");

  ScanJob job;
  job.id = 3;
  job.state = ScanState::kFailed;
  job.started_at = base;
  job.finished_at = base + std::chrono::milliseconds(250);
  job.failure_reason = "no usable IPv4 interface for \"auto\" targets";
  job.error_counts[ErrorKind::kScanPrerequisiteFailed] = 1;
  if (!camscout::artifacts::WriteScanJson(job, out_dir, written_path, error)) {
    Fail("WriteScanJson failed: " + error);
  }
  AssertTrue(written_path == out_dir / "scan.json", "scan.json path mismatch");

  const std::string scan_json = ReadFileToString(written_path);
  AssertContains(scan_json, "\"scan_id\":3");
  AssertContains(scan_json, "\"state\":\"failed\"");
  AssertContains(scan_json, "\"finished_at_utc\":\"2023-11-14T22:13:20.250Z\"");
  AssertContains(scan_json, "\"error_counts\":{\"scan_prerequisite_failed\":1}");
  AssertContains(scan_json, "\"failure_reason\":\"no usable IPv4 interface for \\\"auto\\\" targets\"");

  ScanJob running;
  running.id = 4;
  running.state = ScanState::kRunning;
  if (!camscout::artifacts::WriteScanJson(running, out_dir, written_path, error)) {
    Fail("WriteScanJson(running) failed: " + error);
  }
  const std::string running_json = ReadFileToString(written_path);
  AssertContains(running_json, "\"finished_at_utc\":null");
  AssertContains(running_json, "\"failure_reason\":null");
  AssertContains(running_json, "\"error_counts\":{}");

  // A regular file where the output directory should be is reported.
  const fs::path blocked = out_dir / "blocked";
  {
    std::ofstream marker(blocked, std::ios::binary);
    marker << "not a directory";
  }
  error.clear();
  if (camscout::artifacts::WriteCamerasJson(cameras, blocked, written_path, error)) {
    Fail("WriteCamerasJson should fail when output_dir is a file");
  }
  AssertTrue(!error.empty(), "write failure must populate error");

  camscout::tests::common::RemovePathBestEffort(out_dir.parent_path());
  std::cout << "scan_artifacts_writer_smoke: ok\n";
  return 0;
}
