#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/fake_camera_server.hpp"
#include "../common/temp_dir.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using camscout::tests::common::AssertContains;
using camscout::tests::common::AssertEq;
using camscout::tests::common::AssertNotContains;
using camscout::tests::common::AssertTrue;
using camscout::tests::common::CapturedRun;
using camscout::tests::common::DispatchCaptured;
using camscout::tests::common::FakeCameraServer;
using camscout::tests::common::Fail;
using camscout::tests::common::ReadFileToString;

std::vector<std::string> ReadNonEmptyLines(const fs::path& path) {
  std::istringstream input(ReadFileToString(path));
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::size_t CountLinesWith(const std::vector<std::string>& lines, std::string_view needle) {
  std::size_t count = 0;
  for (const auto& line : lines) {
    if (line.find(needle) != std::string::npos) {
      ++count;
    }
  }
  return count;
}

void ExpectExit(const CapturedRun& run, int expected, const std::string& what) {
  if (run.exit_code != expected) {
    std::cerr << what << ": expected exit " << expected << ", got " << run.exit_code << '\n';
    std::cerr << "stdout: " << run.out << '\n';
    std::cerr << "stderr: " << run.err << '\n';
    std::abort();
  }
}

} // namespace

int main() {
  FakeCameraServer mjpeg(camscout::tests::common::ServeMjpegStream("Server: AXIS Q1615\r\n"));
  FakeCameraServer rtsp(camscout::tests::common::ServeRtspDescribe());
  FakeCameraServer malformed(camscout::tests::common::ServeMalformedRtsp());
  const std::uint16_t refused = camscout::tests::common::UnusedLoopbackPort();

  const fs::path temp_root =
      camscout::tests::common::CreateUniqueTempDir("camscout-cli-scan-smoke");
  const fs::path config_path = temp_root / "scan.json";
  const fs::path out_dir = temp_root / "out";
  {
    std::ofstream config(config_path, std::ios::binary);
    config << "{\n"
           << "  \"targets\": \"127.0.0.1\",\n"
           << "  \"ports\": [" << mjpeg.Port() << ", " << rtsp.Port() << ", "
           << malformed.Port() << ", " << refused << "],\n"
           << "  \"rtsp_ports\": [" << rtsp.Port() << ", " << malformed.Port() << "],\n"
           << "  \"paths\": [\"/mjpeg\"],\n"
           << "  \"probe_timeout_ms\": 1000,\n"
           << "  \"validation_window_ms\": 500\n"
           << "}\n";
  }

  const std::string mjpeg_url = "http://127.0.0.1:" + std::to_string(mjpeg.Port()) + "/mjpeg";
  const std::string rtsp_url = "rtsp://127.0.0.1:" + std::to_string(rtsp.Port()) + "/mjpeg";

  const CapturedRun scan =
      DispatchCaptured({"camscout", "scan", "--config", config_path.string(), "--concurrency",
                        "2", "--out", out_dir.string(), "--log-level", "debug"});
  ExpectExit(scan, 0, "scan against loopback cameras");

  AssertContains(scan.out, "state: completed\n");
  AssertContains(scan.out, "candidates_total: 4\n");
  AssertContains(scan.out, "candidates_checked: 4\n");
  AssertContains(scan.out, "cameras_found: 2\n");
  AssertContains(scan.out, "cameras_unconfirmed: 1\n");
  AssertContains(scan.out, "errors.connect_failed: 1\n");
  AssertContains(scan.out, "errors.validation_failed: 1\n");
  AssertContains(scan.out, "camera: " + mjpeg_url + " protocol=mjpeg manufacturer=axis\n");
  AssertContains(scan.out, "camera: " + rtsp_url + " protocol=rtsp manufacturer=generic\n");
  AssertContains(scan.out, "cameras_json: " + (out_dir / "cameras.json").string());
  AssertContains(scan.out, "scan_json: " + (out_dir / "scan.json").string());
  AssertContains(scan.out, "events_jsonl: " + (out_dir / "events.jsonl").string());

  // Structured logs go to stderr, correlated by scan id.
  AssertContains(scan.err, "level=DEBUG scan_id=\"1\" msg=\"scan triggered\"");
  AssertContains(scan.err, "msg=\"scan started\"");
  AssertContains(scan.err, "msg=\"scan completed\"");
  AssertContains(scan.err, "concurrency=\"2\"");
  AssertNotContains(scan.err, "error:");

  const std::string cameras_json = ReadFileToString(out_dir / "cameras.json");
  AssertContains(cameras_json, "\"cameras_found\":2");
  AssertContains(cameras_json, "\"url\":\"" + mjpeg_url + "\"");
  AssertContains(cameras_json, "\"url\":\"" + rtsp_url + "\"");
  AssertNotContains(cameras_json, std::to_string(malformed.Port()));

  const std::string scan_json = ReadFileToString(out_dir / "scan.json");
  AssertContains(scan_json, "\"scan_id\":1");
  AssertContains(scan_json, "\"state\":\"completed\"");
  AssertContains(scan_json, "\"cameras_unconfirmed\":1");
  AssertContains(scan_json, "\"failure_reason\":null");

  const std::vector<std::string> events = ReadNonEmptyLines(out_dir / "events.jsonl");
  AssertEq(events.size(), 5U, "events: started + 2 confirmed + 1 unconfirmed + completed");
  AssertContains(events.front(), "\"type\":\"SCAN_STARTED\"");
  AssertContains(events.front(), "\"candidates_total\":\"4\"");
  AssertContains(events.back(), "\"type\":\"SCAN_COMPLETED\"");
  AssertContains(events.back(), "\"cameras_found\":\"2\"");
  AssertEq(CountLinesWith(events, "\"type\":\"CAMERA_CONFIRMED\""), 2U, "confirmed events");
  AssertEq(CountLinesWith(events, "\"type\":\"CAMERA_UNCONFIRMED\""), 1U, "unconfirmed events");
  AssertEq(CountLinesWith(events, "\"error_kind\":\"validation_failed\""), 1U,
           "unconfirmed carries its error kind");

  // Rescanning into the same directory starts a fresh timeline; CLI flags
  // narrow the configured port set for this run only.
  const CapturedRun narrowed =
      DispatchCaptured({"camscout", "scan", "--config", config_path.string(), "--ports",
                        std::to_string(mjpeg.Port()), "--out", out_dir.string()});
  ExpectExit(narrowed, 0, "narrowed rescan");
  AssertContains(narrowed.out, "candidates_total: 1\n");
  AssertContains(narrowed.out, "cameras_found: 1\n");
  AssertNotContains(narrowed.out, "errors.");
  AssertNotContains(narrowed.err, "level=DEBUG");

  const std::vector<std::string> narrowed_events = ReadNonEmptyLines(out_dir / "events.jsonl");
  AssertEq(narrowed_events.size(), 3U, "events reset between CLI scans");
  AssertContains(narrowed_events.front(), "\"type\":\"SCAN_STARTED\"");
  AssertContains(narrowed_events[1], "\"url\":\"" + mjpeg_url + "\"");

  const std::string narrowed_cameras = ReadFileToString(out_dir / "cameras.json");
  AssertContains(narrowed_cameras, "\"cameras_found\":1");
  AssertNotContains(narrowed_cameras, rtsp_url);

  mjpeg.Stop();
  rtsp.Stop();
  malformed.Stop();
  camscout::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "cli_scan_smoke: ok\n";
  return 0;
}
