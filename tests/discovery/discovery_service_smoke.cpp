#include "config/discovery_config.hpp"
#include "discovery/discovery_service.hpp"

#include "../common/assertions.hpp"
#include "../common/fake_camera_server.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>

namespace {

using camscout::discovery::DiscoveryService;
using camscout::discovery::RescanOverrides;
using camscout::discovery::ScanState;
using camscout::discovery::StreamProtocol;
using camscout::tests::common::AssertContains;
using camscout::tests::common::AssertEq;
using camscout::tests::common::AssertTrue;
using camscout::tests::common::FakeCameraServer;
using camscout::tests::common::Fail;

constexpr std::chrono::seconds kWaitBudget(15);

void RunScan(DiscoveryService& service, const RescanOverrides& overrides = {}) {
  const std::uint64_t id = service.TriggerRescan(overrides);
  if (!service.WaitForScan(id, kWaitBudget)) {
    Fail("scan did not finish");
  }
}

} // namespace

int main() {
  FakeCameraServer mjpeg(camscout::tests::common::ServeMjpegStream("Server: AXIS Q1615\r\n"));
  FakeCameraServer rtsp(camscout::tests::common::ServeRtspDescribe());
  FakeCameraServer silent(camscout::tests::common::ServeSilence());
  const std::uint16_t refused = camscout::tests::common::UnusedLoopbackPort();

  camscout::config::DiscoveryConfig config = camscout::config::DefaultDiscoveryConfig();
  config.targets = "127.0.0.1";
  config.ports = {mjpeg.Port(), rtsp.Port(), silent.Port(), refused};
  config.rtsp_ports = {rtsp.Port()};
  config.paths = {"/mjpeg"};
  config.concurrency = 4;
  config.probe_timeout = std::chrono::milliseconds(500);
  config.validation_window = std::chrono::milliseconds(300);

  std::ostringstream log_sink;
  camscout::core::logging::Logger logger(camscout::core::logging::LogLevel::kDebug, log_sink);
  DiscoveryService service(config, &logger);

  // Nothing has run yet.
  AssertTrue(service.ScanStatus().state == ScanState::kIdle, "idle before first scan");
  AssertTrue(service.ListCameras().empty(), "no cameras before first scan");
  service.CancelScan();
  AssertTrue(!service.Signatures().Empty(), "built-in signatures loaded");

  RunScan(service);
  {
    const auto status = service.ScanStatus();
    AssertTrue(status.state == ScanState::kCompleted, "first scan completed");
    AssertEq(status.candidates_total, 4U, "first scan total");
    AssertEq(status.candidates_checked, 4U, "first scan checked");
    AssertEq(status.cameras_found, 2U, "first scan found");

    const auto job = service.CurrentJob();
    AssertEq(job.error_counts.at(camscout::discovery::ErrorKind::kConnectFailed), 1U,
             "refused port counted");
    AssertEq(job.error_counts.at(camscout::discovery::ErrorKind::kTimeout), 1U,
             "silent port counted");

    const auto cameras = service.ListCameras();
    AssertEq(cameras.size(), 2U, "two cameras listed");
    bool saw_mjpeg = false;
    bool saw_rtsp = false;
    for (const auto& camera : cameras) {
      if (camera.port == mjpeg.Port()) {
        saw_mjpeg = true;
        AssertTrue(camera.protocol == StreamProtocol::kMjpeg, "mjpeg camera protocol");
        AssertEq(camera.manufacturer, std::string("axis"), "mjpeg camera vendor");
      } else if (camera.port == rtsp.Port()) {
        saw_rtsp = true;
        AssertTrue(camera.protocol == StreamProtocol::kRtsp, "rtsp camera protocol");
        AssertEq(camera.url, "rtsp://127.0.0.1:" + std::to_string(rtsp.Port()) + "/mjpeg",
                 "rtsp camera url");
      } else {
        Fail("unexpected camera port " + std::to_string(camera.port));
      }
    }
    AssertTrue(saw_mjpeg && saw_rtsp, "both cameras listed");
  }

  // Overrides narrow one rescan without changing the service config.
  {
    RescanOverrides overrides;
    overrides.ports = std::set<std::uint16_t>{mjpeg.Port()};
    overrides.concurrency = 1;
    const auto request = service.BuildScanRequest(overrides);
    AssertEq(request.targets, std::string("127.0.0.1"), "targets from config");
    AssertEq(request.ports.size(), 1U, "ports from override");
    AssertEq(request.concurrency, 1U, "concurrency from override");
    AssertEq(request.probe_timeout.count(), 500, "timeout from config");

    RunScan(service, overrides);
    const auto cameras = service.ListCameras();
    AssertEq(cameras.size(), 1U, "rtsp camera pruned by narrower rescan");
    AssertEq(cameras[0].port, mjpeg.Port(), "mjpeg camera kept");
    AssertEq(service.Config().ports.size(), 4U, "service config untouched");
  }

  const std::string logs = log_sink.str();
  AssertContains(logs, "msg=\"scan started\"");
  AssertContains(logs, "msg=\"scan completed\"");
  AssertContains(logs, "scan_id=\"2\"");

  return 0;
}
