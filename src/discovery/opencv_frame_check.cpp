#include "discovery/opencv_frame_check.hpp"

#include <string>

#if CAMSCOUT_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/core/version.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <limits>
#include <vector>
#endif

namespace camscout::discovery {

bool IsOpenCvFrameCheckEnabled() {
#if CAMSCOUT_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

const char* OpenCvFrameCheckStatusText() {
#if CAMSCOUT_ENABLE_OPENCV
  return "enabled";
#else
  return "disabled";
#endif
}

std::string OpenCvFrameCheckDetail() {
#if CAMSCOUT_ENABLE_OPENCV
  return std::string("RTSP frame grab compiled (OpenCV ") + CV_VERSION + ")";
#else
  return "RTSP frame grab not compiled";
#endif
}

bool GrabFirstFrame(const std::string& url, const std::chrono::milliseconds budget,
                    std::string& error) {
#if CAMSCOUT_ENABLE_OPENCV
  if (budget.count() <= 0) {
    error = "no probe budget left for frame grab";
    return false;
  }
  // VideoCapture timeouts are int milliseconds.
  const int budget_ms = static_cast<int>(
      std::min<std::chrono::milliseconds::rep>(budget.count(), std::numeric_limits<int>::max()));
  const std::vector<int> params = {
      cv::CAP_PROP_OPEN_TIMEOUT_MSEC,
      budget_ms,
      cv::CAP_PROP_READ_TIMEOUT_MSEC,
      budget_ms,
  };

  try {
    cv::VideoCapture capture;
    if (!capture.open(url, cv::CAP_FFMPEG, params)) {
      error = "VideoCapture could not open " + url;
      return false;
    }
    cv::Mat frame;
    const bool read_ok = capture.read(frame);
    capture.release();
    if (!read_ok || frame.empty()) {
      error = "VideoCapture opened " + url + " but returned no frame";
      return false;
    }
  } catch (const cv::Exception& ex) {
    error = std::string("OpenCV error while grabbing frame: ") + ex.what();
    return false;
  }
  return true;
#else
  (void)url;
  (void)budget;
  error = "RTSP frame grab requires a build with CAMSCOUT_ENABLE_OPENCV=ON";
  return false;
#endif
}

} // namespace camscout::discovery
