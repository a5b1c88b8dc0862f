#pragma once

#include <chrono>
#include <string>

namespace camscout::discovery {

// Reports whether the OpenCV RTSP frame grab was compiled into this binary.
bool IsOpenCvFrameCheckEnabled();

// `enabled` or `disabled`.
const char* OpenCvFrameCheckStatusText();

// Human-readable build detail for `camscout version`.
std::string OpenCvFrameCheckDetail();

// Opens `url` with cv::VideoCapture and reads one frame within `budget`.
// Frame content is not inspected. Always fails when OpenCV is not compiled in.
bool GrabFirstFrame(const std::string& url, std::chrono::milliseconds budget, std::string& error);

} // namespace camscout::discovery
