#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    std::cerr << "expected to find: " << needle << '\n';
    std::cerr << "actual text: " << text << '\n';
    std::abort();
  }
}

} // namespace

int main() {
  using camscout::events::Event;
  using camscout::events::EventType;

  const fs::path out_dir = fs::temp_directory_path() / "camscout-events-jsonl-smoke";
  std::error_code cleanup_ec;
  fs::remove_all(out_dir, cleanup_ec);

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kScanStarted;
  first.payload = {
      {"scan_id", "1"},
      {"candidates_total", "508"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  second.type = EventType::kCameraUnconfirmed;
  second.payload = {
      {"detail", "no frame boundary '--frame' within the validation window"},
      {"host", "cam \"lobby\""},
  };

  Event third;
  third.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(3'000));
  third.type = EventType::kScanCancelled;
  third.payload = {
      {"scan_id", "1"},
  };

  fs::path written_path;
  std::string error;
  for (const Event* event : {&first, &second, &third}) {
    if (!camscout::events::AppendEventJsonl(*event, out_dir, written_path, error)) {
      Fail("AppendEventJsonl failed: " + error);
    }
  }

  if (written_path != out_dir / "events.jsonl") {
    Fail("unexpected events path: " + written_path.string());
  }

  std::ifstream input(written_path, std::ios::binary);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    lines.push_back(line);
  }
  if (lines.size() != 3U) {
    Fail("expected one line per appended event");
  }

  AssertContains(lines[0], "{\"ts_utc\":\"1970-01-01T00:00:01.000Z\",\"type\":\"SCAN_STARTED\"");
  AssertContains(lines[0], "\"candidates_total\":\"508\"");
  AssertContains(lines[1], "\"type\":\"CAMERA_UNCONFIRMED\"");
  AssertContains(lines[1], "\"host\":\"cam \\\"lobby\\\"\"");
  AssertContains(lines[2], "\"type\":\"SCAN_CANCELLED\"");

  fs::remove_all(out_dir, cleanup_ec);
  return 0;
}
