#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

TEST_CASE("ParseLogLevel accepts known names case-insensitively", "[core][logging]") {
  using camscout::core::logging::LogLevel;
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(camscout::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(camscout::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(camscout::core::logging::ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(camscout::core::logging::ParseLogLevel("", level, error));
}

TEST_CASE("Logger writes key=value lines with scan correlation", "[core][logging]") {
  std::ostringstream sink;
  camscout::core::logging::Logger logger(camscout::core::logging::LogLevel::kInfo, sink);

  logger.Debug("hidden");
  logger.Info("scan started", {{"candidates_total", "4"}});
  logger.SetScanId("9");
  logger.Warn("probe worker could not be started", {{"error", "say \"no\""}});
  logger.Error("scan failed", {{"scan_id", "3"}, {"reason", "bad\ntargets"}});

  const std::string text = sink.str();
  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find("level=INFO scan_id=\"-\" msg=\"scan started\" candidates_total=\"4\"") !=
          std::string::npos);
  REQUIRE(text.find("level=WARN scan_id=\"9\" msg=\"probe worker could not be started\" "
                    "error=\"say \\\"no\\\"\"") != std::string::npos);
  REQUIRE(text.find("level=ERROR scan_id=\"3\" msg=\"scan failed\" reason=\"bad\\ntargets\"") !=
          std::string::npos);
  REQUIRE(text.find("ts_utc=") == 0U);
}
