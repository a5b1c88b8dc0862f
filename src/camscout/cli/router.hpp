#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace camscout::cli {

// Options for `camscout scan`. Unset values fall back to the config file, then
// to the built-in defaults.
struct ScanOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::string> targets;
  std::optional<std::string> ports;
  std::optional<std::string> paths;
  std::optional<std::uint64_t> concurrency;
  std::optional<std::uint64_t> timeout_ms;
  std::optional<std::filesystem::path> output_dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs one scan to completion through DiscoveryService and prints status and
// cameras. Shared by the `scan` subcommand and end-to-end tests.
int ExecuteScan(const ScanOptions& options);

// Routes `camscout` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file failed validation
//   20 => scan could not build its candidate space
int Dispatch(int argc, char** argv);

} // namespace camscout::cli
