#pragma once

namespace camscout::core::errors {

// Process-exit contract for `camscout` subcommands.
//
// 0/1/2 keep their conventional meanings (success, command failure, usage).
// A scan that finds no cameras is still kSuccess; only a scan whose candidate
// space could not be built maps to kScanPrerequisiteFailed.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kScanPrerequisiteFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camscout::core::errors
