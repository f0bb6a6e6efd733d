#pragma once

namespace picam::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values mirror camera error classes so wrappers can tell a
// busy device from a missing executable without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDeviceBusy = 20,
  kInvalidSettings = 21,
  kProcessLaunchFailed = 22,
  kEmptyCapture = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace picam::core::errors
