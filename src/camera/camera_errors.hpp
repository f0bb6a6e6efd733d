#pragma once

#include <string>
#include <string_view>

namespace picam::camera {

// Stable classification for camera controller failures.
//
// Raw process and OS error strings vary between hosts; callers and scripts
// branch on these codes instead.
enum class CameraErrorCode {
  kNone,
  // Another capture or stream currently owns the device.
  kDeviceBusy,
  // Timeout, dimensions or picture controls are out of range.
  kInvalidSettings,
  // The capture executable could not be started.
  kProcessLaunchFailed,
  // A background stream ended because of a fault rather than a process exit.
  kStreamInterrupted,
};

std::string_view ToStableErrorCode(CameraErrorCode code);

struct CameraError {
  CameraErrorCode code = CameraErrorCode::kNone;
  std::string message;

  bool ok() const {
    return code == CameraErrorCode::kNone;
  }

  void Clear() {
    code = CameraErrorCode::kNone;
    message.clear();
  }
};

CameraError MakeCameraError(CameraErrorCode code, std::string message);

// Returns single-line contract text: "<STABLE_CODE>: <message>".
std::string FormatCameraError(const CameraError& error);

} // namespace picam::camera
