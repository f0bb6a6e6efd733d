#include "camera/camera_errors.hpp"

#include <utility>

namespace picam::camera {

std::string_view ToStableErrorCode(const CameraErrorCode code) {
  switch (code) {
  case CameraErrorCode::kNone:
    return "OK";
  case CameraErrorCode::kDeviceBusy:
    return "DEVICE_BUSY";
  case CameraErrorCode::kInvalidSettings:
    return "INVALID_SETTINGS";
  case CameraErrorCode::kProcessLaunchFailed:
    return "PROCESS_LAUNCH_FAILED";
  case CameraErrorCode::kStreamInterrupted:
    return "STREAM_INTERRUPTED";
  }
  return "UNKNOWN";
}

CameraError MakeCameraError(const CameraErrorCode code, std::string message) {
  CameraError error;
  error.code = code;
  error.message = std::move(message);
  return error;
}

std::string FormatCameraError(const CameraError& error) {
  std::string text(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

} // namespace picam::camera
