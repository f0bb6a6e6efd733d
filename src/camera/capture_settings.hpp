#pragma once

#include "process/process_runner.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace picam::camera {

inline constexpr std::string_view kDefaultStillCommand = "raspistill";
inline constexpr std::string_view kDefaultVideoCommand = "raspivid";

enum class ExposureMode {
  kAuto,
  kNight,
  kNightPreview,
  kBacklight,
  kSpotlight,
  kSports,
  kSnow,
  kBeach,
  kVeryLong,
  kFixedFps,
  kAntiShake,
  kFireworks,
};

enum class WhiteBalanceMode {
  kOff,
  kAuto,
  kSun,
  kCloud,
  kShade,
  kTungsten,
  kFluorescent,
  kIncandescent,
  kFlash,
  kHorizon,
};

enum class ImageEncoding {
  kJpeg,
  kBmp,
  kGif,
  kPng,
};

enum class H264Profile {
  kBaseline,
  kMain,
  kHigh,
};

const char* ToString(ExposureMode mode);
const char* ToString(WhiteBalanceMode mode);
const char* ToString(ImageEncoding encoding);
const char* ToString(H264Profile profile);

// Settings shared by still and video capture.
//
// Picture controls left unset are omitted from the argument list so the
// camera firmware defaults apply.
struct CaptureSettingsBase {
  std::uint32_t width = 640;
  std::uint32_t height = 480;
  // Process-side capture timeout. 0 means "run until stopped" (video only).
  std::int64_t timeout_ms = 300;
  bool display_preview = false;
  bool preview_fullscreen = false;
  std::optional<int> sharpness;   // -100..100
  std::optional<int> contrast;    // -100..100
  std::optional<int> brightness;  // 0..100
  std::optional<int> saturation;  // -100..100
  std::optional<int> iso;         // 100..800
  std::optional<int> exposure_compensation;  // -10..10
  ExposureMode exposure = ExposureMode::kAuto;
  WhiteBalanceMode white_balance = WhiteBalanceMode::kAuto;
  bool flip_horizontally = false;
  bool flip_vertically = false;
  int rotation = 0;
  // Replaces the default executable (tests, non-standard installs).
  std::optional<std::string> command_override;
};

struct StillSettings : CaptureSettingsBase {
  int quality = 90;
  ImageEncoding encoding = ImageEncoding::kJpeg;
  bool raw = false;
};

struct VideoSettings : CaptureSettingsBase {
  VideoSettings() {
    width = 1920;
    height = 1080;
    timeout_ms = 0;
  }

  // Bits per second; 0 keeps the encoder default.
  std::uint32_t bitrate = 0;
  int framerate = 25;
  std::optional<int> keyframe_rate;
  std::optional<int> quantisation;  // 10..40
  H264Profile profile = H264Profile::kHigh;
  // When set the encoder writes to this path instead of stdout, and no stream
  // chunks reach the caller.
  std::optional<std::string> destination;
};

// Field validation. One-shot captures additionally require timeout_ms > 0.
bool ValidateStillSettings(const StillSettings& settings, std::string& error);
bool ValidateVideoSettings(const VideoSettings& settings, std::string& error);

// Pure builders: settings in, executable plus ordered arguments out.
process::ProcessCommand BuildStillCommand(const StillSettings& settings);
process::ProcessCommand BuildVideoCommand(const VideoSettings& settings);

} // namespace picam::camera
