#include "camera/capture_settings.hpp"

#include <string>
#include <utility>
#include <vector>

namespace picam::camera {

namespace {

constexpr std::uint32_t kMaxDimension = 4056U;
constexpr std::uint32_t kMaxVideoBitrate = 25'000'000U;

bool CheckRange(const std::optional<int>& value, const int min, const int max,
                std::string_view name, std::string& error) {
  if (!value.has_value()) {
    return true;
  }
  if (value.value() < min || value.value() > max) {
    error = std::string(name) + " must be in [" + std::to_string(min) + ", " +
            std::to_string(max) + "], got " + std::to_string(value.value());
    return false;
  }
  return true;
}

bool ValidateCommon(const CaptureSettingsBase& settings, std::string& error) {
  if (settings.timeout_ms < 0) {
    error = "timeout_ms must be >= 0, got " + std::to_string(settings.timeout_ms);
    return false;
  }
  if (settings.width == 0U || settings.height == 0U) {
    error = "width and height must be positive";
    return false;
  }
  if (settings.width > kMaxDimension || settings.height > kMaxDimension) {
    error = "width and height must not exceed " + std::to_string(kMaxDimension);
    return false;
  }
  if (settings.rotation != 0 && settings.rotation != 90 && settings.rotation != 180 &&
      settings.rotation != 270) {
    error = "rotation must be one of 0, 90, 180, 270";
    return false;
  }
  if (settings.command_override.has_value() && settings.command_override->empty()) {
    error = "command override cannot be empty";
    return false;
  }
  return CheckRange(settings.sharpness, -100, 100, "sharpness", error) &&
         CheckRange(settings.contrast, -100, 100, "contrast", error) &&
         CheckRange(settings.brightness, 0, 100, "brightness", error) &&
         CheckRange(settings.saturation, -100, 100, "saturation", error) &&
         CheckRange(settings.iso, 100, 800, "iso", error) &&
         CheckRange(settings.exposure_compensation, -10, 10, "exposure_compensation", error);
}

void AppendOption(std::vector<std::string>& args, std::string_view flag, std::string value) {
  args.emplace_back(flag);
  args.push_back(std::move(value));
}

void AppendOptional(std::vector<std::string>& args, std::string_view flag,
                    const std::optional<int>& value) {
  if (value.has_value()) {
    AppendOption(args, flag, std::to_string(value.value()));
  }
}

// Shared raspistill/raspivid arguments, in the order the tools document them.
void AppendCommonArguments(const CaptureSettingsBase& settings, std::vector<std::string>& args) {
  AppendOption(args, "-t", std::to_string(settings.timeout_ms));
  AppendOption(args, "-w", std::to_string(settings.width));
  AppendOption(args, "-h", std::to_string(settings.height));

  if (!settings.display_preview) {
    args.emplace_back("-n");
  } else if (settings.preview_fullscreen) {
    args.emplace_back("-f");
  }

  AppendOptional(args, "-sh", settings.sharpness);
  AppendOptional(args, "-co", settings.contrast);
  AppendOptional(args, "-br", settings.brightness);
  AppendOptional(args, "-sa", settings.saturation);
  AppendOptional(args, "-ISO", settings.iso);
  AppendOptional(args, "-ev", settings.exposure_compensation);

  if (settings.exposure != ExposureMode::kAuto) {
    AppendOption(args, "-ex", ToString(settings.exposure));
  }
  if (settings.white_balance != WhiteBalanceMode::kAuto) {
    AppendOption(args, "-awb", ToString(settings.white_balance));
  }
  if (settings.flip_horizontally) {
    args.emplace_back("-hf");
  }
  if (settings.flip_vertically) {
    args.emplace_back("-vf");
  }
  if (settings.rotation != 0) {
    AppendOption(args, "-rot", std::to_string(settings.rotation));
  }
}

} // namespace

const char* ToString(const ExposureMode mode) {
  switch (mode) {
  case ExposureMode::kAuto:
    return "auto";
  case ExposureMode::kNight:
    return "night";
  case ExposureMode::kNightPreview:
    return "nightpreview";
  case ExposureMode::kBacklight:
    return "backlight";
  case ExposureMode::kSpotlight:
    return "spotlight";
  case ExposureMode::kSports:
    return "sports";
  case ExposureMode::kSnow:
    return "snow";
  case ExposureMode::kBeach:
    return "beach";
  case ExposureMode::kVeryLong:
    return "verylong";
  case ExposureMode::kFixedFps:
    return "fixedfps";
  case ExposureMode::kAntiShake:
    return "antishake";
  case ExposureMode::kFireworks:
    return "fireworks";
  }
  return "auto";
}

const char* ToString(const WhiteBalanceMode mode) {
  switch (mode) {
  case WhiteBalanceMode::kOff:
    return "off";
  case WhiteBalanceMode::kAuto:
    return "auto";
  case WhiteBalanceMode::kSun:
    return "sun";
  case WhiteBalanceMode::kCloud:
    return "cloud";
  case WhiteBalanceMode::kShade:
    return "shade";
  case WhiteBalanceMode::kTungsten:
    return "tungsten";
  case WhiteBalanceMode::kFluorescent:
    return "fluorescent";
  case WhiteBalanceMode::kIncandescent:
    return "incandescent";
  case WhiteBalanceMode::kFlash:
    return "flash";
  case WhiteBalanceMode::kHorizon:
    return "horizon";
  }
  return "auto";
}

const char* ToString(const ImageEncoding encoding) {
  switch (encoding) {
  case ImageEncoding::kJpeg:
    return "jpg";
  case ImageEncoding::kBmp:
    return "bmp";
  case ImageEncoding::kGif:
    return "gif";
  case ImageEncoding::kPng:
    return "png";
  }
  return "jpg";
}

const char* ToString(const H264Profile profile) {
  switch (profile) {
  case H264Profile::kBaseline:
    return "baseline";
  case H264Profile::kMain:
    return "main";
  case H264Profile::kHigh:
    return "high";
  }
  return "high";
}

bool ValidateStillSettings(const StillSettings& settings, std::string& error) {
  error.clear();
  if (settings.timeout_ms <= 0) {
    error = "timeout_ms must be > 0 for a still capture, got " +
            std::to_string(settings.timeout_ms);
    return false;
  }
  if (!ValidateCommon(settings, error)) {
    return false;
  }
  if (settings.quality < 0 || settings.quality > 100) {
    error = "quality must be in [0, 100], got " + std::to_string(settings.quality);
    return false;
  }
  return true;
}

bool ValidateVideoSettings(const VideoSettings& settings, std::string& error) {
  error.clear();
  if (!ValidateCommon(settings, error)) {
    return false;
  }
  if (settings.framerate < 2 || settings.framerate > 90) {
    error = "framerate must be in [2, 90], got " + std::to_string(settings.framerate);
    return false;
  }
  if (settings.bitrate > kMaxVideoBitrate) {
    error = "bitrate must not exceed " + std::to_string(kMaxVideoBitrate);
    return false;
  }
  if (settings.destination.has_value() && settings.destination->empty()) {
    error = "destination cannot be empty when set";
    return false;
  }
  return CheckRange(settings.keyframe_rate, 1, 1000, "keyframe_rate", error) &&
         CheckRange(settings.quantisation, 10, 40, "quantisation", error);
}

process::ProcessCommand BuildStillCommand(const StillSettings& settings) {
  process::ProcessCommand command;
  command.command = settings.command_override.value_or(std::string(kDefaultStillCommand));

  auto& args = command.args;
  AppendOption(args, "-o", "-");
  AppendCommonArguments(settings, args);
  AppendOption(args, "-q", std::to_string(settings.quality));
  if (settings.encoding != ImageEncoding::kJpeg) {
    AppendOption(args, "-e", ToString(settings.encoding));
  }
  if (settings.raw) {
    args.emplace_back("-r");
  }
  return command;
}

process::ProcessCommand BuildVideoCommand(const VideoSettings& settings) {
  process::ProcessCommand command;
  command.command = settings.command_override.value_or(std::string(kDefaultVideoCommand));

  auto& args = command.args;
  AppendOption(args, "-o", settings.destination.value_or("-"));
  AppendCommonArguments(settings, args);
  if (settings.bitrate > 0U) {
    AppendOption(args, "-b", std::to_string(settings.bitrate));
  }
  AppendOption(args, "-fps", std::to_string(settings.framerate));
  AppendOptional(args, "-g", settings.keyframe_rate);
  AppendOptional(args, "-qp", settings.quantisation);
  AppendOption(args, "-pf", ToString(settings.profile));
  return command;
}

} // namespace picam::camera
