#pragma once

#include "camera/capture_settings.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <optional>

namespace picam::cli {

// Parsed `picam still` invocation.
struct StillOptions {
  camera::StillSettings settings;
  std::filesystem::path output_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parsed `picam video` invocation. Without a duration the recording runs
// until SIGINT or until the capture process exits.
struct VideoOptions {
  camera::VideoSettings settings;
  std::filesystem::path output_path;
  std::optional<std::chrono::milliseconds> duration;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Environment overrides for the capture executables. An explicit --command
// flag wins over these.
inline constexpr const char* kStillCommandEnv = "PICAM_STILL_COMMAND";
inline constexpr const char* kVideoCommandEnv = "PICAM_VIDEO_COMMAND";

// Routes `picam` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => camera busy
//   21 => invalid capture settings
//   22 => capture executable could not be started
//   30 => capture process ran but produced no image
int Dispatch(int argc, char** argv);

} // namespace picam::cli
