#include "picam/cli/router.hpp"

#include "camera/camera_controller.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "process/posix_process_runner.hpp"

#include <atomic>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace picam::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitEmptyCapture = core::errors::ToInt(core::errors::ExitCode::kEmptyCapture);

constexpr std::chrono::milliseconds kVideoWaitSlice{20};

volatile std::sig_atomic_t g_interrupt_requested = 0;

void HandleInterruptSignal(int /*signal*/) {
  g_interrupt_requested = 1;
}

// Installs the SIGINT handler for one recording and restores the previous
// handler afterwards.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler() {
    g_interrupt_requested = 0;
    previous_ = std::signal(SIGINT, HandleInterruptSignal);
  }
  ~ScopedInterruptHandler() {
    if (previous_ != SIG_ERR) {
      (void)std::signal(SIGINT, previous_);
    }
  }

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

private:
  void (*previous_)(int) = SIG_DFL;
};

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  picam still --out <file> [--width <px>] [--height <px>] [--quality <0-100>] "
         "[--timeout-ms <ms>] [--command <exe>] [--log-level <debug|info|warn|error>]\n"
      << "  picam video --out <file> [--width <px>] [--height <px>] [--framerate <fps>] "
         "[--bitrate <bps>] [--duration-ms <ms>] [--command <exe>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  picam version\n";
}

int ExitCodeFor(const camera::CameraError& error) {
  switch (error.code) {
  case camera::CameraErrorCode::kDeviceBusy:
    return core::errors::ToInt(core::errors::ExitCode::kDeviceBusy);
  case camera::CameraErrorCode::kInvalidSettings:
    return core::errors::ToInt(core::errors::ExitCode::kInvalidSettings);
  case camera::CameraErrorCode::kProcessLaunchFailed:
    return core::errors::ToInt(core::errors::ExitCode::kProcessLaunchFailed);
  case camera::CameraErrorCode::kNone:
  case camera::CameraErrorCode::kStreamInterrupted:
    break;
  }
  return kExitFailure;
}

template <typename T>
bool ParseUnsigned(std::string_view text, std::string_view flag, T& value, std::string& error) {
  T parsed{};
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected a non-negative integer)";
    return false;
  }
  value = parsed;
  return true;
}

bool ParseInt(std::string_view text, std::string_view flag, int& value, std::string& error) {
  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected an integer)";
    return false;
  }
  value = parsed;
  return true;
}

std::optional<std::string> ReadCommandFromEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// Handles options shared by both capture commands. Sets `consumed` (and
// advances `i` past the value) when args[i] is one of them; returns false only
// on a malformed value.
bool ParseCommonOption(const std::vector<std::string_view>& args, std::size_t& i,
                       camera::CaptureSettingsBase& settings, fs::path& output_path,
                       core::logging::LogLevel& log_level, bool& consumed, std::string& error) {
  consumed = false;
  const std::string_view token = args[i];
  const bool takes_value = token == "--out" || token == "--width" || token == "--height" ||
                           token == "--timeout-ms" || token == "--command" ||
                           token == "--log-level";
  if (!takes_value) {
    return true;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(token);
    return false;
  }
  const std::string_view value = args[i + 1];
  consumed = true;
  ++i;

  if (token == "--out") {
    output_path = fs::path(std::string(value));
    return true;
  }
  if (token == "--width") {
    return ParseUnsigned(value, token, settings.width, error);
  }
  if (token == "--height") {
    return ParseUnsigned(value, token, settings.height, error);
  }
  if (token == "--timeout-ms") {
    std::uint32_t timeout = 0;
    if (!ParseUnsigned(value, token, timeout, error)) {
      return false;
    }
    settings.timeout_ms = static_cast<std::int64_t>(timeout);
    return true;
  }
  if (token == "--command") {
    settings.command_override = std::string(value);
    return true;
  }
  return core::logging::ParseLogLevel(value, log_level, error);
}

bool ParseStillOptions(const std::vector<std::string_view>& args, StillOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseCommonOption(args, i, options.settings, options.output_path, options.log_level,
                           consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (token == "--quality") {
      if (i + 1 >= args.size()) {
        error = "missing value for --quality";
        return false;
      }
      if (!ParseInt(args[i + 1], token, options.settings.quality, error)) {
        return false;
      }
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "unexpected argument: " + std::string(token);
    return false;
  }

  if (options.output_path.empty()) {
    error = "still requires --out <file>";
    return false;
  }
  if (!options.settings.command_override.has_value()) {
    options.settings.command_override = ReadCommandFromEnv(kStillCommandEnv);
  }
  return true;
}

bool ParseVideoOptions(const std::vector<std::string_view>& args, VideoOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseCommonOption(args, i, options.settings, options.output_path, options.log_level,
                           consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    if (token == "--framerate" || token == "--bitrate" || token == "--duration-ms") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[i + 1];
      ++i;
      if (token == "--framerate") {
        if (!ParseInt(value, token, options.settings.framerate, error)) {
          return false;
        }
      } else if (token == "--bitrate") {
        if (!ParseUnsigned(value, token, options.settings.bitrate, error)) {
          return false;
        }
      } else {
        std::uint32_t duration_ms = 0;
        if (!ParseUnsigned(value, token, duration_ms, error)) {
          return false;
        }
        options.duration = std::chrono::milliseconds(duration_ms);
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "unexpected argument: " + std::string(token);
    return false;
  }

  if (options.output_path.empty()) {
    error = "video requires --out <file>";
    return false;
  }
  if (!options.settings.command_override.has_value()) {
    options.settings.command_override = ReadCommandFromEnv(kVideoCommandEnv);
  }
  return true;
}

process::PosixProcessRunnerOptions BuildRunnerOptions(core::logging::Logger& logger) {
  process::PosixProcessRunnerOptions options;
  options.on_stderr = [&logger](std::string_view line) {
    logger.Debug("capture process stderr", {{"line", line}});
  };
  return options;
}

std::string FormatFixed3(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "picam 0.1.0\n";
  return kExitSuccess;
}

int CommandStill(const std::vector<std::string_view>& args) {
  StillOptions options;
  std::string error;
  if (!ParseStillOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetComponent("still");
  process::PosixProcessRunner runner(BuildRunnerOptions(logger));
  camera::CameraController controller(runner, logger);

  std::vector<std::uint8_t> image;
  camera::CameraError capture_error;
  if (!controller.CaptureOnce(options.settings, process::CancellationToken(), image,
                              capture_error)) {
    std::cerr << "error: " << camera::FormatCameraError(capture_error) << '\n';
    return ExitCodeFor(capture_error);
  }
  if (image.empty()) {
    std::cerr << "error: capture process produced no image\n";
    return kExitEmptyCapture;
  }

  if (!core::WriteBinaryFileAtomic(options.output_path, image, error)) {
    logger.Error("failed to write picture", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "picture taken: " << options.output_path.string() << '\n'
            << "size: " << image.size() << "B\n";
  return kExitSuccess;
}

int CommandVideo(const std::vector<std::string_view>& args) {
  VideoOptions options;
  std::string error;
  if (!ParseVideoOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (!core::EnsureParentDirectory(options.output_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::ofstream video_file(options.output_path, std::ios::binary | std::ios::trunc);
  if (!video_file) {
    std::cerr << "error: unable to open output file: " << options.output_path.string() << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetComponent("video");
  process::PosixProcessRunner runner(BuildRunnerOptions(logger));
  camera::CameraController controller(runner, logger);

  // Written only by the stream worker; read after StopStream() has joined it.
  std::uint64_t byte_count = 0;
  std::uint64_t callback_count = 0;
  bool write_failed = false;

  std::atomic<bool> stream_done{false};
  std::mutex fault_mu;
  camera::CameraError stream_fault;

  ScopedInterruptHandler interrupt_handler;
  const auto start_time = std::chrono::steady_clock::now();

  camera::CameraError start_error;
  const bool started = controller.StartStream(
      options.settings,
      [&](const std::uint8_t* data, const std::size_t size) {
        ++callback_count;
        byte_count += size;
        video_file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!video_file && !write_failed) {
          write_failed = true;
          stream_done.store(true);
          controller.StopStream();
        }
      },
      [&]() { stream_done.store(true); }, start_error,
      [&](const camera::CameraError& fault) {
        {
          std::lock_guard<std::mutex> lock(fault_mu);
          stream_fault = fault;
        }
        stream_done.store(true);
      });
  if (!started) {
    std::cerr << "error: " << camera::FormatCameraError(start_error) << '\n';
    return ExitCodeFor(start_error);
  }

  std::cout << "recording... press Ctrl+C to stop\n";
  while (!stream_done.load() && g_interrupt_requested == 0) {
    if (options.duration.has_value() &&
        std::chrono::steady_clock::now() - start_time >= options.duration.value()) {
      break;
    }
    std::this_thread::sleep_for(kVideoWaitSlice);
  }

  controller.StopStream();
  video_file.flush();
  const double recorded_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

  {
    std::lock_guard<std::mutex> lock(fault_mu);
    if (!stream_fault.ok()) {
      std::cerr << "error: " << camera::FormatCameraError(stream_fault) << '\n';
      return ExitCodeFor(stream_fault);
    }
  }
  if (write_failed || !video_file) {
    std::cerr << "error: failed while writing video file: " << options.output_path.string()
              << '\n';
    return kExitFailure;
  }

  const double megabytes = static_cast<double>(byte_count) / (1024.0 * 1024.0);
  std::cout << "recording stopped\n"
            << "recorded " << FormatFixed3(megabytes) << "MB\n"
            << callback_count << " callbacks\n"
            << "recorded " << FormatFixed3(recorded_seconds) << " seconds\n"
            << "at " << options.output_path.string() << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "still") {
    return CommandStill(args);
  }

  if (command == "video") {
    return CommandVideo(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace picam::cli
