#include "camera/camera_controller.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace picam::camera {

namespace {

// Returns the device to kIdle when the owning operation leaves scope,
// whichever way it leaves. Transfer() hands the obligation to another owner
// (the stream worker).
class DeviceLease {
public:
  explicit DeviceLease(std::atomic<SessionState>& state) : state_(state) {}
  ~DeviceLease() {
    if (owned_) {
      state_.store(SessionState::kIdle, std::memory_order_release);
    }
  }

  DeviceLease(const DeviceLease&) = delete;
  DeviceLease& operator=(const DeviceLease&) = delete;

  void Transfer() {
    owned_ = false;
  }

private:
  std::atomic<SessionState>& state_;
  bool owned_ = true;
};

// Clears the worker thread id before the lease releases the device.
class WorkerThreadMark {
public:
  explicit WorkerThreadMark(std::atomic<std::thread::id>& id) : id_(id) {}
  ~WorkerThreadMark() {
    id_.store(std::thread::id());
  }

  WorkerThreadMark(const WorkerThreadMark&) = delete;
  WorkerThreadMark& operator=(const WorkerThreadMark&) = delete;

private:
  std::atomic<std::thread::id>& id_;
};

CameraError BusyError(std::string_view operation) {
  return MakeCameraError(CameraErrorCode::kDeviceBusy,
                         "cannot " + std::string(operation) +
                             " because the camera is currently busy");
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kIdle:
    return "idle";
  case SessionState::kBusy:
    return "busy";
  }
  return "idle";
}

CameraController::CameraController(process::IProcessRunner& runner,
                                   core::logging::Logger& logger)
    : runner_(runner), logger_(logger) {}

CameraController::~CameraController() {
  StopStream();
}

bool CameraController::IsBusy() const {
  return state() == SessionState::kBusy;
}

SessionState CameraController::state() const {
  return state_.load(std::memory_order_acquire);
}

bool CameraController::TryAcquire() {
  SessionState expected = SessionState::kIdle;
  return state_.compare_exchange_strong(expected, SessionState::kBusy, std::memory_order_acq_rel,
                                        std::memory_order_acquire);
}

bool CameraController::CaptureOnce(const StillSettings& settings,
                                   const process::CancellationToken& cancel,
                                   std::vector<std::uint8_t>& image, CameraError& error) {
  image.clear();
  error.Clear();

  if (IsBusy()) {
    error = BusyError("capture a still image");
    logger_.Warn("still capture rejected", {{"error", FormatCameraError(error)}});
    return false;
  }

  std::string validation_error;
  if (!ValidateStillSettings(settings, validation_error)) {
    error = MakeCameraError(CameraErrorCode::kInvalidSettings, validation_error);
    logger_.Warn("still capture rejected", {{"error", FormatCameraError(error)}});
    return false;
  }

  if (!TryAcquire()) {
    error = BusyError("capture a still image");
    logger_.Warn("still capture rejected", {{"error", FormatCameraError(error)}});
    return false;
  }
  DeviceLease lease(state_);

  const process::ProcessCommand command = BuildStillCommand(settings);
  logger_.Debug("still capture started", {{"command", process::FormatCommandLine(command)}});

  std::vector<std::uint8_t> buffer;
  int exit_code = -1;
  std::string run_error;
  const bool launched = runner_.Run(
      command,
      [&buffer](const std::uint8_t* data, const std::size_t size) {
        buffer.insert(buffer.end(), data, data + size);
      },
      cancel, exit_code, run_error);

  if (!launched) {
    error = MakeCameraError(CameraErrorCode::kProcessLaunchFailed, run_error);
    logger_.Error("still capture failed", {{"error", FormatCameraError(error)}});
    return false;
  }

  if (exit_code != 0) {
    logger_.Warn("still capture produced no image",
                 {{"exit_code", std::to_string(exit_code)},
                  {"cancelled", cancel.IsCancellationRequested() ? "true" : "false"},
                  {"discarded_bytes", std::to_string(buffer.size())}});
    return true;
  }

  image = std::move(buffer);
  logger_.Info("still capture completed", {{"bytes", std::to_string(image.size())}});
  return true;
}

bool CameraController::CaptureJpeg(const std::uint32_t width, const std::uint32_t height,
                                   const process::CancellationToken& cancel,
                                   std::vector<std::uint8_t>& image, CameraError& error) {
  StillSettings settings;
  settings.width = width;
  settings.height = height;
  settings.quality = 90;
  settings.timeout_ms = 300;
  return CaptureOnce(settings, cancel, image, error);
}

bool CameraController::StartStream(const VideoSettings& settings, StreamChunkCallback on_chunk,
                                   StreamFinishedCallback on_finished, CameraError& error,
                                   StreamErrorCallback on_error) {
  error.Clear();

  if (IsBusy()) {
    error = BusyError("open a video stream");
    logger_.Warn("stream start rejected", {{"error", FormatCameraError(error)}});
    return false;
  }

  std::string validation_error;
  if (!ValidateVideoSettings(settings, validation_error)) {
    error = MakeCameraError(CameraErrorCode::kInvalidSettings, validation_error);
    logger_.Warn("stream start rejected", {{"error", FormatCameraError(error)}});
    return false;
  }

  process::ProcessCommand command = BuildVideoCommand(settings);
  const std::string command_line = process::FormatCommandLine(command);

  // Held across the CAS so a concurrent StopStream() either runs before this
  // session exists or finds its worker and stops it.
  std::lock_guard<std::mutex> lock(stream_mu_);
  if (!TryAcquire()) {
    error = BusyError("open a video stream");
    logger_.Warn("stream start rejected", {{"error", FormatCameraError(error)}});
    return false;
  }
  DeviceLease start_lease(state_);

  if (stream_worker_.joinable()) {
    // The previous session already reset the state to idle (the CAS above
    // proves it), so this join only collects a finished thread.
    stream_worker_.join();
    stream_cancel_ = process::CancellationSource();
  }

  const std::uint64_t session_id = ++next_session_id_;
  try {
    stream_worker_ = std::thread(&CameraController::RunStreamSession, this, std::move(command),
                                 stream_cancel_.Token(), std::move(on_chunk),
                                 std::move(on_finished), std::move(on_error), session_id);
  } catch (const std::system_error& ex) {
    error = MakeCameraError(CameraErrorCode::kProcessLaunchFailed,
                            std::string("failed to start stream worker: ") + ex.what());
    logger_.Error("stream start failed", {{"error", FormatCameraError(error)}});
    return false;
  }
  // The worker's own lease resets the state from here on.
  start_lease.Transfer();

  logger_.Info("stream started",
               {{"session", std::to_string(session_id)}, {"command", command_line}});
  return true;
}

bool CameraController::StartStream(StreamChunkCallback on_chunk,
                                   StreamFinishedCallback on_finished, CameraError& error) {
  return StartStream(VideoSettings{}, std::move(on_chunk), std::move(on_finished), error);
}

void CameraController::StopStream() {
  if (stream_thread_id_.load() == std::this_thread::get_id()) {
    // Called from a stream callback: the worker cannot join itself and must
    // not take stream_mu_. The source cannot be replaced while its session
    // is still running, so cancelling it here is safe.
    stream_cancel_.Cancel();
    logger_.Debug("stream stop requested from stream callback");
    return;
  }

  std::lock_guard<std::mutex> lock(stream_mu_);
  if (!stream_worker_.joinable()) {
    return;
  }

  stream_cancel_.Cancel();
  stream_worker_.join();
  // A fresh source only after the session is fully gone, so a late cancel on
  // the old one can never reach the next session.
  stream_cancel_ = process::CancellationSource();
  logger_.Debug("stream stopped", {{"session", std::to_string(next_session_id_)}});
}

void CameraController::RunStreamSession(process::ProcessCommand command,
                                        process::CancellationToken cancel,
                                        StreamChunkCallback on_chunk,
                                        StreamFinishedCallback on_finished,
                                        StreamErrorCallback on_error,
                                        const std::uint64_t session_id) {
  DeviceLease lease(state_);
  stream_thread_id_.store(std::this_thread::get_id());
  WorkerThreadMark mark(stream_thread_id_);
  const std::string session_text = std::to_string(session_id);

  int exit_code = -1;
  std::string run_error;
  bool launched = false;
  try {
    launched = runner_.Run(command, on_chunk, cancel, exit_code, run_error);
  } catch (const std::exception& ex) {
    ReportStreamFault(on_error, MakeCameraError(CameraErrorCode::kStreamInterrupted, ex.what()),
                      session_id);
    return;
  } catch (...) {
    ReportStreamFault(on_error,
                      MakeCameraError(CameraErrorCode::kStreamInterrupted,
                                      "non-standard exception thrown during stream"),
                      session_id);
    return;
  }

  if (!launched) {
    ReportStreamFault(on_error, MakeCameraError(CameraErrorCode::kProcessLaunchFailed, run_error),
                      session_id);
    return;
  }

  if (cancel.IsCancellationRequested()) {
    logger_.Info("stream process terminated on stop",
                 {{"session", session_text}, {"exit_code", std::to_string(exit_code)}});
    return;
  }

  logger_.Info("stream process exited",
               {{"session", session_text}, {"exit_code", std::to_string(exit_code)}});
  if (!on_finished) {
    return;
  }
  try {
    on_finished();
  } catch (const std::exception& ex) {
    ReportStreamFault(on_error, MakeCameraError(CameraErrorCode::kStreamInterrupted, ex.what()),
                      session_id);
  } catch (...) {
    ReportStreamFault(on_error,
                      MakeCameraError(CameraErrorCode::kStreamInterrupted,
                                      "non-standard exception thrown by stream exit callback"),
                      session_id);
  }
}

void CameraController::ReportStreamFault(const StreamErrorCallback& on_error,
                                         const CameraError& fault,
                                         const std::uint64_t session_id) {
  const std::string session_text = std::to_string(session_id);
  logger_.Error("stream fault", {{"session", session_text}, {"error", FormatCameraError(fault)}});
  if (!on_error) {
    return;
  }
  try {
    on_error(fault);
  } catch (const std::exception& ex) {
    logger_.Error("stream error callback threw",
                  {{"session", session_text}, {"error", ex.what()}});
  } catch (...) {
    logger_.Error("stream error callback threw", {{"session", session_text}});
  }
}

} // namespace picam::camera
