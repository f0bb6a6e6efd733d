#pragma once

#include "camera/camera_errors.hpp"
#include "camera/capture_settings.hpp"
#include "core/logging/logger.hpp"
#include "process/cancellation.hpp"
#include "process/process_runner.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace picam::camera {

enum class SessionState {
  kIdle,
  kBusy,
};

const char* ToString(SessionState state);

using StreamChunkCallback = process::ChunkCallback;
using StreamFinishedCallback = std::function<void()>;
using StreamErrorCallback = std::function<void(const CameraError&)>;

// Exclusive owner of one physical camera.
//
// Construct exactly one controller per device and pass it by reference to
// whatever needs camera access. Every capture or stream request first wins a
// single compare-and-set from `kIdle` to `kBusy`; losers fail immediately with
// `kDeviceBusy` and change nothing. The state returns to `kIdle` on every exit
// path of the operation that won it.
//
// Streaming runs on a worker thread owned by the controller. `StopStream()`
// cancels the session's token, which makes the runner terminate the capture
// process, and returns only after the worker has finished its cleanup.
class CameraController {
public:
  CameraController(process::IProcessRunner& runner, core::logging::Logger& logger);
  ~CameraController();

  CameraController(const CameraController&) = delete;
  CameraController& operator=(const CameraController&) = delete;
  CameraController(CameraController&&) = delete;
  CameraController& operator=(CameraController&&) = delete;

  bool IsBusy() const;
  SessionState state() const;

  // Runs one still capture to completion and returns the process output.
  //
  // Returns false with kDeviceBusy / kInvalidSettings before touching the
  // device, or with kProcessLaunchFailed when the executable cannot start.
  // A process that runs but exits non-zero (including one killed through
  // `cancel`) yields true with an empty `image`; callers must check for that.
  bool CaptureOnce(const StillSettings& settings, const process::CancellationToken& cancel,
                   std::vector<std::uint8_t>& image, CameraError& error);

  // JPEG still at quality 90 with a 300 ms capture timeout.
  bool CaptureJpeg(std::uint32_t width, std::uint32_t height,
                   const process::CancellationToken& cancel, std::vector<std::uint8_t>& image,
                   CameraError& error);

  // Starts a background stream and returns once the worker is scheduled.
  //
  // `on_chunk` sees every stdout chunk in arrival order. `on_finished` runs
  // only when the process exits on its own, never after StopStream(). Worker
  // faults are logged and passed to `on_error` when provided; they never
  // reach this caller.
  bool StartStream(const VideoSettings& settings, StreamChunkCallback on_chunk,
                   StreamFinishedCallback on_finished, CameraError& error,
                   StreamErrorCallback on_error = {});

  // 1080p stream with no timeout and no preview.
  bool StartStream(StreamChunkCallback on_chunk, StreamFinishedCallback on_finished,
                   CameraError& error);

  // Stops the active stream and waits for its cleanup. No-op without one.
  // A StartStream() racing this call is serialised on stream_mu_: it either
  // claims the device after this returns, or its session is the one stopped.
  void StopStream();

private:
  bool TryAcquire();
  void RunStreamSession(process::ProcessCommand command, process::CancellationToken cancel,
                        StreamChunkCallback on_chunk, StreamFinishedCallback on_finished,
                        StreamErrorCallback on_error, std::uint64_t session_id);
  void ReportStreamFault(const StreamErrorCallback& on_error, const CameraError& fault,
                         std::uint64_t session_id);

  process::IProcessRunner& runner_;
  core::logging::Logger& logger_;
  std::atomic<SessionState> state_{SessionState::kIdle};

  // Guards the worker slot, the cancellation source and the stream CAS. The
  // worker never takes it, so StopStream() may hold it across the join.
  std::mutex stream_mu_;
  process::CancellationSource stream_cancel_;
  std::thread stream_worker_;
  // Set while a worker runs; lets StopStream() recognise calls from callbacks.
  std::atomic<std::thread::id> stream_thread_id_{};
  std::uint64_t next_session_id_ = 0;
};

} // namespace picam::camera
