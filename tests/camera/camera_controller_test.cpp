#include "camera/camera_controller.hpp"
#include "process/testing/fake_process_runner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using picam::camera::CameraController;
using picam::camera::CameraError;
using picam::camera::CameraErrorCode;
using picam::camera::StillSettings;
using picam::camera::VideoSettings;
using picam::core::logging::LogLevel;
using picam::core::logging::Logger;
using picam::process::CancellationSource;
using picam::process::CancellationToken;
using picam::process::testing::FakeProcessRunner;
using picam::process::testing::FakeRunScript;

namespace {

constexpr std::chrono::seconds kWaitTimeout{5};

bool WaitUntil(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + kWaitTimeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

FakeRunScript ScriptWithChunks(std::vector<std::vector<std::uint8_t>> chunks, int exit_code = 0) {
  FakeRunScript script;
  script.chunks = std::move(chunks);
  script.exit_code = exit_code;
  return script;
}

} // namespace

TEST_CASE("CaptureOnce returns the concatenated process output", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{1}, {2, 3}}));
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(error.ok());
  REQUIRE(image == std::vector<std::uint8_t>{1, 2, 3});
  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(runner.run_calls() == 1U);
  REQUIRE(runner.commands().front().command == "raspistill");
  REQUIRE(log.str().find("still capture completed") != std::string::npos);
}

TEST_CASE("CaptureOnce yields an empty image when the process fails", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{9, 9}}, 1));
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> image = {7};
  CameraError error;
  REQUIRE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(error.ok());
  REQUIRE(image.empty());
  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(log.str().find("still capture produced no image") != std::string::npos);
}

TEST_CASE("CaptureOnce rejects invalid settings without running a process",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{1}}));
  CameraController controller(runner, logger);

  StillSettings settings;
  settings.timeout_ms = 0;
  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE_FALSE(controller.CaptureOnce(settings, CancellationToken(), image, error));
  REQUIRE(error.code == CameraErrorCode::kInvalidSettings);
  REQUIRE(runner.run_calls() == 0U);
  REQUIRE_FALSE(controller.IsBusy());
}

TEST_CASE("CaptureOnce reports a launch failure and releases the device",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.launch_error = "failed to start 'raspistill': No such file or directory";
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE_FALSE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(error.code == CameraErrorCode::kProcessLaunchFailed);
  REQUIRE(error.message.find("No such file") != std::string::npos);
  REQUIRE_FALSE(controller.IsBusy());

  // The device is usable again right away.
  runner.SetScript(ScriptWithChunks({{4}}));
  REQUIRE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(image == std::vector<std::uint8_t>{4});
}

TEST_CASE("CaptureOnce cancelled through its token yields an empty image",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script = ScriptWithChunks({{1}, {2}});
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  CancellationSource source;
  source.Cancel();
  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE(controller.CaptureOnce(StillSettings{}, source.Token(), image, error));
  REQUIRE(image.empty());
  REQUIRE(runner.cancellations_observed() == 1U);
  REQUIRE_FALSE(controller.IsBusy());
}

TEST_CASE("CaptureOnce rethrows a runner exception after releasing the device",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script = ScriptWithChunks({{1}});
  script.throw_message = "pipe read failed";
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE_THROWS_AS(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error),
                    std::runtime_error);
  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(runner.max_concurrent_runs() == 1U);

  runner.SetScript(ScriptWithChunks({{8, 9}}));
  REQUIRE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(image == std::vector<std::uint8_t>{8, 9});
  REQUIRE_FALSE(controller.IsBusy());
}

TEST_CASE("A runner exception during a stream is reported as interrupted",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script = ScriptWithChunks({{1}});
  script.throw_message = "pipe read failed";
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::atomic<bool> faulted{false};
  std::atomic<bool> finished{false};
  CameraError fault;
  CameraError error;
  REQUIRE(controller.StartStream(
      VideoSettings{}, [](const std::uint8_t*, std::size_t) {}, [&]() { finished.store(true); },
      error, [&](const CameraError& reported) {
        fault = reported;
        faulted.store(true);
      }));

  REQUIRE(WaitUntil([&]() { return faulted.load() && !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(fault.code == CameraErrorCode::kStreamInterrupted);
  REQUIRE(fault.message == "pipe read failed");
  REQUIRE_FALSE(finished.load());
}

TEST_CASE("CaptureJpeg builds a quality 90 capture at the requested size",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{0xFF, 0xD8}}));
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> image;
  CameraError error;
  REQUIRE(controller.CaptureJpeg(320U, 240U, CancellationToken(), image, error));
  REQUIRE(image.size() == 2U);

  const std::vector<std::string> expected = {"-o", "-",   "-t", "300", "-w", "320",
                                             "-h", "240", "-n", "-q",  "90"};
  REQUIRE(runner.commands().front().args == expected);
}

TEST_CASE("StopStream without an active stream is a no-op", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner;
  CameraController controller(runner, logger);

  controller.StopStream();
  controller.StopStream();
  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(runner.run_calls() == 0U);
}

TEST_CASE("StopStream terminates a running stream and waits for cleanup",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script = ScriptWithChunks({{1, 2}, {3}, {4, 5, 6}});
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> received;
  std::size_t chunk_calls = 0U;
  std::atomic<bool> finished{false};
  CameraError error;
  REQUIRE(controller.StartStream(
      VideoSettings{},
      [&](const std::uint8_t* data, const std::size_t size) {
        ++chunk_calls;
        received.insert(received.end(), data, data + size);
      },
      [&]() { finished.store(true); }, error));
  REQUIRE(error.ok());
  REQUIRE(controller.IsBusy());
  REQUIRE(runner.WaitForRunsHeld(1U, kWaitTimeout));

  controller.StopStream();

  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(runner.cancellations_observed() == 1U);
  REQUIRE_FALSE(finished.load());
  REQUIRE(chunk_calls == 3U);
  REQUIRE(received == std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6});
  REQUIRE(log.str().find("stream process terminated on stop") != std::string::npos);
}

TEST_CASE("An active stream rejects captures and second streams", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  CameraError error;
  REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(runner.WaitForRunsHeld(1U, kWaitTimeout));

  std::vector<std::uint8_t> image = {1};
  REQUIRE_FALSE(controller.CaptureOnce(StillSettings{}, CancellationToken(), image, error));
  REQUIRE(error.code == CameraErrorCode::kDeviceBusy);
  REQUIRE(image.empty());

  REQUIRE_FALSE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(error.code == CameraErrorCode::kDeviceBusy);
  REQUIRE(picam::camera::FormatCameraError(error).rfind("DEVICE_BUSY: ", 0) == 0U);

  REQUIRE(runner.run_calls() == 1U);
  REQUIRE(controller.IsBusy());

  controller.StopStream();
  REQUIRE_FALSE(controller.IsBusy());
}

TEST_CASE("Back-to-back streams get independent cancellation", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  CameraError error;
  REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(runner.WaitForRunsHeld(1U, kWaitTimeout));
  controller.StopStream();

  REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(runner.WaitForRunsHeld(2U, kWaitTimeout));

  const std::vector<CancellationToken> tokens = runner.tokens();
  REQUIRE(tokens.size() == 2U);
  REQUIRE(tokens[0].IsCancellationRequested());
  REQUIRE_FALSE(tokens[1].IsCancellationRequested());
  REQUIRE_FALSE(tokens[0].SharesSourceWith(tokens[1]));

  controller.StopStream();
  REQUIRE(tokens[1].IsCancellationRequested());
  REQUIRE(runner.cancellations_observed() == 2U);
}

TEST_CASE("on_finished runs only when the process exits by itself", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{1}, {2}}));
  CameraController controller(runner, logger);

  std::vector<std::uint8_t> received;
  std::atomic<int> finished_calls{0};
  CameraError error;
  REQUIRE(controller.StartStream(
      [&](const std::uint8_t* data, const std::size_t size) {
        received.insert(received.end(), data, data + size);
      },
      [&]() { finished_calls.fetch_add(1); }, error));

  REQUIRE(WaitUntil([&]() { return finished_calls.load() == 1 && !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(finished_calls.load() == 1);
  REQUIRE(received == std::vector<std::uint8_t>{1, 2});
  REQUIRE(runner.cancellations_observed() == 0U);

  // A finished session frees the device for the next stream.
  runner.SetScript(ScriptWithChunks({{3}}));
  REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {},
                                 [&]() { finished_calls.fetch_add(1); }, error));
  REQUIRE(WaitUntil([&]() { return finished_calls.load() == 2 && !controller.IsBusy(); }));
  controller.StopStream();
}

TEST_CASE("Stream launch failure reaches the error callback", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.launch_error = "failed to start 'raspivid': No such file or directory";
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::atomic<bool> finished{false};
  std::atomic<bool> faulted{false};
  CameraError fault;
  CameraError error;
  REQUIRE(controller.StartStream(
      VideoSettings{}, [](const std::uint8_t*, std::size_t) {}, [&]() { finished.store(true); },
      error, [&](const CameraError& reported) {
        fault = reported;
        faulted.store(true);
      }));

  REQUIRE(WaitUntil([&]() { return faulted.load() && !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(fault.code == CameraErrorCode::kProcessLaunchFailed);
  REQUIRE_FALSE(finished.load());
  REQUIRE(log.str().find("stream fault") != std::string::npos);
}

TEST_CASE("A throwing chunk callback ends the stream without escaping",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner(ScriptWithChunks({{1}, {2}}));
  CameraController controller(runner, logger);

  std::atomic<bool> faulted{false};
  CameraError fault;
  CameraError error;
  REQUIRE(controller.StartStream(
      VideoSettings{},
      [](const std::uint8_t*, std::size_t) { throw std::runtime_error("consumer exploded"); },
      []() {}, error, [&](const CameraError& reported) {
        fault = reported;
        faulted.store(true);
      }));

  REQUIRE(WaitUntil([&]() { return faulted.load() && !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(fault.code == CameraErrorCode::kStreamInterrupted);
  REQUIRE(fault.message == "consumer exploded");
}

TEST_CASE("A throwing error callback is contained and logged", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.launch_error = "no camera";
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  CameraError error;
  REQUIRE(controller.StartStream(
      VideoSettings{}, [](const std::uint8_t*, std::size_t) {}, []() {}, error,
      [](const CameraError&) { throw std::runtime_error("handler failed"); }));

  REQUIRE(WaitUntil([&]() { return runner.run_calls() == 1U && !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(log.str().find("stream error callback threw") != std::string::npos);
}

TEST_CASE("StopStream called from the chunk callback cancels the session",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script = ScriptWithChunks({{1}, {2}, {3}});
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  std::atomic<int> chunk_calls{0};
  std::atomic<bool> finished{false};
  CameraError error;
  REQUIRE(controller.StartStream(
      [&](const std::uint8_t*, std::size_t) {
        chunk_calls.fetch_add(1);
        controller.StopStream();
      },
      [&]() { finished.store(true); }, error));

  REQUIRE(WaitUntil([&]() { return !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(chunk_calls.load() == 1);
  REQUIRE_FALSE(finished.load());
  REQUIRE(runner.cancellations_observed() == 1U);
}

TEST_CASE("Invalid stream settings are rejected before the device is taken",
          "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeProcessRunner runner;
  CameraController controller(runner, logger);

  VideoSettings settings;
  settings.framerate = 0;
  CameraError error;
  REQUIRE_FALSE(controller.StartStream(settings, [](const std::uint8_t*, std::size_t) {},
                                       []() {}, error));
  REQUIRE(error.code == CameraErrorCode::kInvalidSettings);
  REQUIRE_FALSE(controller.IsBusy());

  VideoSettings negative_timeout;
  negative_timeout.timeout_ms = -1;
  REQUIRE_FALSE(controller.StartStream(negative_timeout,
                                       [](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(error.code == CameraErrorCode::kInvalidSettings);
  REQUIRE(error.message.find("timeout_ms") != std::string::npos);
  REQUIRE_FALSE(controller.IsBusy());
  REQUIRE(runner.run_calls() == 0U);
}

TEST_CASE("Destroying the controller stops its stream", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);

  {
    CameraController controller(runner, logger);
    CameraError error;
    REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
    REQUIRE(runner.WaitForRunsHeld(1U, kWaitTimeout));
  }

  REQUIRE(runner.cancellations_observed() == 1U);
  REQUIRE(runner.max_concurrent_runs() == 1U);
}

TEST_CASE("Session state reports busy only while an operation runs", "[camera][controller]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunScript script;
  script.hold_after_chunks = true;
  FakeProcessRunner runner(script);
  CameraController controller(runner, logger);

  REQUIRE(controller.state() == picam::camera::SessionState::kIdle);
  REQUIRE(std::string(picam::camera::ToString(controller.state())) == "idle");

  CameraError error;
  REQUIRE(controller.StartStream([](const std::uint8_t*, std::size_t) {}, []() {}, error));
  REQUIRE(controller.state() == picam::camera::SessionState::kBusy);
  REQUIRE(std::string(picam::camera::ToString(controller.state())) == "busy");

  runner.ReleaseHeldRuns();
  REQUIRE(WaitUntil([&]() { return !controller.IsBusy(); }));
  controller.StopStream();
  REQUIRE(runner.cancellations_observed() == 0U);
}
