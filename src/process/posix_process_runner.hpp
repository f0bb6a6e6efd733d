#pragma once

#include "process/process_runner.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string_view>

namespace picam::process {

struct PosixProcessRunnerOptions {
  // Largest chunk handed to the stdout callback in one call.
  std::size_t read_chunk_bytes = 64U * 1024U;
  // Upper bound on how long a cancellation request goes unnoticed.
  std::chrono::milliseconds poll_interval{20};
  // Time between SIGTERM and SIGKILL when a cancelled child does not exit.
  std::chrono::milliseconds termination_grace{2000};
  // Optional sink for the child's stderr lines; stderr is drained either way.
  std::function<void(std::string_view)> on_stderr;
};

// posix_spawn-based runner with pipe polling.
//
// Lifecycle guarantees:
// - pipe descriptors are closed on every return path
// - the child is always reaped; if a callback throws, the child is killed
//   before the exception leaves Run()
class PosixProcessRunner final : public IProcessRunner {
public:
  PosixProcessRunner() = default;
  explicit PosixProcessRunner(PosixProcessRunnerOptions options);

  bool Run(const ProcessCommand& command, const ChunkCallback& on_chunk,
           const CancellationToken& cancel, int& exit_code, std::string& error) override;

private:
  PosixProcessRunnerOptions options_;
};

} // namespace picam::process
