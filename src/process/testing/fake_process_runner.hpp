#pragma once

#include "process/process_runner.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace picam::process::testing {

// What one fake process run does.
struct FakeRunScript {
  std::vector<std::vector<std::uint8_t>> chunks;
  int exit_code = 0;
  // Exit code reported when the run ends through cancellation.
  int cancelled_exit_code = -15;
  // When set, Run() fails as if the executable could not be started.
  std::optional<std::string> launch_error;
  // When set, Run() throws std::runtime_error with this text after the chunks.
  std::optional<std::string> throw_message;
  // After the chunks, keep "running" until cancelled or ReleaseHeldRuns().
  bool hold_after_chunks = false;
};

// Scripted runner used by controller tests to avoid real capture hardware
// while still exercising chunk delivery, exit codes and cancellation.
class FakeProcessRunner final : public IProcessRunner {
public:
  FakeProcessRunner() = default;
  explicit FakeProcessRunner(FakeRunScript script);

  void SetScript(FakeRunScript script);

  bool Run(const ProcessCommand& command, const ChunkCallback& on_chunk,
           const CancellationToken& cancel, int& exit_code, std::string& error) override;

  // Lets every held run finish with the scripted exit code.
  void ReleaseHeldRuns();

  // Waits until `count` runs have reached their hold point (or finished).
  bool WaitForRunsHeld(std::size_t count, std::chrono::milliseconds timeout) const;

  std::size_t run_calls() const;
  std::size_t cancellations_observed() const;
  std::size_t max_concurrent_runs() const;
  std::vector<ProcessCommand> commands() const;
  std::vector<CancellationToken> tokens() const;

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  FakeRunScript script_;
  bool released_ = false;
  std::size_t run_calls_ = 0U;
  std::size_t runs_held_ = 0U;
  std::size_t cancellations_observed_ = 0U;
  std::size_t active_runs_ = 0U;
  std::size_t max_concurrent_runs_ = 0U;
  std::vector<ProcessCommand> commands_;
  std::vector<CancellationToken> tokens_;
};

} // namespace picam::process::testing
