#pragma once

#include "process/cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace picam::process {

// Executable plus ordered argument list (argv[1..]).
struct ProcessCommand {
  std::string command;
  std::vector<std::string> args;
};

// Receives a view of one stdout chunk. The buffer is only valid for the
// duration of the call.
using ChunkCallback = std::function<void(const std::uint8_t* data, std::size_t size)>;

// Runs external capture processes and streams their stdout.
//
// Contract:
// - chunks are delivered in emission order with no loss while the process is
//   alive
// - cancellation terminates the process (it is never left running)
// - returns false when the process could not be started or its output could
//   not be read; a process that ran and failed returns true with a non-zero
//   `exit_code`
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  virtual bool Run(const ProcessCommand& command, const ChunkCallback& on_chunk,
                   const CancellationToken& cancel, int& exit_code, std::string& error) = 0;
};

std::string FormatCommandLine(const ProcessCommand& command);

} // namespace picam::process
