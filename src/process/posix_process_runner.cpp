#include "process/posix_process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace picam::process {

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const {
    return fd_;
  }

  bool valid() const {
    return fd_ >= 0;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      (void)::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

// Kills and reaps the child unless Run() already collected its status.
class ChildGuard {
public:
  explicit ChildGuard(pid_t pid) : pid_(pid) {}
  ~ChildGuard() {
    if (pid_ <= 0 || reaped_) {
      return;
    }
    (void)::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }

  ChildGuard(const ChildGuard&) = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  pid_t pid() const {
    return pid_;
  }

  void MarkReaped() {
    reaped_ = true;
  }

private:
  pid_t pid_ = -1;
  bool reaped_ = false;
};

class SpawnFileActions {
public:
  SpawnFileActions() {
    initialized_ = (::posix_spawn_file_actions_init(&actions_) == 0);
  }
  ~SpawnFileActions() {
    if (initialized_) {
      (void)::posix_spawn_file_actions_destroy(&actions_);
    }
  }

  SpawnFileActions(const SpawnFileActions&) = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  bool initialized() const {
    return initialized_;
  }

  posix_spawn_file_actions_t* get() {
    return &actions_;
  }

private:
  posix_spawn_file_actions_t actions_{};
  bool initialized_ = false;
};

std::string ErrnoText(int err) {
  return std::string(std::strerror(err));
}

// Matches the shell convention loosely: exit status for normal exits and the
// negated signal number for signalled children.
int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return -999;
}

bool CreateNonBlockingReadPipe(UniqueFd& read_end, UniqueFd& write_end, std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = "failed to create pipe: " + ErrnoText(errno);
    return false;
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);

  const int flags = ::fcntl(read_end.get(), F_GETFL, 0);
  if (flags < 0 || ::fcntl(read_end.get(), F_SETFL, flags | O_NONBLOCK) != 0) {
    error = "failed to set pipe non-blocking: " + ErrnoText(errno);
    return false;
  }
  return true;
}

std::vector<char*> BuildArgv(const ProcessCommand& command) {
  std::vector<char*> argv;
  argv.reserve(command.args.size() + 2U);
  argv.push_back(const_cast<char*>(command.command.c_str()));
  for (const auto& arg : command.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

enum class ReadOutcome {
  kData,
  kWouldBlock,
  kClosed,
};

ReadOutcome ReadOnce(int fd, std::vector<std::uint8_t>& buffer, std::size_t& bytes_read) {
  bytes_read = 0U;
  while (true) {
    const ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      bytes_read = static_cast<std::size_t>(n);
      return ReadOutcome::kData;
    }
    if (n == 0) {
      return ReadOutcome::kClosed;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadOutcome::kWouldBlock;
    }
    return ReadOutcome::kClosed;
  }
}

class StderrLineSplitter {
public:
  explicit StderrLineSplitter(const std::function<void(std::string_view)>& sink) : sink_(sink) {}

  void Append(const std::uint8_t* data, std::size_t size) {
    if (!sink_) {
      return;
    }
    pending_.append(reinterpret_cast<const char*>(data), size);
    std::size_t start = 0;
    std::size_t newline = pending_.find('\n', start);
    while (newline != std::string::npos) {
      sink_(std::string_view(pending_).substr(start, newline - start));
      start = newline + 1U;
      newline = pending_.find('\n', start);
    }
    pending_.erase(0, start);
  }

  void Flush() {
    if (sink_ && !pending_.empty()) {
      sink_(pending_);
    }
    pending_.clear();
  }

private:
  const std::function<void(std::string_view)>& sink_;
  std::string pending_;
};

} // namespace

PosixProcessRunner::PosixProcessRunner(PosixProcessRunnerOptions options)
    : options_(std::move(options)) {
  if (options_.read_chunk_bytes == 0U) {
    options_.read_chunk_bytes = 1U;
  }
}

bool PosixProcessRunner::Run(const ProcessCommand& command, const ChunkCallback& on_chunk,
                             const CancellationToken& cancel, int& exit_code,
                             std::string& error) {
  error.clear();
  exit_code = -1;

  if (command.command.empty()) {
    error = "process command cannot be empty";
    return false;
  }

  UniqueFd stdout_read;
  UniqueFd stdout_write;
  UniqueFd stderr_read;
  UniqueFd stderr_write;
  if (!CreateNonBlockingReadPipe(stdout_read, stdout_write, error) ||
      !CreateNonBlockingReadPipe(stderr_read, stderr_write, error)) {
    return false;
  }

  SpawnFileActions actions;
  if (!actions.initialized()) {
    error = "failed to initialize spawn file actions";
    return false;
  }
  if (::posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0) !=
          0 ||
      ::posix_spawn_file_actions_adddup2(actions.get(), stdout_write.get(), STDOUT_FILENO) != 0 ||
      ::posix_spawn_file_actions_adddup2(actions.get(), stderr_write.get(), STDERR_FILENO) != 0) {
    error = "failed to configure spawn file actions";
    return false;
  }

  std::vector<char*> argv = BuildArgv(command);
  pid_t pid = -1;
  const int spawn_rc =
      ::posix_spawnp(&pid, command.command.c_str(), actions.get(), nullptr, argv.data(), environ);
  if (spawn_rc != 0) {
    error = "failed to start '" + command.command + "': " + ErrnoText(spawn_rc);
    return false;
  }

  ChildGuard child(pid);
  // Parent keeps only the read ends; EOF arrives once the child side closes.
  stdout_write.Reset();
  stderr_write.Reset();

  std::vector<std::uint8_t> buffer(options_.read_chunk_bytes);
  StderrLineSplitter stderr_lines(options_.on_stderr);

  // Reads at most one chunk per descriptor unless `until_empty` is set, so a
  // chatty child cannot starve the cancellation check.
  auto drain_available = [&](UniqueFd& fd, const bool is_stdout, const bool until_empty) {
    while (fd.valid()) {
      std::size_t bytes_read = 0U;
      const ReadOutcome outcome = ReadOnce(fd.get(), buffer, bytes_read);
      if (outcome == ReadOutcome::kWouldBlock) {
        return;
      }
      if (outcome == ReadOutcome::kClosed) {
        fd.Reset();
        return;
      }
      if (is_stdout) {
        if (on_chunk) {
          on_chunk(buffer.data(), bytes_read);
        }
      } else {
        stderr_lines.Append(buffer.data(), bytes_read);
      }
      if (!until_empty) {
        return;
      }
    }
  };

  bool termination_requested = false;
  bool kill_sent = false;
  auto kill_deadline = std::chrono::steady_clock::now();
  int wait_status = 0;
  const int poll_timeout_ms = static_cast<int>(options_.poll_interval.count());

  while (true) {
    if (!termination_requested && cancel.IsCancellationRequested()) {
      (void)::kill(child.pid(), SIGTERM);
      termination_requested = true;
      kill_deadline = std::chrono::steady_clock::now() + options_.termination_grace;
    }
    if (termination_requested && !kill_sent && std::chrono::steady_clock::now() >= kill_deadline) {
      (void)::kill(child.pid(), SIGKILL);
      kill_sent = true;
    }

    if (stdout_read.valid() || stderr_read.valid()) {
      pollfd fds[2];
      nfds_t count = 0;
      if (stdout_read.valid()) {
        fds[count++] = pollfd{stdout_read.get(), POLLIN, 0};
      }
      if (stderr_read.valid()) {
        fds[count++] = pollfd{stderr_read.get(), POLLIN, 0};
      }
      const int ready = ::poll(fds, count, poll_timeout_ms);
      if (ready < 0 && errno != EINTR) {
        error = "failed to poll process output: " + ErrnoText(errno);
        return false;
      }
      if (ready > 0) {
        drain_available(stdout_read, true, false);
        drain_available(stderr_read, false, false);
      }
    }

    const pid_t waited = ::waitpid(child.pid(), &wait_status, WNOHANG);
    if (waited == child.pid()) {
      child.MarkReaped();
      // Everything the child wrote before exiting is already in the pipes.
      drain_available(stdout_read, true, true);
      drain_available(stderr_read, false, true);
      break;
    }
    if (waited < 0 && errno != EINTR) {
      error = "failed to wait for process: " + ErrnoText(errno);
      return false;
    }

    if (!stdout_read.valid() && !stderr_read.valid()) {
      // Output closed but the child is still running; wait without spinning.
      std::this_thread::sleep_for(options_.poll_interval);
    }
  }

  stderr_lines.Flush();
  exit_code = DecodeWaitStatus(wait_status);
  return true;
}

} // namespace picam::process
