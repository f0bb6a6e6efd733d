#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

namespace picam::process {

namespace detail {

struct CancellationState {
  mutable std::mutex mu;
  std::condition_variable cv;
  bool cancelled = false;
};

} // namespace detail

// Read-only view of one cancellation source.
//
// A default-constructed token is never cancelled. Tokens stay bound to the
// source that issued them, so a token handed to an old session cannot observe
// cancellation requested on a newer source.
class CancellationToken {
public:
  CancellationToken() = default;

  bool IsCancellationRequested() const;

  // Blocks up to `timeout` for cancellation. Returns true once cancelled.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // Blocks until cancelled. Returns immediately for a token without source.
  void Wait() const;

  bool CanBeCancelled() const {
    return state_ != nullptr;
  }

  bool SharesSourceWith(const CancellationToken& other) const {
    return state_ == other.state_;
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

// Owner side of a cancellation signal. Cancel() is sticky and idempotent.
class CancellationSource {
public:
  CancellationSource();

  void Cancel();
  bool IsCancellationRequested() const;
  CancellationToken Token() const;

private:
  std::shared_ptr<detail::CancellationState> state_;
};

} // namespace picam::process
