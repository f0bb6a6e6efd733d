#include "process/cancellation.hpp"

namespace picam::process {

bool CancellationToken::IsCancellationRequested() const {
  if (state_ == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

bool CancellationToken::WaitFor(const std::chrono::milliseconds timeout) const {
  if (state_ == nullptr) {
    return false;
  }
  std::unique_lock<std::mutex> lock(state_->mu);
  return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
}

void CancellationToken::Wait() const {
  if (state_ == nullptr) {
    return;
  }
  std::unique_lock<std::mutex> lock(state_->mu);
  state_->cv.wait(lock, [this]() { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationSource::IsCancellationRequested() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

} // namespace picam::process
