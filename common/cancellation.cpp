#include "common/cancellation.h"

namespace sweepflux {

const char *CancelReasonName(CancelReason reason) {
  switch (reason) {
  case CancelReason::kNone:
    return "none";
  case CancelReason::kInterrupted:
    return "interrupted";
  case CancelReason::kCriticalFailure:
    return "critical_failure";
  case CancelReason::kShutdown:
    return "shutdown";
  }
  return "unknown";
}

bool CancellationFlag::Cancel(CancelReason reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
      return false;
    }
    reason_ = reason;
    cancelled_.store(true);
  }
  cv_.notify_all();
  return true;
}

CancelReason CancellationFlag::Reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

bool CancellationFlag::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
}

} // namespace sweepflux
