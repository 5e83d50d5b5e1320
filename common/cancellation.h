#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sweepflux {

enum class CancelReason { kNone, kInterrupted, kCriticalFailure, kShutdown };

const char *CancelReasonName(CancelReason reason);

// One shared cooperative cancellation flag for a sweep run.
//
// Set by the lifecycle supervisor (critical failure, operator interrupt) and
// by the orchestrator on its way into cleanup; observed by every bounded wait.
// The first reason recorded wins. Not signal-safe: signal handlers must not
// call Cancel() directly (see LifecycleSupervisor).
class CancellationFlag {
public:
  CancellationFlag() = default;
  CancellationFlag(const CancellationFlag &) = delete;
  CancellationFlag &operator=(const CancellationFlag &) = delete;

  // Returns true when this call transitioned the flag from clear to set.
  bool Cancel(CancelReason reason);

  bool IsCancelled() const { return cancelled_.load(); }
  CancelReason Reason() const;

  // Blocks for up to `timeout`. Returns true as soon as the flag is set,
  // false if the timeout elapsed with the flag still clear.
  bool WaitFor(std::chrono::milliseconds timeout) const;

private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  CancelReason reason_{CancelReason::kNone};
};

} // namespace sweepflux
