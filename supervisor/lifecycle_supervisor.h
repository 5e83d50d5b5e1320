#pragma once

#include "common/cancellation.h"
#include "supervisor/process_registry.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace sweepflux {

// ── LifecycleSupervisor ─────────────────────────────────────────────────────
// Background failure monitor plus operator-interrupt handling for one run.
//
//   ProcessRegistry registry(job_id);
//   CancellationFlag cancel;
//   LifecycleSupervisor supervisor(registry, cancel);
//   supervisor.InstallSignalHandlers();   // SIGINT / SIGTERM
//   supervisor.Start();
//   ... stages wait on `cancel` ...
//   supervisor.Stop();                    // (or let destructor call it)
//
// The monitor thread calls registry.CheckFailures() every `monitor_interval`
// and raises `cancel` (kCriticalFailure) when a critical process has failed.
//
// The installed signal handlers only store the signal number in a lock-free
// atomic. The monitor thread picks it up within one tick, raises `cancel`
// (kInterrupted) and runs registry.Cleanup() exactly once; signals that
// arrive while that cleanup is in progress are logged and ignored.
class LifecycleSupervisor {
public:
  LifecycleSupervisor(
      ProcessRegistry &registry, CancellationFlag &cancel,
      std::chrono::milliseconds monitor_interval = std::chrono::seconds(2),
      std::chrono::milliseconds tick = std::chrono::milliseconds(100));
  ~LifecycleSupervisor();

  LifecycleSupervisor(const LifecycleSupervisor &) = delete;
  LifecycleSupervisor &operator=(const LifecycleSupervisor &) = delete;

  // Starts the monitor thread. Calling this twice is a no-op.
  void Start();

  // Joins the monitor thread and restores the previous signal handlers.
  // Safe to call more than once. Waits for an interrupt cleanup in progress.
  void Stop();

  bool IsRunning() const { return running_.load(); }

  // Routes SIGINT and SIGTERM to this supervisor. Only one supervisor should
  // own the handlers at a time.
  void InstallSignalHandlers();

  // Runs registry.Cleanup() on the first call; later calls return false
  // without doing anything.
  bool CleanupOnce();

  bool CleanupStarted() const { return cleanup_started_.load(); }

  // Signal number of the first interrupt handled, 0 if none.
  int InterruptSignal() const { return interrupt_signal_.load(); }

  // Interrupts that arrived after cleanup had started.
  int IgnoredInterrupts() const { return ignored_interrupts_.load(); }

private:
  void MonitorLoop();
  void HandleInterrupt(int sig);
  void RestoreSignalHandlers();

  ProcessRegistry &registry_;
  CancellationFlag &cancel_;
  const std::chrono::milliseconds monitor_interval_;
  const std::chrono::milliseconds tick_;

  std::atomic<bool> running_{false};
  std::thread monitor_thread_;
  std::atomic<bool> cleanup_started_{false};
  std::atomic<int> interrupt_signal_{0};
  std::atomic<int> ignored_interrupts_{0};

  std::atomic<bool> handlers_installed_{false};
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
};

} // namespace sweepflux
