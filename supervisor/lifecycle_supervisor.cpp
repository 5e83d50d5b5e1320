#include "supervisor/lifecycle_supervisor.h"

#include "common/logging/logger.h"

#include <cerrno>
#include <cstring>

namespace sweepflux {

namespace {

static_assert(std::atomic<int>::is_always_lock_free,
              "signal handlers need a lock-free atomic");

// Written only by OnSignal(); read and cleared by the monitor thread.
std::atomic<int> g_pending_signal{0};

extern "C" void OnSignal(int sig) { g_pending_signal.store(sig); }

} // namespace

LifecycleSupervisor::LifecycleSupervisor(ProcessRegistry &registry,
                                         CancellationFlag &cancel,
                                         std::chrono::milliseconds monitor_interval,
                                         std::chrono::milliseconds tick)
    : registry_(registry), cancel_(cancel), monitor_interval_(monitor_interval),
      tick_(tick) {}

LifecycleSupervisor::~LifecycleSupervisor() { Stop(); }

void LifecycleSupervisor::Start() {
  if (running_.exchange(true))
    return;
  monitor_thread_ = std::thread([this] { MonitorLoop(); });
  log::Debug("supervisor", "monitor started",
             "interval_ms=" + std::to_string(monitor_interval_.count()));
}

void LifecycleSupervisor::Stop() {
  running_.store(false);
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
  RestoreSignalHandlers();
}

void LifecycleSupervisor::InstallSignalHandlers() {
  if (handlers_installed_.load())
    return;
  g_pending_signal.store(0);

  struct sigaction action {};
  action.sa_handler = OnSignal;
  sigemptyset(&action.sa_mask);
  sigaddset(&action.sa_mask, SIGINT);
  sigaddset(&action.sa_mask, SIGTERM);
  action.sa_flags = SA_RESTART;

  if (::sigaction(SIGINT, &action, &previous_int_) != 0 ||
      ::sigaction(SIGTERM, &action, &previous_term_) != 0) {
    log::Warn("supervisor", std::string("cannot install signal handlers: ") +
                                std::strerror(errno));
    return;
  }
  handlers_installed_.store(true);
}

void LifecycleSupervisor::RestoreSignalHandlers() {
  if (!handlers_installed_.exchange(false))
    return;
  ::sigaction(SIGINT, &previous_int_, nullptr);
  ::sigaction(SIGTERM, &previous_term_, nullptr);
  g_pending_signal.store(0);
}

bool LifecycleSupervisor::CleanupOnce() {
  if (cleanup_started_.exchange(true))
    return false;
  registry_.Cleanup();
  return true;
}

void LifecycleSupervisor::HandleInterrupt(int sig) {
  int expected = 0;
  interrupt_signal_.compare_exchange_strong(expected, sig);
  if (cleanup_started_.load()) {
    ++ignored_interrupts_;
    log::Warn("supervisor", "signal " + std::to_string(sig) +
                                " ignored: cleanup already in progress");
    return;
  }
  log::Warn("supervisor", "received signal " + std::to_string(sig) + " (" +
                              strsignal(sig) + "); stopping job " +
                              registry_.JobId());
  cancel_.Cancel(CancelReason::kInterrupted);
  CleanupOnce();
}

void LifecycleSupervisor::MonitorLoop() {
  auto next_check = std::chrono::steady_clock::now() + monitor_interval_;
  while (running_.load()) {
    int sig = g_pending_signal.exchange(0);
    if (sig != 0 && handlers_installed_.load()) {
      HandleInterrupt(sig);
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= next_check) {
      next_check = now + monitor_interval_;
      if (!cleanup_started_.load() && registry_.CheckFailures()) {
        if (cancel_.Cancel(CancelReason::kCriticalFailure)) {
          log::Error("supervisor", "critical process failure detected; "
                                   "cancelling job " +
                                       registry_.JobId());
        }
      }
    }
    std::this_thread::sleep_for(tick_);
  }
}

} // namespace sweepflux
