#include <catch2/catch.hpp>

#include "common/cancellation.h"
#include "supervisor/lifecycle_supervisor.h"
#include "supervisor/process_registry.h"
#include "tests/unit/fake_process.h"

#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

using namespace sweepflux;
using namespace sweepflux::testing;
using namespace std::chrono_literals;

namespace {

ManagedProcess MakeFake(const std::string &name,
                        std::shared_ptr<FakeProcessState> state) {
  ManagedProcess p;
  p.name = name;
  p.node = "n1";
  p.handle = std::make_unique<FakeProcessHandle>(std::move(state));
  return p;
}

} // namespace

TEST_CASE("Monitor raises the flag on a critical failure", "[supervisor]") {
  ProcessRegistry registry("job", 100ms, 5ms);
  CancellationFlag cancel;
  auto state = std::make_shared<FakeProcessState>();
  registry.Add(MakeFake("decode_0_n1", state));

  LifecycleSupervisor supervisor(registry, cancel, 20ms, 5ms);
  supervisor.Start();
  REQUIRE(supervisor.IsRunning());
  REQUIRE_FALSE(cancel.WaitFor(60ms));

  state->Finish(ProcessStatus::Exited(1));
  REQUIRE(cancel.WaitFor(5s));
  REQUIRE(cancel.Reason() == CancelReason::kCriticalFailure);

  supervisor.Stop();
  REQUIRE_FALSE(supervisor.IsRunning());
  // The monitor only reports; cleanup belongs to the orchestrator.
  REQUIRE_FALSE(supervisor.CleanupStarted());
  REQUIRE(state->terminate_calls.load() == 0);
}

TEST_CASE("Monitor stays quiet while processes are healthy", "[supervisor]") {
  ProcessRegistry registry("job", 100ms, 5ms);
  CancellationFlag cancel;
  auto state = std::make_shared<FakeProcessState>();
  registry.Add(MakeFake("prefill_0_n1", state));

  LifecycleSupervisor supervisor(registry, cancel, 10ms, 2ms);
  supervisor.Start();
  REQUIRE_FALSE(cancel.WaitFor(100ms));
  supervisor.Stop();
  REQUIRE(state->poll_calls.load() > 0);
}

TEST_CASE("CleanupOnce runs the registry cleanup a single time",
          "[supervisor]") {
  ProcessRegistry registry("job", 100ms, 5ms);
  CancellationFlag cancel;
  auto state = std::make_shared<FakeProcessState>();
  registry.Add(MakeFake("frontend", state));

  LifecycleSupervisor supervisor(registry, cancel);
  REQUIRE(supervisor.CleanupOnce());
  REQUIRE_FALSE(supervisor.CleanupOnce());
  REQUIRE(supervisor.CleanupStarted());
  REQUIRE(state->terminate_calls.load() == 1);
}

TEST_CASE("SIGINT cancels the run and cleans up exactly once",
          "[supervisor][signals]") {
  ProcessRegistry registry("job", 100ms, 5ms);
  CancellationFlag cancel;
  auto state = std::make_shared<FakeProcessState>();
  registry.Add(MakeFake("decode_0_n1", state));

  LifecycleSupervisor supervisor(registry, cancel, 1s, 5ms);
  supervisor.InstallSignalHandlers();
  supervisor.Start();

  std::raise(SIGINT);
  REQUIRE(cancel.WaitFor(5s));
  REQUIRE(cancel.Reason() == CancelReason::kInterrupted);

  supervisor.Stop();

  REQUIRE(supervisor.InterruptSignal() == SIGINT);
  REQUIRE(supervisor.CleanupStarted());
  REQUIRE(supervisor.IgnoredInterrupts() == 0);
  REQUIRE(state->terminate_calls.load() == 1);
  REQUIRE_FALSE(supervisor.CleanupOnce());
  // Interrupted processes are stopped, not failed.
  REQUIRE(registry.Failures().empty());
}

TEST_CASE("Interrupts delivered while cleanup is blocked are ignored",
          "[supervisor][signals]") {
  ProcessRegistry registry("job", 300ms, 5ms);
  CancellationFlag cancel;
  auto state = std::make_shared<FakeProcessState>();
  state->exits_on_terminate = false;
  registry.Add(MakeFake("frontend", state));

  LifecycleSupervisor supervisor(registry, cancel, 1s, 5ms);
  supervisor.InstallSignalHandlers();
  supervisor.Start();

  std::raise(SIGINT);
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (state->terminate_calls.load() == 0 &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(1ms);
  REQUIRE(state->terminate_calls.load() == 1);

  // Cleanup is now waiting out the grace period for `frontend`.
  REQUIRE(state->kill_calls.load() == 0);
  std::raise(SIGTERM);
  std::raise(SIGINT);

  deadline = std::chrono::steady_clock::now() + 5s;
  while (supervisor.IgnoredInterrupts() == 0 &&
         std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(1ms);
  supervisor.Stop();

  REQUIRE(supervisor.IgnoredInterrupts() >= 1);
  REQUIRE(supervisor.InterruptSignal() == SIGINT);
  REQUIRE(cancel.Reason() == CancelReason::kInterrupted);
  REQUIRE(state->terminate_calls.load() == 1);
  REQUIRE(state->kill_calls.load() == 1);
  REQUIRE(registry.Failures().empty());
}

TEST_CASE("Stop restores the previous signal handlers",
          "[supervisor][signals]") {
  struct sigaction before {};
  ::sigaction(SIGTERM, nullptr, &before);

  ProcessRegistry registry("job", 100ms, 5ms);
  CancellationFlag cancel;
  {
    LifecycleSupervisor supervisor(registry, cancel, 1s, 5ms);
    supervisor.InstallSignalHandlers();
    struct sigaction during {};
    ::sigaction(SIGTERM, nullptr, &during);
    REQUIRE((during.sa_handler != before.sa_handler));
    supervisor.Stop();
  }

  struct sigaction after {};
  ::sigaction(SIGTERM, nullptr, &after);
  REQUIRE((after.sa_handler == before.sa_handler));
}
