#pragma once

#include "allocation/endpoint.h"
#include "backends/sglang_backend.h"
#include "common/cancellation.h"
#include "config/sweep_config.h"
#include "launch/process_handle.h"
#include "runtime/runtime_context.h"
#include "supervisor/lifecycle_supervisor.h"
#include "supervisor/process_registry.h"
#include "supervisor/readiness.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sweepflux {

enum class SweepStage {
  kInit,
  kHeadInfrastructure,
  kWorkers,
  kFrontend,
  kBenchmark,
  kCleanup,
  kSuccess,
  kFailed,
};

const char *SweepStageName(SweepStage stage);

struct OrchestratorOptions {
  // Route SIGINT / SIGTERM to the supervisor for the duration of Run().
  bool install_signal_handlers{true};
  std::chrono::milliseconds supervisor_tick{100};
  // Host name -> address used in worker and router command lines.
  std::function<std::string(const std::string &)> resolve_host;
};

// ── SweepOrchestrator ───────────────────────────────────────────────────────
// Drives one sweep run through
//
//   Init → HeadInfrastructure → Workers → Frontend → Benchmark → Cleanup
//        → Success | Failed
//
// Every process is launched through the RemoteLauncher and handed to the
// ProcessRegistry right away, so the supervisor's monitor sees it while the
// next readiness wait is running. A failure to start, a readiness timeout or
// a cancellation (critical failure, operator interrupt) skips straight to
// Cleanup. Cleanup runs exactly once on every exit path.
//
// Single use: Run() may be called once.
class SweepOrchestrator {
public:
  static constexpr const char *kInfrastructureName = "head_infrastructure";
  static constexpr const char *kFrontendName = "frontend";
  static constexpr const char *kRouterName = "sglang_router";
  static constexpr const char *kBenchmarkName = "benchmark";

  SweepOrchestrator(const SweepConfig &config, const RuntimeContext &runtime,
                    RemoteLauncher &launcher, ProbeFactory &probes,
                    OrchestratorOptions options = {});

  SweepOrchestrator(const SweepOrchestrator &) = delete;
  SweepOrchestrator &operator=(const SweepOrchestrator &) = delete;

  // 0 on success, 1 on failure. Configuration and allocation errors are
  // reported as failures before anything is launched.
  int Run();

  // Allocated endpoints with their processes. Computed on first use; throws
  // ConfigurationError / InsufficientResourcesError.
  const std::vector<EndpointTopology> &Topology();

  // Command line of one worker process.
  std::vector<std::string> WorkerCommand(const EndpointTopology &topology,
                                         const Process &process) const;
  std::vector<std::pair<std::string, std::string>>
  WorkerEnvironment(const Process &process) const;

  // The launch plan (nodes, endpoints, processes and their commands) as JSON,
  // without starting anything.
  nlohmann::json Plan();

  SweepStage Stage() const { return stage_; }
  const std::vector<SweepStage> &History() const { return history_; }
  // Failure records collected during cleanup of the last Run().
  const std::vector<FailureRecord> &Failures() const { return failures_; }

private:
  void EnterStage(SweepStage stage);
  void StartHeadInfrastructure();
  void StartWorkers();
  void StartFrontend();
  bool RunBenchmark();
  bool RunManualBenchmark();
  bool RunCommandBenchmark();
  // Runs once from the cleanup guard in Run().
  void Finish(bool success) noexcept;

  void Launch(const std::string &name, const std::string &node,
              const std::string &log_stem, std::vector<std::string> command,
              std::vector<std::pair<std::string, std::string>> env,
              bool run_to_completion = false,
              const std::string &extra_mounts = {});
  void Await(ReadinessProbe &probe, const WaitPolicy &policy,
             const std::string &what);
  // Throws when the cancellation flag is set: CriticalProcessFailure for a
  // detected failure, SweepError for an interrupt.
  void ThrowIfCancelled(const std::string &during) const;

  std::vector<std::string> InfrastructureCommand() const;
  std::vector<std::string> RouterCommand();
  // Processes see the /model and /logs mounts instead of host paths.
  bool InContainer() const;
  // Log directory as seen by the launched process.
  std::string LaunchLogDir() const;
  std::string Resolve(const std::string &host) const;

  const SweepConfig &config_;
  const RuntimeContext &runtime_;
  RemoteLauncher &launcher_;
  ProbeFactory &probes_;
  OrchestratorOptions options_;

  SglangBackend backend_;
  ProcessRegistry registry_;
  CancellationFlag cancel_;
  LifecycleSupervisor supervisor_;

  std::optional<std::vector<EndpointTopology>> topology_;
  SweepStage stage_{SweepStage::kInit};
  std::vector<SweepStage> history_;
  std::vector<FailureRecord> failures_;
  bool ran_{false};
};

} // namespace sweepflux
