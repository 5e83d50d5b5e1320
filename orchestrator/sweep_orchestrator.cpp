#include "orchestrator/sweep_orchestrator.h"

#include "allocation/endpoint_allocator.h"
#include "allocation/process_topology.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "net/host_resolver.h"

#include <stdexcept>

namespace sweepflux {

const char *SweepStageName(SweepStage stage) {
  switch (stage) {
  case SweepStage::kInit:
    return "init";
  case SweepStage::kHeadInfrastructure:
    return "head_infrastructure";
  case SweepStage::kWorkers:
    return "workers";
  case SweepStage::kFrontend:
    return "frontend";
  case SweepStage::kBenchmark:
    return "benchmark";
  case SweepStage::kCleanup:
    return "cleanup";
  case SweepStage::kSuccess:
    return "success";
  case SweepStage::kFailed:
    return "failed";
  }
  return "unknown";
}

namespace {

std::string Join(const std::vector<std::string> &parts) {
  std::string out;
  for (const auto &p : parts) {
    if (!out.empty())
      out += ' ';
    out += p;
  }
  return out;
}

WaitPolicy PortPolicy(const OrchestrationSettings &o) {
  return {o.port_wait_attempts, std::chrono::milliseconds(o.port_wait_interval_ms)};
}

WaitPolicy HealthPolicy(const OrchestrationSettings &o) {
  return {o.health_max_attempts, std::chrono::milliseconds(o.health_interval_ms)};
}

} // namespace

SweepOrchestrator::SweepOrchestrator(const SweepConfig &config,
                                     const RuntimeContext &runtime,
                                     RemoteLauncher &launcher,
                                     ProbeFactory &probes,
                                     OrchestratorOptions options)
    : config_(config), runtime_(runtime), launcher_(launcher), probes_(probes),
      options_(std::move(options)), backend_(config),
      registry_(runtime.job_id,
                std::chrono::milliseconds(config.orchestration.grace_period_ms)),
      supervisor_(registry_, cancel_,
                  std::chrono::milliseconds(config.orchestration.monitor_interval_ms),
                  options_.supervisor_tick) {
  if (!options_.resolve_host)
    options_.resolve_host = ResolveHostIp;
  history_.push_back(stage_);
}

const std::vector<EndpointTopology> &SweepOrchestrator::Topology() {
  if (!topology_) {
    const ResourceSettings &r = config_.resources;
    auto endpoints = AllocateEndpoints(
        r.prefill_workers, r.decode_workers, r.agg_workers,
        r.GpusPerEndpoint(WorkerMode::kPrefill),
        r.GpusPerEndpoint(WorkerMode::kDecode),
        r.GpusPerEndpoint(WorkerMode::kAgg), r.gpus_per_node,
        runtime_.nodes.workers);
    topology_ = BuildTopology(endpoints, r.gpus_per_node,
                              config_.orchestration.base_sys_port);
  }
  return *topology_;
}

int SweepOrchestrator::Run() {
  if (ran_)
    throw std::logic_error("SweepOrchestrator::Run() called twice");
  ran_ = true;

  // Cleanup on every way out of the try block below.
  struct CleanupGuard {
    SweepOrchestrator &self;
    bool &success;
    ~CleanupGuard() { self.Finish(success); }
  };

  bool success = false;
  {
    CleanupGuard guard{*this, success};
    try {
      log::Info("orchestrator", "sweep " + runtime_.run_name + " starting",
                "head=" + runtime_.nodes.head +
                    " workers=" + std::to_string(runtime_.nodes.workers.size()));
      Topology();
      if (options_.install_signal_handlers)
        supervisor_.InstallSignalHandlers();
      supervisor_.Start();

      EnterStage(SweepStage::kHeadInfrastructure);
      StartHeadInfrastructure();
      EnterStage(SweepStage::kWorkers);
      StartWorkers();
      EnterStage(SweepStage::kFrontend);
      StartFrontend();
      EnterStage(SweepStage::kBenchmark);
      success = RunBenchmark();
    } catch (const SweepError &e) {
      log::Error("orchestrator",
                 std::string("stage ") + SweepStageName(stage_) + " failed: " +
                     e.what());
    } catch (const std::exception &e) {
      log::Error("orchestrator",
                 std::string("unexpected error in stage ") +
                     SweepStageName(stage_) + ": " + e.what());
    }
  }
  return success ? 0 : 1;
}

void SweepOrchestrator::EnterStage(SweepStage stage) {
  stage_ = stage;
  history_.push_back(stage);
  log::Section("orchestrator", SweepStageName(stage));
}

void SweepOrchestrator::Finish(bool success) noexcept {
  EnterStage(SweepStage::kCleanup);
  cancel_.Cancel(CancelReason::kShutdown);
  // The signal handlers stay installed until every process is down, so an
  // interrupt during the grace period is ignored instead of killing us.
  supervisor_.CleanupOnce();
  // Blocks behind an interrupt-triggered cleanup still running on the
  // monitor thread, then stops anything registered after that one started.
  registry_.Cleanup();
  supervisor_.Stop();

  failures_ = registry_.Failures();
  for (const auto &f : failures_) {
    if (f.critical)
      success = false;
  }
  if (!failures_.empty())
    failures_ = registry_.ReportFailures();

  stage_ = success ? SweepStage::kSuccess : SweepStage::kFailed;
  history_.push_back(stage_);
  if (success)
    log::Info("orchestrator", "sweep " + runtime_.run_name + " succeeded",
              "log_dir=" + runtime_.log_dir.string());
  else
    log::Error("orchestrator", "sweep " + runtime_.run_name + " failed",
               "log_dir=" + runtime_.log_dir.string());
}

// ── Launch / wait helpers ───────────────────────────────────────────────────

void SweepOrchestrator::Launch(
    const std::string &name, const std::string &node,
    const std::string &log_stem, std::vector<std::string> command,
    std::vector<std::pair<std::string, std::string>> env,
    bool run_to_completion, const std::string &extra_mounts) {
  ThrowIfCancelled("launch of " + name);

  LaunchSpec spec;
  spec.command = std::move(command);
  spec.node = node;
  spec.output = runtime_.LogPath(log_stem);
  spec.env = std::move(env);
  spec.container_image = runtime_.container_image.string();
  spec.container_mounts = runtime_.ContainerMountsString();
  if (!extra_mounts.empty()) {
    if (!spec.container_mounts.empty())
      spec.container_mounts += ',';
    spec.container_mounts += extra_mounts;
  }

  log::Info("orchestrator", "starting " + name + " on " + node,
            "log=" + spec.output.string());
  log::Debug("orchestrator", name + ": " + Join(spec.command));

  ManagedProcess managed;
  managed.name = name;
  managed.node = node;
  managed.log_file = spec.output;
  managed.run_to_completion = run_to_completion;
  managed.handle = launcher_.Start(spec);
  registry_.Add(std::move(managed));
}

void SweepOrchestrator::Await(ReadinessProbe &probe, const WaitPolicy &policy,
                              const std::string &what) {
  log::Info("orchestrator", "waiting for " + what, probe.Describe());
  switch (WaitUntilReady(probe, policy, cancel_)) {
  case WaitResult::kReady:
    log::Info("orchestrator", what + " is ready");
    return;
  case WaitResult::kCancelled:
    ThrowIfCancelled("wait for " + what);
    break;
  case WaitResult::kTimedOut:
    break;
  }
  throw HealthCheckTimeout(what + " not ready after " +
                           std::to_string(policy.max_attempts) + " attempts (" +
                           probe.Describe() + ")");
}

void SweepOrchestrator::ThrowIfCancelled(const std::string &during) const {
  if (!cancel_.IsCancelled())
    return;
  if (cancel_.Reason() == CancelReason::kCriticalFailure)
    throw CriticalProcessFailure("critical process failed during " + during);
  throw SweepError(std::string(CancelReasonName(cancel_.Reason())) +
                   " during " + during);
}

bool SweepOrchestrator::InContainer() const {
  return config_.launcher == LauncherKind::kSrun &&
         !runtime_.container_image.empty();
}

std::string SweepOrchestrator::LaunchLogDir() const {
  return InContainer() ? "/logs" : runtime_.log_dir.string();
}

std::string SweepOrchestrator::Resolve(const std::string &host) const {
  return options_.resolve_host(host);
}

// ── Stages ──────────────────────────────────────────────────────────────────

std::vector<std::string> SweepOrchestrator::InfrastructureCommand() const {
  const auto &infra = config_.infrastructure;
  if (infra.command.empty())
    return {"python3", kSetupScriptMount, "--name", config_.name, "--log-dir",
            LaunchLogDir()};

  std::vector<std::string> cmd;
  cmd.reserve(infra.command.size());
  for (const auto &arg : infra.command)
    cmd.push_back(runtime_.Format(arg));
  return cmd;
}

void SweepOrchestrator::StartHeadInfrastructure() {
  const auto &infra = config_.infrastructure;
  std::string mounts;
  if (infra.command.empty())
    mounts = infra.setup_script + ":" + kSetupScriptMount;

  Launch(kInfrastructureName, runtime_.nodes.head, "infrastructure",
         InfrastructureCommand(), {}, false, mounts);

  const std::string &head = runtime_.head_node_ip;
  auto nats = probes_.Port(head, infra.nats_port);
  Await(*nats, PortPolicy(config_.orchestration),
        "NATS on " + head + ":" + std::to_string(infra.nats_port));
  auto etcd = probes_.Port(head, infra.etcd_port);
  Await(*etcd, PortPolicy(config_.orchestration),
        "etcd on " + head + ":" + std::to_string(infra.etcd_port));
}

std::vector<std::string>
SweepOrchestrator::WorkerCommand(const EndpointTopology &topology,
                                 const Process &process) const {
  WorkerLaunch launch;
  launch.mode = process.endpoint_mode;
  launch.leader_ip = Resolve(topology.endpoint.LeaderNode());
  launch.dist_init_port = config_.orchestration.dist_init_port;
  launch.num_nodes = topology.endpoint.NumNodes();
  launch.node_rank = process.node_rank;
  // <mode>_config_<index>_<node>.json, the name log collectors glob for.
  launch.dump_config_path =
      std::filesystem::path(LaunchLogDir()) /
      (std::string(WorkerModeName(process.endpoint_mode)) + "_config_" +
       std::to_string(process.endpoint_index) + "_" + process.node + ".json");

  const auto model =
      InContainer() ? std::filesystem::path("/model") : runtime_.model_path;
  return backend_.WorkerCommand(launch, model);
}

std::vector<std::pair<std::string, std::string>>
SweepOrchestrator::WorkerEnvironment(const Process &process) const {
  const std::string &head = runtime_.head_node_ip;
  std::vector<std::pair<std::string, std::string>> env = {
      {"HEAD_NODE_IP", head},
      {"ETCD_ENDPOINTS",
       "http://" + head + ":" + std::to_string(config_.infrastructure.etcd_port)},
      {"NATS_SERVER",
       "nats://" + head + ":" + std::to_string(config_.infrastructure.nats_port)},
      {"DYN_SYSTEM_PORT", std::to_string(process.sys_port)},
  };
  if (process.visible_devices)
    env.emplace_back("CUDA_VISIBLE_DEVICES", *process.visible_devices);
  return env;
}

void SweepOrchestrator::StartWorkers() {
  const auto &topology = Topology();
  int launched = 0;
  for (const auto &endpoint : topology) {
    log::Info("orchestrator",
              std::string(WorkerModeName(endpoint.endpoint.mode)) + " endpoint " +
                  std::to_string(endpoint.endpoint.index) + " on " +
                  std::to_string(endpoint.endpoint.NumNodes()) + " node(s)",
              "leader=" + endpoint.endpoint.LeaderNode());
    for (const auto &process : endpoint.processes) {
      Launch(process.Name(), process.node, process.Name(),
             WorkerCommand(endpoint, process), WorkerEnvironment(process));
      ++launched;
    }
  }
  log::Info("orchestrator", "launched " + std::to_string(launched) +
                                " worker process(es)");
}

std::vector<std::string> SweepOrchestrator::RouterCommand() {
  std::vector<std::string> prefill, decode, agg;
  for (const auto &t : Topology()) {
    const std::string ip = Resolve(t.endpoint.LeaderNode());
    switch (t.endpoint.mode) {
    case WorkerMode::kPrefill:
      prefill.push_back(ip);
      break;
    case WorkerMode::kDecode:
      decode.push_back(ip);
      break;
    case WorkerMode::kAgg:
      agg.push_back(ip);
      break;
    }
  }
  return backend_.RouterCommand(prefill, decode, agg);
}

void SweepOrchestrator::StartFrontend() {
  if (backend_.UsesRouter()) {
    Launch(kRouterName, runtime_.nodes.head, "router", RouterCommand(), {});
  } else {
    const std::string &head = runtime_.head_node_ip;
    Launch(kFrontendName, runtime_.nodes.head, "frontend",
           backend_.FrontendCommand(),
           {{"ETCD_ENDPOINTS",
             "http://" + head + ":" + std::to_string(config_.infrastructure.etcd_port)},
            {"NATS_SERVER",
             "nats://" + head + ":" + std::to_string(config_.infrastructure.nats_port)}});
  }
}

bool SweepOrchestrator::RunBenchmark() {
  // The router has no instance list; any 200 means it is serving.
  const int expected =
      backend_.UsesRouter() ? 0 : config_.resources.TotalWorkers();
  auto health = probes_.Health(runtime_.head_node_ip,
                               config_.frontend.http_port, expected);
  Await(*health, HealthPolicy(config_.orchestration),
        "frontend health with " + std::to_string(expected) + " worker(s)");

  if (config_.benchmark.type == "command")
    return RunCommandBenchmark();
  return RunManualBenchmark();
}

bool SweepOrchestrator::RunManualBenchmark() {
  const auto poll =
      std::chrono::milliseconds(config_.orchestration.benchmark_poll_interval_ms);
  log::Info("orchestrator",
            "serving at http://" + runtime_.nodes.head + ":" +
                std::to_string(config_.frontend.http_port) +
                "; interrupt (Ctrl-C) to stop");

  while (!cancel_.WaitFor(poll)) {
    if (registry_.CheckFailures()) {
      cancel_.Cancel(CancelReason::kCriticalFailure);
      break;
    }
  }

  if (cancel_.Reason() == CancelReason::kInterrupted) {
    log::Info("orchestrator", "manual benchmark stopped by operator");
    return true;
  }
  ThrowIfCancelled("manual benchmark");
  return false;
}

bool SweepOrchestrator::RunCommandBenchmark() {
  std::vector<std::string> cmd;
  cmd.reserve(config_.benchmark.command.size());
  for (const auto &arg : config_.benchmark.command)
    cmd.push_back(runtime_.Format(
        arg, {{"endpoint", "http://" + runtime_.head_node_ip + ":" +
                               std::to_string(config_.frontend.http_port)}}));

  Launch(kBenchmarkName, runtime_.nodes.bench, "benchmark", std::move(cmd), {},
         /*run_to_completion=*/true);

  const auto poll =
      std::chrono::milliseconds(config_.orchestration.benchmark_poll_interval_ms);
  for (;;) {
    if (registry_.CheckFailures())
      throw CriticalProcessFailure("critical process failed during benchmark");
    auto status = registry_.StatusOf(kBenchmarkName);
    if (status && status->IsTerminal()) {
      if (status->IsCleanExit()) {
        log::Info("orchestrator", "benchmark completed");
        return true;
      }
      log::Error("orchestrator", "benchmark ended: " + status->Describe());
      return false;
    }
    ThrowIfCancelled("benchmark");
    cancel_.WaitFor(poll);
  }
}

// ── Plan ────────────────────────────────────────────────────────────────────

nlohmann::json SweepOrchestrator::Plan() {
  nlohmann::json plan;
  plan["job_id"] = runtime_.job_id;
  plan["run_name"] = runtime_.run_name;
  plan["head_node"] = runtime_.nodes.head;
  plan["head_node_ip"] = runtime_.head_node_ip;
  plan["bench_node"] = runtime_.nodes.bench;
  plan["log_dir"] = runtime_.log_dir.string();
  plan["container_mounts"] = runtime_.ContainerMountsString();
  plan["infrastructure"] = InfrastructureCommand();

  nlohmann::json endpoints = nlohmann::json::array();
  for (const auto &t : Topology()) {
    nlohmann::json processes = nlohmann::json::array();
    for (const auto &p : t.processes) {
      nlohmann::json env = nlohmann::json::object();
      for (const auto &kv : WorkerEnvironment(p))
        env[kv.first] = kv.second;
      processes.push_back({{"name", p.Name()},
                           {"node", p.node},
                           {"node_rank", p.node_rank},
                           {"gpus", p.gpu_indices},
                           {"sys_port", p.sys_port},
                           {"env", env},
                           {"command", WorkerCommand(t, p)}});
    }
    endpoints.push_back({{"mode", WorkerModeName(t.endpoint.mode)},
                         {"index", t.endpoint.index},
                         {"nodes", t.endpoint.nodes},
                         {"total_gpus", t.endpoint.total_gpus},
                         {"processes", processes}});
  }
  plan["endpoints"] = endpoints;
  plan["frontend"] =
      backend_.UsesRouter() ? RouterCommand() : backend_.FrontendCommand();
  plan["benchmark"] = {{"type", config_.benchmark.type},
                       {"command", config_.benchmark.command}};
  return plan;
}

} // namespace sweepflux
