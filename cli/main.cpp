#include "common/errors.h"
#include "common/logging/logger.h"
#include "config/sweep_config.h"
#include "launch/launchers.h"
#include "net/hostlist.h"
#include "orchestrator/sweep_orchestrator.h"
#include "runtime/runtime_context.h"
#include "supervisor/readiness.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace sweepflux;

namespace {

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  sweepflux-sweep <config.yaml> [--log-dir DIR] [--job-id ID]\n"
      << "                  [--nodes HOSTLIST] [--bench-node] [--dry-run]\n"
      << "\n"
      << "      Launches the disaggregated serving topology described by the\n"
      << "      job file inside the current SLURM allocation, waits until it\n"
      << "      is healthy and runs the configured benchmark.\n"
      << "\n"
      << "  --log-dir DIR     base directory for run logs (default ./logs)\n"
      << "  --job-id ID       job id (default $SLURM_JOB_ID)\n"
      << "  --nodes HOSTLIST  machines, e.g. 'gpu-[01-04]' (default "
         "$SLURM_NODELIST)\n"
      << "  --bench-node      run the benchmark client on its own machine\n"
      << "  --dry-run         print the launch plan as JSON and exit\n"
      << "\n"
      << "Environment: SWEEPFLUX_LOG_FORMAT=json, "
         "SWEEPFLUX_LOG_LEVEL=debug|info|warn|error\n";
}

void ConfigureLogging() {
  if (const char *fmt = std::getenv("SWEEPFLUX_LOG_FORMAT")) {
    log::SetJsonMode(std::string(fmt) == "json");
  }
  if (const char *level = std::getenv("SWEEPFLUX_LOG_LEVEL")) {
    log::SetMinLevel(log::ParseLevel(level));
  }
}

} // namespace

int main(int argc, char **argv) {
  ConfigureLogging();

  std::string config_path;
  RuntimeOptions options;
  std::string nodes_arg;
  bool dry_run = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else if (arg == "--log-dir" && i + 1 < argc) {
      options.log_dir_base = argv[++i];
    } else if (arg == "--job-id" && i + 1 < argc) {
      options.job_id = argv[++i];
    } else if (arg == "--nodes" && i + 1 < argc) {
      nodes_arg = argv[++i];
    } else if (arg == "--bench-node") {
      options.benchmark_on_separate_node = true;
    } else if (arg == "--dry-run") {
      dry_run = true;
    } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
      config_path = arg;
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << "\n";
      PrintUsage();
      return 1;
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return 1;
  }

  try {
    SweepConfig config = LoadSweepConfig(config_path);

    if (options.job_id.empty()) {
      if (auto id = SlurmJobIdFromEnv()) {
        options.job_id = *id;
      } else if (dry_run) {
        options.job_id = "dryrun";
      } else {
        throw ConfigurationError(
            "no job id: pass --job-id or run inside a SLURM allocation");
      }
    }
    log::SetJobContext(options.job_id);
    options.nodes = nodes_arg.empty() ? SlurmNodesFromEnv()
                                      : ExpandHostList(nodes_arg);
    if (options.nodes.empty())
      throw ConfigurationError(
          "no nodes: pass --nodes or run inside a SLURM allocation");
    if (dry_run) {
      options.create_directories = false;
      options.resolve_head_ip = false;
    }

    const RuntimeContext runtime = RuntimeContext::Create(config, options);

    std::unique_ptr<RemoteLauncher> launcher;
    if (config.launcher == LauncherKind::kLocal)
      launcher = std::make_unique<LocalLauncher>();
    else
      launcher = std::make_unique<SrunLauncher>();
    NetworkProbeFactory probes;

    OrchestratorOptions orchestrator_options;
    if (dry_run)
      orchestrator_options.resolve_host = [](const std::string &host) {
        return host;
      };
    SweepOrchestrator orchestrator(config, runtime, *launcher, probes,
                                   orchestrator_options);

    if (dry_run) {
      std::cout << orchestrator.Plan().dump(2) << std::endl;
      return 0;
    }

    log::Info("main", "launcher " + launcher->Name() + ", " +
                          std::to_string(config.resources.TotalWorkers()) +
                          " worker endpoint(s) on " +
                          std::to_string(runtime.nodes.workers.size()) +
                          " node(s)");
    return orchestrator.Run();
  } catch (const SweepError &e) {
    log::Error("main", e.what());
    return 1;
  } catch (const std::exception &e) {
    log::Error("main", std::string("fatal: ") + e.what());
    return 1;
  }
}
