#pragma once

#include "allocation/endpoint.h"
#include "config/sweep_config.h"

#include <filesystem>
#include <string>
#include <vector>

namespace sweepflux {

constexpr int kSglangServerPort = 30000;
constexpr int kSglangBootstrapPort = 30001;

// Everything needed to render one worker command line.
struct WorkerLaunch {
  WorkerMode mode{WorkerMode::kAgg};
  std::string leader_ip;
  int dist_init_port{29500};
  int num_nodes{1};
  int node_rank{0};
  std::filesystem::path dump_config_path; // empty: no config dump
};

// Command lines for SGLang workers and the two frontend flavours (dynamo
// frontend, sglang-router).
class SglangBackend {
public:
  explicit SglangBackend(const SweepConfig &config);

  // python3 -m dynamo.sglang (or sglang.launch_server with the router) with
  // the model, disaggregation mode, multi-node flags and the merged
  // per-mode flags from the job file.
  std::vector<std::string> WorkerCommand(const WorkerLaunch &launch,
                                         const std::filesystem::path &model_path) const;

  std::vector<std::string> FrontendCommand() const;

  // Router in PD mode when there are prefill/decode leaders, plain worker
  // list mode for aggregated leaders.
  std::vector<std::string>
  RouterCommand(const std::vector<std::string> &prefill_ips,
                const std::vector<std::string> &decode_ips,
                const std::vector<std::string> &agg_ips) const;

  const std::string &ServedModelName() const { return served_model_name_; }
  bool UsesRouter() const { return use_sglang_router_; }

private:
  BackendSettings settings_;
  FrontendSettings frontend_;
  std::string served_model_name_;
  bool use_sglang_router_;
};

} // namespace sweepflux
