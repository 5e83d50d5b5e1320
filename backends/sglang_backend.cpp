#include "backends/sglang_backend.h"

namespace sweepflux {

SglangBackend::SglangBackend(const SweepConfig &config)
    : settings_(config.backend), frontend_(config.frontend),
      served_model_name_(
          std::filesystem::path(config.model.path).lexically_normal().filename().string()),
      use_sglang_router_(config.frontend.use_sglang_router) {
  if (served_model_name_.empty()) {
    // "/models/foo/" normalizes to a trailing empty filename.
    served_model_name_ = std::filesystem::path(config.model.path)
                             .lexically_normal()
                             .parent_path()
                             .filename()
                             .string();
  }
}

std::vector<std::string>
SglangBackend::WorkerCommand(const WorkerLaunch &launch,
                             const std::filesystem::path &model_path) const {
  std::vector<std::string> cmd = {
      "python3",
      "-m",
      use_sglang_router_ ? "sglang.launch_server" : "dynamo.sglang",
      "--model-path",
      model_path.string(),
      "--served-model-name",
      served_model_name_,
      "--host",
      "0.0.0.0",
  };

  if (launch.mode != WorkerMode::kAgg) {
    // With the router, sglang.launch_server needs the mode too.
    cmd.push_back("--disaggregation-mode");
    cmd.push_back(WorkerModeName(launch.mode));
  }

  if (launch.num_nodes > 1) {
    cmd.push_back("--dist-init-addr");
    cmd.push_back(launch.leader_ip + ":" + std::to_string(launch.dist_init_port));
    cmd.push_back("--nnodes");
    cmd.push_back(std::to_string(launch.num_nodes));
    cmd.push_back("--node-rank");
    cmd.push_back(std::to_string(launch.node_rank));
  }

  if (!launch.dump_config_path.empty() && !use_sglang_router_) {
    cmd.push_back("--dump-config-to");
    cmd.push_back(launch.dump_config_path.string());
  }

  auto flags = FlagsToArgs(settings_.ForMode(launch.mode));
  cmd.insert(cmd.end(), flags.begin(), flags.end());
  return cmd;
}

std::vector<std::string> SglangBackend::FrontendCommand() const {
  std::vector<std::string> cmd = {"python3", "-m", "dynamo.frontend",
                                  "--http-port=" +
                                      std::to_string(frontend_.http_port)};
  auto extra = FlagsToArgs(frontend_.dynamo_frontend_args);
  cmd.insert(cmd.end(), extra.begin(), extra.end());
  return cmd;
}

std::vector<std::string>
SglangBackend::RouterCommand(const std::vector<std::string> &prefill_ips,
                             const std::vector<std::string> &decode_ips,
                             const std::vector<std::string> &agg_ips) const {
  std::vector<std::string> cmd = {"python", "-m", "sglang_router.launch_router"};
  auto url = [](const std::string &ip) {
    return "http://" + ip + ":" + std::to_string(kSglangServerPort);
  };

  if (!prefill_ips.empty() || !decode_ips.empty()) {
    cmd.push_back("--pd-disaggregation");
    for (const auto &ip : prefill_ips) {
      cmd.push_back("--prefill");
      cmd.push_back(url(ip));
      cmd.push_back(std::to_string(kSglangBootstrapPort));
    }
    for (const auto &ip : decode_ips) {
      cmd.push_back("--decode");
      cmd.push_back(url(ip));
    }
  } else if (!agg_ips.empty()) {
    cmd.push_back("--worker-urls");
    for (const auto &ip : agg_ips)
      cmd.push_back(url(ip));
  }

  cmd.push_back("--host");
  cmd.push_back("0.0.0.0");
  cmd.push_back("--port");
  cmd.push_back(std::to_string(frontend_.http_port));

  auto extra = FlagsToArgs(frontend_.sglang_router_args);
  cmd.insert(cmd.end(), extra.begin(), extra.end());
  return cmd;
}

} // namespace sweepflux
