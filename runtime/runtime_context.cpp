#include "runtime/runtime_context.h"

#include "common/errors.h"
#include "common/logging/logger.h"
#include "net/host_resolver.h"
#include "net/hostlist.h"

#include <chrono>
#include <cstdlib>
#include <ctime>

namespace sweepflux {

namespace fs = std::filesystem;

namespace {

std::string NowTimestamp() {
  std::time_t t =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

} // namespace

NodeLayout NodeLayout::FromList(const std::vector<std::string> &nodes,
                                bool benchmark_on_separate_node) {
  NodeLayout layout;
  if (benchmark_on_separate_node) {
    if (nodes.size() < 2)
      throw ConfigurationError(
          "a separate benchmark node needs at least 2 machines");
    layout.bench = nodes[0];
    layout.head = nodes[1];
    layout.workers.assign(nodes.begin() + 1, nodes.end());
  } else {
    if (nodes.empty())
      throw ConfigurationError("job has no machines");
    layout.head = nodes[0];
    layout.bench = nodes[0];
    layout.workers = nodes;
  }
  return layout;
}

std::string LogDirSuffix(const ResourceSettings &resources) {
  if (resources.prefill_workers > 0) {
    int decode = resources.decode_workers > 0 ? resources.decode_workers : 1;
    return std::to_string(resources.prefill_workers) + "P_" +
           std::to_string(decode) + "D";
  }
  if (resources.agg_workers > 0)
    return std::to_string(resources.agg_workers) + "A";
  return "1P_1D";
}

RuntimeContext RuntimeContext::Create(const SweepConfig &config,
                                      const RuntimeOptions &options) {
  if (options.job_id.empty())
    throw ConfigurationError("job id is required");

  RuntimeContext ctx;
  ctx.job_id = options.job_id;
  ctx.run_name = config.name + "_" + options.job_id;
  ctx.nodes = NodeLayout::FromList(options.nodes,
                                   options.benchmark_on_separate_node);
  ctx.head_node_ip = options.resolve_head_ip ? ResolveHostIp(ctx.nodes.head)
                                             : ctx.nodes.head;
  ctx.gpus_per_node = config.resources.gpus_per_node;

  fs::path base = options.log_dir_base.empty() ? fs::current_path() / "logs"
                                               : options.log_dir_base;
  std::string stamp =
      options.timestamp.empty() ? NowTimestamp() : options.timestamp;
  ctx.log_dir = fs::absolute(base / (options.job_id + "_" +
                                     LogDirSuffix(config.resources) + "_" +
                                     stamp));
  ctx.results_dir = ctx.log_dir / "results";
  if (options.create_directories) {
    std::error_code ec;
    fs::create_directories(ctx.results_dir, ec);
    if (ec)
      throw ConfigurationError("cannot create log directory " +
                               ctx.results_dir.string() + ": " + ec.message());
  }

  ctx.model_path = fs::absolute(config.model.path).lexically_normal();
  if (!config.model.container.empty())
    ctx.container_image =
        fs::absolute(config.model.container).lexically_normal();

  ctx.container_mounts.emplace_back(ctx.model_path.string(), "/model");
  ctx.container_mounts.emplace_back(ctx.log_dir.string(), "/logs");
  ctx.container_mounts.emplace_back(ctx.results_dir.string(), "/results");
  for (const auto &mount : config.extra_mounts) {
    auto colon = mount.find(':');
    ctx.container_mounts.emplace_back(
        fs::absolute(mount.substr(0, colon)).lexically_normal().string(),
        mount.substr(colon + 1));
  }

  log::Info("runtime", "job " + ctx.job_id + " run " + ctx.run_name +
                           " log_dir=" + ctx.log_dir.string());
  return ctx;
}

std::string RuntimeContext::ContainerMountsString() const {
  std::string out;
  for (const auto &[host, container] : container_mounts) {
    if (!out.empty())
      out += ",";
    out += host + ":" + container;
  }
  return out;
}

std::string
RuntimeContext::Format(const std::string &templ,
                       const std::map<std::string, std::string> &extra) const {
  std::map<std::string, std::string> values = {
      {"job_id", job_id},
      {"run_name", run_name},
      {"head_node", nodes.head},
      {"head_node_ip", head_node_ip},
      {"log_dir", log_dir.string()},
      {"results_dir", results_dir.string()},
      {"model_path", model_path.string()},
      {"container_image", container_image.string()},
  };
  for (const auto &[key, value] : extra)
    values[key] = value;

  std::string out;
  std::size_t pos = 0;
  while (pos < templ.size()) {
    auto open = templ.find('{', pos);
    if (open == std::string::npos) {
      out.append(templ, pos, std::string::npos);
      break;
    }
    auto close = templ.find('}', open + 1);
    if (close == std::string::npos) {
      out.append(templ, pos, std::string::npos);
      break;
    }
    out.append(templ, pos, open - pos);
    auto key = templ.substr(open + 1, close - open - 1);
    auto it = values.find(key);
    if (it != values.end())
      out += it->second;
    else
      out.append(templ, open, close - open + 1);
    pos = close + 1;
  }
  return out;
}

fs::path RuntimeContext::LogPath(const std::string &stem) const {
  return log_dir / (stem + "_" + job_id + ".log");
}

std::optional<std::string> SlurmJobIdFromEnv() {
  if (const char *id = std::getenv("SLURM_JOB_ID"); id && *id)
    return std::string(id);
  if (const char *id = std::getenv("SLURM_JOBID"); id && *id)
    return std::string(id);
  return std::nullopt;
}

std::vector<std::string> SlurmNodesFromEnv() {
  const char *raw = std::getenv("SLURM_NODELIST");
  if (!raw || !*raw)
    return {};
  return ExpandHostList(raw);
}

} // namespace sweepflux
