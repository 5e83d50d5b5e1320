#include "config/sweep_config.h"

#include "common/errors.h"
#include "common/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace sweepflux {

FlagValue FlagValue::Bool(bool value) {
  FlagValue v;
  v.kind = Kind::kBool;
  v.enabled = value;
  return v;
}

FlagValue FlagValue::Scalar(std::string value) {
  FlagValue v;
  v.kind = Kind::kScalar;
  v.scalar = std::move(value);
  return v;
}

FlagValue FlagValue::List(std::vector<std::string> values) {
  FlagValue v;
  v.kind = Kind::kList;
  v.items = std::move(values);
  return v;
}

std::vector<std::string> FlagsToArgs(const FlagMap &flags) {
  std::vector<std::string> args;
  for (const auto &[key, value] : flags) {
    std::string flag = "--" + key;
    std::replace(flag.begin(), flag.end(), '_', '-');
    switch (value.kind) {
    case FlagValue::Kind::kBool:
      if (value.enabled)
        args.push_back(flag);
      break;
    case FlagValue::Kind::kList:
      args.push_back(flag);
      args.insert(args.end(), value.items.begin(), value.items.end());
      break;
    case FlagValue::Kind::kScalar:
      args.push_back(flag);
      args.push_back(value.scalar);
      break;
    }
  }
  return args;
}

int ResourceSettings::Workers(WorkerMode mode) const {
  switch (mode) {
  case WorkerMode::kPrefill:
    return prefill_workers;
  case WorkerMode::kDecode:
    return decode_workers;
  case WorkerMode::kAgg:
    return agg_workers;
  }
  return 0;
}

int ResourceSettings::TotalWorkers() const {
  return prefill_workers + decode_workers + agg_workers;
}

int ResourceSettings::GpusPerEndpoint(WorkerMode mode) const {
  int workers = Workers(mode);
  if (workers <= 0)
    return gpus_per_node;
  int nodes = mode == WorkerMode::kPrefill  ? prefill_nodes
              : mode == WorkerMode::kDecode ? decode_nodes
                                            : agg_nodes;
  long long total = static_cast<long long>(nodes) * gpus_per_node;
  if (total / workers > std::numeric_limits<int>::max()) {
    throw ConfigurationError(std::string(WorkerModeName(mode)) + ": " +
                             std::to_string(total) + " GPUs is out of range");
  }
  if (total % workers != 0) {
    throw ConfigurationError(std::string(WorkerModeName(mode)) + ": " +
                             std::to_string(total) + " GPUs do not split evenly over " +
                             std::to_string(workers) + " workers");
  }
  return static_cast<int>(total / workers);
}

FlagMap BackendSettings::ForMode(WorkerMode mode) const {
  FlagMap merged = shared;
  const FlagMap &specific = mode == WorkerMode::kPrefill  ? prefill
                            : mode == WorkerMode::kDecode ? decode
                                                          : aggregated;
  for (const auto &[key, value] : specific)
    merged[key] = value;
  return merged;
}

namespace {

template <typename T>
T Get(const YAML::Node &parent, const char *key, const T &fallback,
      const std::string &where) {
  const YAML::Node node = parent[key];
  if (!node || node.IsNull())
    return fallback;
  try {
    return node.as<T>();
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError((where.empty() ? "" : where + ".") + key + ": " +
                             ex.what());
  }
}

std::vector<std::string> GetList(const YAML::Node &parent, const char *key,
                                 const std::string &where) {
  const YAML::Node node = parent[key];
  if (!node || node.IsNull())
    return {};
  const std::string field = (where.empty() ? "" : where + ".") + key;
  if (!node.IsSequence())
    throw ConfigurationError(field + " must be a list");
  std::vector<std::string> out;
  for (const auto &item : node) {
    if (!item.IsScalar())
      throw ConfigurationError(field + " entries must be scalars");
    out.push_back(item.as<std::string>());
  }
  return out;
}

bool LooksBool(const std::string &text, bool &value) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true") {
    value = true;
    return true;
  }
  if (lowered == "false") {
    value = false;
    return true;
  }
  return false;
}

FlagMap ParseFlagMap(const YAML::Node &node, const std::string &where) {
  FlagMap flags;
  if (!node || node.IsNull())
    return flags;
  if (!node.IsMap())
    throw ConfigurationError(where + " must be a mapping");
  for (const auto &kv : node) {
    auto key = kv.first.as<std::string>();
    const YAML::Node &value = kv.second;
    if (value.IsNull())
      continue;
    if (value.IsSequence()) {
      std::vector<std::string> items;
      for (const auto &item : value) {
        if (!item.IsScalar())
          throw ConfigurationError(where + "." + key +
                                   " list entries must be scalars");
        items.push_back(item.as<std::string>());
      }
      flags[key] = FlagValue::List(std::move(items));
    } else if (value.IsScalar()) {
      auto text = value.Scalar();
      bool b = false;
      if (value.Tag() != "!" && LooksBool(text, b))
        flags[key] = FlagValue::Bool(b);
      else
        flags[key] = FlagValue::Scalar(text);
    } else {
      throw ConfigurationError(where + "." + key +
                               " must be a scalar, bool or list");
    }
  }
  return flags;
}

void RequirePositive(int value, const std::string &what) {
  if (value <= 0)
    throw ConfigurationError(what + " must be positive (got " +
                             std::to_string(value) + ")");
}

void RequireNonNegative(int value, const std::string &what) {
  if (value < 0)
    throw ConfigurationError(what + " must not be negative (got " +
                             std::to_string(value) + ")");
}

void Validate(const SweepConfig &cfg) {
  if (cfg.name.empty())
    throw ConfigurationError("name is required");
  if (cfg.model.path.empty())
    throw ConfigurationError("model.path is required");

  const auto &r = cfg.resources;
  RequirePositive(r.gpus_per_node, "resources.gpus_per_node");
  RequireNonNegative(r.prefill_nodes, "resources.prefill_nodes");
  RequireNonNegative(r.decode_nodes, "resources.decode_nodes");
  RequireNonNegative(r.agg_nodes, "resources.agg_nodes");
  RequireNonNegative(r.prefill_workers, "resources.prefill_workers");
  RequireNonNegative(r.decode_workers, "resources.decode_workers");
  RequireNonNegative(r.agg_workers, "resources.agg_workers");

  if (r.TotalWorkers() == 0)
    throw ConfigurationError("resources: no prefill, decode or agg workers requested");
  if (r.agg_workers > 0 && (r.prefill_workers > 0 || r.decode_workers > 0))
    throw ConfigurationError(
        "resources: aggregated workers cannot be mixed with prefill/decode workers");
  if ((r.prefill_workers > 0) != (r.decode_workers > 0))
    throw ConfigurationError(
        "resources: disaggregated mode needs both prefill and decode workers");

  for (WorkerMode mode :
       {WorkerMode::kPrefill, WorkerMode::kDecode, WorkerMode::kAgg}) {
    if (r.Workers(mode) == 0)
      continue;
    int nodes = mode == WorkerMode::kPrefill  ? r.prefill_nodes
                : mode == WorkerMode::kDecode ? r.decode_nodes
                                              : r.agg_nodes;
    if (nodes == 0)
      throw ConfigurationError(std::string("resources.") + WorkerModeName(mode) +
                               "_nodes must be set when workers are requested");
    r.GpusPerEndpoint(mode); // throws on uneven split
  }

  if (cfg.benchmark.type != "manual" && cfg.benchmark.type != "command")
    throw ConfigurationError("benchmark.type must be 'manual' or 'command' (got '" +
                             cfg.benchmark.type + "')");
  if (cfg.benchmark.type == "command" && cfg.benchmark.command.empty())
    throw ConfigurationError("benchmark.command is required for type 'command'");

  if (cfg.infrastructure.command.empty() && cfg.infrastructure.setup_script.empty())
    throw ConfigurationError(
        "infrastructure needs either 'command' or 'setup_script'");

  for (const auto &mount : cfg.extra_mounts) {
    auto colon = mount.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == mount.size())
      throw ConfigurationError("extra_mount entry must be host:container (got '" +
                               mount + "')");
  }

  const auto &o = cfg.orchestration;
  RequirePositive(o.monitor_interval_ms, "orchestration.monitor_interval_ms");
  RequireNonNegative(o.grace_period_ms, "orchestration.grace_period_ms");
  RequirePositive(o.port_wait_attempts, "orchestration.port_wait_attempts");
  RequirePositive(o.port_wait_interval_ms, "orchestration.port_wait_interval_ms");
  RequirePositive(o.health_max_attempts, "orchestration.health_max_attempts");
  RequirePositive(o.health_interval_ms, "orchestration.health_interval_ms");
  RequirePositive(o.benchmark_poll_interval_ms,
                  "orchestration.benchmark_poll_interval_ms");
  RequirePositive(o.base_sys_port, "orchestration.base_sys_port");
}

} // namespace

SweepConfig ParseSweepConfig(const std::string &yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError(std::string("YAML parse error: ") + ex.what());
  }
  if (!root.IsMap())
    throw ConfigurationError("job file must be a YAML mapping");

  SweepConfig cfg;
  cfg.name = Get<std::string>(root, "name", "", "");

  const YAML::Node model = root["model"];
  if (model) {
    cfg.model.path = Get<std::string>(model, "path", "", "model");
    cfg.model.container = Get<std::string>(model, "container", "", "model");
    cfg.model.precision = Get<std::string>(model, "precision", "", "model");
  }

  const YAML::Node res = root["resources"];
  if (!res || !res.IsMap())
    throw ConfigurationError("resources section is required");
  auto &r = cfg.resources;
  r.gpu_type = Get<std::string>(res, "gpu_type", "", "resources");
  r.gpus_per_node = Get<int>(res, "gpus_per_node", r.gpus_per_node, "resources");
  r.prefill_nodes = Get<int>(res, "prefill_nodes", 0, "resources");
  r.decode_nodes = Get<int>(res, "decode_nodes", 0, "resources");
  r.agg_nodes = Get<int>(res, "agg_nodes", 0, "resources");
  r.prefill_workers = Get<int>(res, "prefill_workers", 0, "resources");
  r.decode_workers = Get<int>(res, "decode_workers", 0, "resources");
  r.agg_workers = Get<int>(res, "agg_workers", 0, "resources");

  const YAML::Node backend = root["backend"];
  if (backend && backend["sglang_config"]) {
    const YAML::Node sg = backend["sglang_config"];
    cfg.backend.shared = ParseFlagMap(sg["shared"], "backend.sglang_config.shared");
    cfg.backend.prefill = ParseFlagMap(sg["prefill"], "backend.sglang_config.prefill");
    cfg.backend.decode = ParseFlagMap(sg["decode"], "backend.sglang_config.decode");
    cfg.backend.aggregated =
        ParseFlagMap(sg["aggregated"], "backend.sglang_config.aggregated");
  }

  const YAML::Node frontend = root["frontend"];
  if (frontend) {
    cfg.frontend.use_sglang_router =
        Get<bool>(frontend, "use_sglang_router", false, "frontend");
    cfg.frontend.http_port =
        Get<int>(frontend, "http_port", cfg.frontend.http_port, "frontend");
    cfg.frontend.dynamo_frontend_args =
        ParseFlagMap(frontend["dynamo_frontend_args"], "frontend.dynamo_frontend_args");
    cfg.frontend.sglang_router_args =
        ParseFlagMap(frontend["sglang_router_args"], "frontend.sglang_router_args");
  }

  const YAML::Node bench = root["benchmark"];
  if (bench) {
    cfg.benchmark.type = Get<std::string>(bench, "type", "manual", "benchmark");
    cfg.benchmark.command = GetList(bench, "command", "benchmark");
  }

  const YAML::Node infra = root["infrastructure"];
  if (infra) {
    cfg.infrastructure.command = GetList(infra, "command", "infrastructure");
    cfg.infrastructure.setup_script =
        Get<std::string>(infra, "setup_script", "", "infrastructure");
    cfg.infrastructure.nats_port =
        Get<int>(infra, "nats_port", cfg.infrastructure.nats_port, "infrastructure");
    cfg.infrastructure.etcd_port =
        Get<int>(infra, "etcd_port", cfg.infrastructure.etcd_port, "infrastructure");
  }

  cfg.extra_mounts = GetList(root, "extra_mount", "");

  auto launcher = Get<std::string>(root, "launcher", "srun", "");
  if (launcher == "srun") {
    cfg.launcher = LauncherKind::kSrun;
  } else if (launcher == "local") {
    cfg.launcher = LauncherKind::kLocal;
  } else {
    throw ConfigurationError("launcher must be 'srun' or 'local' (got '" +
                             launcher + "')");
  }

  const YAML::Node orch = root["orchestration"];
  if (orch) {
    auto &o = cfg.orchestration;
    const std::string w = "orchestration";
    o.base_sys_port = Get<int>(orch, "base_sys_port", o.base_sys_port, w);
    o.dist_init_port = Get<int>(orch, "dist_init_port", o.dist_init_port, w);
    o.monitor_interval_ms =
        Get<int>(orch, "monitor_interval_ms", o.monitor_interval_ms, w);
    o.grace_period_ms = Get<int>(orch, "grace_period_ms", o.grace_period_ms, w);
    o.port_wait_attempts =
        Get<int>(orch, "port_wait_attempts", o.port_wait_attempts, w);
    o.port_wait_interval_ms =
        Get<int>(orch, "port_wait_interval_ms", o.port_wait_interval_ms, w);
    o.health_max_attempts =
        Get<int>(orch, "health_max_attempts", o.health_max_attempts, w);
    o.health_interval_ms =
        Get<int>(orch, "health_interval_ms", o.health_interval_ms, w);
    o.benchmark_poll_interval_ms = Get<int>(
        orch, "benchmark_poll_interval_ms", o.benchmark_poll_interval_ms, w);
  }

  Validate(cfg);
  return cfg;
}

SweepConfig LoadSweepConfig(const std::filesystem::path &path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw ConfigurationError("cannot open job file: " + path.string());
  }
  std::ostringstream buf;
  buf << f.rdbuf();
  auto cfg = ParseSweepConfig(buf.str());
  log::Info("config", "loaded job '" + cfg.name + "' from " + path.string());
  return cfg;
}

} // namespace sweepflux
