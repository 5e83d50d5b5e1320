#pragma once

#include "config/sweep_config.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sweepflux {

// Head, benchmark and worker machines of the job.
struct NodeLayout {
  std::string head;  // Runs NATS, etcd and the frontend.
  std::string bench; // Runs the benchmark client.
  std::vector<std::string> workers;

  // First machine is head (and bench) and all machines are workers. With
  // `benchmark_on_separate_node`, the first machine only runs the benchmark
  // and the second becomes head. Throws ConfigurationError when `nodes` is too
  // short for the requested layout.
  static NodeLayout FromList(const std::vector<std::string> &nodes,
                             bool benchmark_on_separate_node = false);
};

// Inputs that come from outside the job file (scheduler environment, CLI).
struct RuntimeOptions {
  std::string job_id;
  std::vector<std::string> nodes;
  std::filesystem::path log_dir_base; // defaults to ./logs
  std::string timestamp;              // defaults to now, "%Y%m%d_%H%M%S"
  bool benchmark_on_separate_node{false};
  bool create_directories{true};
  bool resolve_head_ip{true};
};

// ── RuntimeContext ──────────────────────────────────────────────────────────
// Every runtime value the sweep needs, computed once at startup and handed to
// each component by const reference. Paths are absolute.
struct RuntimeContext {
  std::string job_id;
  std::string run_name; // "<name>_<job_id>"
  NodeLayout nodes;
  std::string head_node_ip;

  std::filesystem::path log_dir;
  std::filesystem::path results_dir;
  std::filesystem::path model_path;
  std::filesystem::path container_image;

  int gpus_per_node{8};

  // host path -> container path, in mount order.
  std::vector<std::pair<std::string, std::string>> container_mounts;

  static RuntimeContext Create(const SweepConfig &config,
                               const RuntimeOptions &options);

  // "host:container,host:container" as srun expects it.
  std::string ContainerMountsString() const;

  // Replaces {job_id}, {run_name}, {head_node}, {head_node_ip}, {log_dir},
  // {results_dir}, {model_path}, {container_image} and any key of `extra`.
  // Unknown placeholders are left untouched.
  std::string Format(const std::string &templ,
                     const std::map<std::string, std::string> &extra = {}) const;

  std::filesystem::path LogPath(const std::string &stem) const;
};

// "<P>P_<D>D" for disaggregated jobs, "<A>A" for aggregated ones.
std::string LogDirSuffix(const ResourceSettings &resources);

// SLURM_JOB_ID, falling back to SLURM_JOBID.
std::optional<std::string> SlurmJobIdFromEnv();

// Expanded SLURM_NODELIST; empty when unset.
std::vector<std::string> SlurmNodesFromEnv();

} // namespace sweepflux
