#pragma once

#include "allocation/endpoint.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace sweepflux {

// ── FlagValue / FlagMap ─────────────────────────────────────────────────────
// A backend or frontend option taken from YAML and later rendered as CLI
// flags. `snake_case` keys become `--kebab-case` flags.
struct FlagValue {
  enum class Kind { kBool, kScalar, kList };

  Kind kind{Kind::kScalar};
  bool enabled{false};            // kBool
  std::string scalar;             // kScalar
  std::vector<std::string> items; // kList

  static FlagValue Bool(bool value);
  static FlagValue Scalar(std::string value);
  static FlagValue List(std::vector<std::string> values);
};

// Ordered by key so rendered command lines are deterministic.
using FlagMap = std::map<std::string, FlagValue>;

// Renders `flags` as CLI arguments: true bools become bare flags, false bools
// are dropped, lists become the flag followed by each item.
std::vector<std::string> FlagsToArgs(const FlagMap &flags);

// ── Settings blocks ─────────────────────────────────────────────────────────

struct ModelSettings {
  std::string path;
  std::string container;
  std::string precision;
};

struct ResourceSettings {
  std::string gpu_type;
  int gpus_per_node{8};
  int prefill_nodes{0};
  int decode_nodes{0};
  int agg_nodes{0};
  int prefill_workers{0};
  int decode_workers{0};
  int agg_workers{0};

  // Per-endpoint GPU requirement for `mode`: nodes * gpus_per_node / workers.
  // A role with no workers reports gpus_per_node. Throws ConfigurationError
  // when the division is not exact.
  int GpusPerEndpoint(WorkerMode mode) const;
  int Workers(WorkerMode mode) const;
  int TotalWorkers() const;
  bool IsDisaggregated() const { return prefill_workers > 0; }
};

struct BackendSettings {
  FlagMap shared;
  FlagMap prefill;
  FlagMap decode;
  FlagMap aggregated;

  // shared merged with the mode-specific map; mode-specific keys win.
  FlagMap ForMode(WorkerMode mode) const;
};

struct FrontendSettings {
  bool use_sglang_router{false};
  int http_port{8000};
  FlagMap dynamo_frontend_args;
  FlagMap sglang_router_args;
};

struct BenchmarkSettings {
  std::string type{"manual"}; // "manual" or "command"
  std::vector<std::string> command;
};

struct InfrastructureSettings {
  std::vector<std::string> command;
  std::string setup_script; // host path, mounted at kSetupScriptMount
  int nats_port{4222};
  int etcd_port{2379};
};

enum class LauncherKind { kSrun, kLocal };

struct OrchestrationSettings {
  int base_sys_port{8081};
  int dist_init_port{29500};
  int monitor_interval_ms{2000};
  int grace_period_ms{10000};
  int port_wait_attempts{60};
  int port_wait_interval_ms{1000};
  int health_max_attempts{60};
  int health_interval_ms{10000};
  int benchmark_poll_interval_ms{5000};
};

// ── SweepConfig ─────────────────────────────────────────────────────────────
// Validated job description. Built once by LoadSweepConfig() and consumed as
// immutable data by the orchestrator.
struct SweepConfig {
  std::string name;
  ModelSettings model;
  ResourceSettings resources;
  BackendSettings backend;
  FrontendSettings frontend;
  BenchmarkSettings benchmark;
  InfrastructureSettings infrastructure;
  std::vector<std::string> extra_mounts; // "host:container"
  LauncherKind launcher{LauncherKind::kSrun};
  OrchestrationSettings orchestration;
};

constexpr const char *kSetupScriptMount = "/tmp/setup_head.py";

// Parse and validate YAML text. Throws ConfigurationError on YAML syntax
// errors, wrong value types and invalid resource arithmetic.
SweepConfig ParseSweepConfig(const std::string &yaml_text);

// Read `path` and ParseSweepConfig() its contents.
SweepConfig LoadSweepConfig(const std::filesystem::path &path);

} // namespace sweepflux
