#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sweepflux {

// Serving role of an endpoint in disaggregated inference.
enum class WorkerMode { kPrefill, kDecode, kAgg };

// "prefill", "decode", "agg".
const char *WorkerModeName(WorkerMode mode);

// ── Endpoint ────────────────────────────────────────────────────────────────
// One logical serving unit, possibly spanning several machines. Produced by
// AllocateEndpoints() and never modified afterwards.
struct Endpoint {
  WorkerMode mode{WorkerMode::kAgg};
  int index{0};                   // 0-based, unique within `mode`.
  std::vector<std::string> nodes; // Ordered; nodes[0] is the leader.
  int total_gpus{0};

  int NumNodes() const { return static_cast<int>(nodes.size()); }
  const std::string &LeaderNode() const { return nodes.front(); }
  int GpusPerProcess() const { return total_gpus / NumNodes(); }
  bool IsMultiNode() const { return nodes.size() > 1; }
};

// ── Process ─────────────────────────────────────────────────────────────────
// One physical worker process: the part of an endpoint that runs on a single
// machine.
struct Process {
  std::string node;
  int node_rank{0};
  std::vector<int> gpu_indices;
  WorkerMode endpoint_mode{WorkerMode::kAgg};
  int endpoint_index{0};
  int sys_port{0};
  // Set only when the process owns a subset of the machine's GPUs.
  std::optional<std::string> visible_devices;

  // Comma-separated gpu_indices, e.g. "0,1,2,3".
  std::string CudaVisibleDevices() const;
  // "<mode>_<index>_<node>"; unique within a job.
  std::string Name() const;
};

// An endpoint together with the processes it owns, in node_rank order.
struct EndpointTopology {
  Endpoint endpoint;
  std::vector<Process> processes;
};

} // namespace sweepflux
