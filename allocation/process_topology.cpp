#include "allocation/process_topology.h"

#include "common/errors.h"

namespace sweepflux {

std::vector<EndpointTopology>
BuildTopology(const std::vector<Endpoint> &endpoints, int gpus_per_node,
              int base_port) {
  if (gpus_per_node <= 0) {
    throw ConfigurationError("gpus_per_node must be positive (got " +
                             std::to_string(gpus_per_node) + ")");
  }

  std::vector<EndpointTopology> topology;
  topology.reserve(endpoints.size());
  int port = base_port;

  for (const auto &endpoint : endpoints) {
    if (endpoint.nodes.empty()) {
      throw ConfigurationError(std::string(WorkerModeName(endpoint.mode)) +
                               " endpoint " + std::to_string(endpoint.index) +
                               " has no machines");
    }
    if (endpoint.total_gpus % endpoint.NumNodes() != 0) {
      throw ConfigurationError(
          std::string(WorkerModeName(endpoint.mode)) + " endpoint " +
          std::to_string(endpoint.index) + ": " +
          std::to_string(endpoint.total_gpus) + " GPUs do not split over " +
          std::to_string(endpoint.NumNodes()) + " machines");
    }
    int per_process = endpoint.GpusPerProcess();

    EndpointTopology entry;
    entry.endpoint = endpoint;
    for (int rank = 0; rank < endpoint.NumNodes(); ++rank) {
      Process p;
      p.node = endpoint.nodes[static_cast<std::size_t>(rank)];
      p.node_rank = rank;
      p.endpoint_mode = endpoint.mode;
      p.endpoint_index = endpoint.index;
      p.sys_port = port++;
      for (int g = 0; g < per_process; ++g)
        p.gpu_indices.push_back(g);
      if (per_process < gpus_per_node)
        p.visible_devices = p.CudaVisibleDevices();
      entry.processes.push_back(std::move(p));
    }
    topology.push_back(std::move(entry));
  }
  return topology;
}

std::vector<Process> BuildProcesses(const std::vector<Endpoint> &endpoints,
                                    int gpus_per_node, int base_port) {
  std::vector<Process> flat;
  for (auto &entry : BuildTopology(endpoints, gpus_per_node, base_port)) {
    for (auto &p : entry.processes)
      flat.push_back(std::move(p));
  }
  return flat;
}

} // namespace sweepflux
