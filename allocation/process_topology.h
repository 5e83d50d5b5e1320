#pragma once

#include "allocation/endpoint.h"

#include <vector>

namespace sweepflux {

constexpr int kDefaultBaseSysPort = 8081;

// Expands every endpoint into one process per machine it spans, keeping the
// endpoint order and increasing node_rank within an endpoint.
//
// Each process gets total_gpus / num_nodes local GPU indices starting at 0.
// When that is fewer than `gpus_per_node`, the process carries a restricted
// device mask. sys_port is base_port plus a counter over the whole process
// list, so ports are unique within the job.
std::vector<EndpointTopology>
BuildTopology(const std::vector<Endpoint> &endpoints, int gpus_per_node,
              int base_port = kDefaultBaseSysPort);

// Flattened view of BuildTopology(), in the same order.
std::vector<Process> BuildProcesses(const std::vector<Endpoint> &endpoints,
                                    int gpus_per_node,
                                    int base_port = kDefaultBaseSysPort);

} // namespace sweepflux
