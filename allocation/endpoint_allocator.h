#pragma once

#include "allocation/endpoint.h"

#include <string>
#include <vector>

namespace sweepflux {

// Per-role request handed to the allocator.
struct RoleRequest {
  WorkerMode mode;
  int count{0};
  int gpus_per_endpoint{0};
};

// Maps role counts and GPU requirements onto an ordered machine list.
//
// Roles are placed prefill → decode → agg with a single left-to-right cursor
// over `available_nodes`; machines are never shared or reused. An endpoint
// whose requirement fits on one machine takes exactly one machine, otherwise
// it takes `gpus / gpus_per_node` consecutive machines and the first one leads.
//
// Throws ConfigurationError for invalid arithmetic (non-positive GPU counts,
// a multi-machine requirement that is not a multiple of gpus_per_node,
// duplicate machines) and InsufficientResourcesError when the request needs
// more machines than are available. Validation happens before any endpoint is
// built, so a failed call never yields a partial allocation.
std::vector<Endpoint>
AllocateEndpoints(int num_prefill, int num_decode, int num_agg,
                  int gpus_per_prefill, int gpus_per_decode, int gpus_per_agg,
                  int gpus_per_node,
                  const std::vector<std::string> &available_nodes);

// Number of machines one endpoint with `gpus` GPUs consumes. Throws
// ConfigurationError on invalid arithmetic.
int NodesPerEndpoint(int gpus, int gpus_per_node);

// Machines consumed by the whole request; same validation as
// AllocateEndpoints() minus the availability check.
int RequiredNodeCount(const std::vector<RoleRequest> &roles, int gpus_per_node);

} // namespace sweepflux
