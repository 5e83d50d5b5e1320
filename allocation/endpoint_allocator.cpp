#include "allocation/endpoint_allocator.h"

#include "common/errors.h"
#include "common/logging/logger.h"

#include <limits>
#include <unordered_set>

namespace sweepflux {

namespace {

void ValidateRole(const RoleRequest &role, int gpus_per_node) {
  std::string name = WorkerModeName(role.mode);
  if (role.count < 0) {
    throw ConfigurationError(name + " endpoint count must not be negative (got " +
                             std::to_string(role.count) + ")");
  }
  if (role.count == 0) {
    return;
  }
  if (role.gpus_per_endpoint <= 0) {
    throw ConfigurationError(name + " GPU requirement must be positive (got " +
                             std::to_string(role.gpus_per_endpoint) + ")");
  }
  if (role.gpus_per_endpoint > gpus_per_node &&
      role.gpus_per_endpoint % gpus_per_node != 0) {
    throw ConfigurationError(
        name + " GPU requirement not divisible by per-node GPU count (" +
        std::to_string(role.gpus_per_endpoint) + " % " +
        std::to_string(gpus_per_node) + " != 0)");
  }
}

} // namespace

int NodesPerEndpoint(int gpus, int gpus_per_node) {
  if (gpus_per_node <= 0) {
    throw ConfigurationError("gpus_per_node must be positive (got " +
                             std::to_string(gpus_per_node) + ")");
  }
  if (gpus <= 0) {
    throw ConfigurationError("endpoint GPU requirement must be positive (got " +
                             std::to_string(gpus) + ")");
  }
  if (gpus <= gpus_per_node) {
    return 1;
  }
  if (gpus % gpus_per_node != 0) {
    throw ConfigurationError(
        "role GPU requirement not divisible by per-node GPU count (" +
        std::to_string(gpus) + " % " + std::to_string(gpus_per_node) +
        " != 0)");
  }
  return gpus / gpus_per_node;
}

int RequiredNodeCount(const std::vector<RoleRequest> &roles, int gpus_per_node) {
  if (gpus_per_node <= 0) {
    throw ConfigurationError("gpus_per_node must be positive (got " +
                             std::to_string(gpus_per_node) + ")");
  }
  // Counts come from user configuration; sum in 64 bits.
  long long total = 0;
  for (const auto &role : roles) {
    ValidateRole(role, gpus_per_node);
    if (role.count == 0)
      continue;
    total += static_cast<long long>(role.count) *
             NodesPerEndpoint(role.gpus_per_endpoint, gpus_per_node);
  }
  if (total > std::numeric_limits<int>::max()) {
    throw ConfigurationError("request needs " + std::to_string(total) +
                             " machines, more than can be addressed");
  }
  return static_cast<int>(total);
}

std::vector<Endpoint>
AllocateEndpoints(int num_prefill, int num_decode, int num_agg,
                  int gpus_per_prefill, int gpus_per_decode, int gpus_per_agg,
                  int gpus_per_node,
                  const std::vector<std::string> &available_nodes) {
  const std::vector<RoleRequest> roles = {
      {WorkerMode::kPrefill, num_prefill, gpus_per_prefill},
      {WorkerMode::kDecode, num_decode, gpus_per_decode},
      {WorkerMode::kAgg, num_agg, gpus_per_agg},
  };

  int required = RequiredNodeCount(roles, gpus_per_node);

  std::unordered_set<std::string> seen;
  for (const auto &node : available_nodes) {
    if (!seen.insert(node).second) {
      throw ConfigurationError("machine listed more than once: " + node);
    }
  }

  int available = static_cast<int>(available_nodes.size());
  if (required > available) {
    throw InsufficientResourcesError(
        "request needs " + std::to_string(required) + " machines but only " +
            std::to_string(available) + " are available",
        required, available);
  }

  std::vector<Endpoint> endpoints;
  std::size_t cursor = 0;
  for (const auto &role : roles) {
    if (role.count == 0)
      continue;
    int span = NodesPerEndpoint(role.gpus_per_endpoint, gpus_per_node);
    for (int i = 0; i < role.count; ++i) {
      Endpoint ep;
      ep.mode = role.mode;
      ep.index = i;
      ep.total_gpus = role.gpus_per_endpoint;
      ep.nodes.assign(available_nodes.begin() + cursor,
                      available_nodes.begin() + cursor + span);
      cursor += static_cast<std::size_t>(span);
      endpoints.push_back(std::move(ep));
    }
  }

  log::Info("allocator",
            "allocated " + std::to_string(endpoints.size()) + " endpoints on " +
                std::to_string(cursor) + "/" + std::to_string(available) +
                " machines");
  return endpoints;
}

} // namespace sweepflux
