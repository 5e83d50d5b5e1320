#include <catch2/catch.hpp>

#include "allocation/endpoint_allocator.h"
#include "allocation/process_topology.h"
#include "common/errors.h"

#include <set>
#include <string>
#include <vector>

using namespace sweepflux;

TEST_CASE("One process per endpoint machine with increasing node_rank",
          "[topology]") {
  auto eps = AllocateEndpoints(1, 2, 0, 16, 8, 8, 8,
                               {"g1", "g2", "g3", "g4"});
  auto topo = BuildTopology(eps, 8);
  REQUIRE(topo.size() == 3);

  const auto &prefill = topo[0];
  REQUIRE(prefill.processes.size() == 2);
  REQUIRE(prefill.processes[0].node == "g1");
  REQUIRE(prefill.processes[0].node_rank == 0);
  REQUIRE(prefill.processes[1].node == "g2");
  REQUIRE(prefill.processes[1].node_rank == 1);
  REQUIRE(prefill.processes[1].endpoint_mode == WorkerMode::kPrefill);
  REQUIRE(prefill.processes[1].endpoint_index == 0);

  REQUIRE(topo[2].processes.size() == 1);
  REQUIRE(topo[2].processes[0].Name() == "decode_1_g4");
}

TEST_CASE("Full-machine processes carry no device mask", "[topology]") {
  auto eps = AllocateEndpoints(1, 1, 0, 16, 8, 8, 8, {"a", "b", "c"});
  for (const auto &p : BuildProcesses(eps, 8)) {
    REQUIRE(p.gpu_indices == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7});
    REQUIRE_FALSE(p.visible_devices.has_value());
  }
}

TEST_CASE("Partial-machine processes get a restricted device mask",
          "[topology]") {
  auto eps = AllocateEndpoints(0, 0, 2, 8, 8, 2, 8, {"a", "b"});
  auto procs = BuildProcesses(eps, 8);
  REQUIRE(procs.size() == 2);
  REQUIRE(procs[0].gpu_indices == std::vector<int>{0, 1});
  REQUIRE(procs[0].visible_devices.has_value());
  REQUIRE(*procs[0].visible_devices == "0,1");
  REQUIRE(procs[0].CudaVisibleDevices() == "0,1");
}

TEST_CASE("sys_port counts up over the whole process list", "[topology]") {
  auto eps = AllocateEndpoints(2, 2, 0, 8, 4, 4, 4,
                               {"n1", "n2", "n3", "n4", "n5", "n6"});
  auto procs = BuildProcesses(eps, 4, 9000);
  REQUIRE(procs.size() == 6);
  std::set<int> ports;
  for (std::size_t i = 0; i < procs.size(); ++i) {
    REQUIRE(procs[i].sys_port == 9000 + static_cast<int>(i));
    ports.insert(procs[i].sys_port);
  }
  REQUIRE(ports.size() == procs.size());
  REQUIRE(BuildProcesses(eps, 4).front().sys_port == kDefaultBaseSysPort);
}

TEST_CASE("Flattened processes keep endpoint order", "[topology]") {
  auto eps = AllocateEndpoints(1, 1, 0, 8, 8, 8, 4, {"a", "b", "c", "d"});
  auto procs = BuildProcesses(eps, 4);
  std::vector<std::string> names;
  for (const auto &p : procs)
    names.push_back(p.Name());
  REQUIRE(names == std::vector<std::string>{"prefill_0_a", "prefill_0_b",
                                            "decode_0_c", "decode_0_d"});
}

TEST_CASE("Malformed endpoints are rejected", "[topology]") {
  Endpoint empty;
  empty.total_gpus = 8;
  REQUIRE_THROWS_AS(BuildTopology({empty}, 8), ConfigurationError);

  Endpoint uneven;
  uneven.nodes = {"a", "b"};
  uneven.total_gpus = 7;
  REQUIRE_THROWS_AS(BuildTopology({uneven}, 8), ConfigurationError);

  REQUIRE_THROWS_AS(BuildTopology({}, 0), ConfigurationError);
}
