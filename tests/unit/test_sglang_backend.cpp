#include <catch2/catch.hpp>

#include "backends/sglang_backend.h"
#include "config/sweep_config.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace sweepflux;

namespace {

SweepConfig BaseConfig() {
  SweepConfig cfg;
  cfg.name = "sweep";
  cfg.model.path = "/models/DeepSeek-R1/";
  cfg.backend.shared["tp_size"] = FlagValue::Scalar("8");
  cfg.backend.shared["trust_remote_code"] = FlagValue::Bool(true);
  cfg.backend.prefill["tp_size"] = FlagValue::Scalar("16");
  cfg.backend.aggregated["mem_fraction_static"] = FlagValue::Scalar("0.8");
  return cfg;
}

bool Contains(const std::vector<std::string> &argv, const std::string &arg) {
  return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

std::string After(const std::vector<std::string> &argv, const std::string &arg) {
  auto it = std::find(argv.begin(), argv.end(), arg);
  if (it == argv.end() || it + 1 == argv.end())
    return {};
  return *(it + 1);
}

} // namespace

TEST_CASE("Served model name is the model directory name", "[sglang]") {
  SglangBackend backend(BaseConfig());
  REQUIRE(backend.ServedModelName() == "DeepSeek-R1");
}

TEST_CASE("Single-node prefill worker command", "[sglang]") {
  SglangBackend backend(BaseConfig());
  WorkerLaunch launch;
  launch.mode = WorkerMode::kPrefill;
  launch.leader_ip = "10.0.0.1";
  launch.dump_config_path = "/logs/prefill_0_n1_config.json";

  auto cmd = backend.WorkerCommand(launch, "/model");
  REQUIRE(std::vector<std::string>(cmd.begin(), cmd.begin() + 3) ==
          std::vector<std::string>{"python3", "-m", "dynamo.sglang"});
  REQUIRE(After(cmd, "--model-path") == "/model");
  REQUIRE(After(cmd, "--served-model-name") == "DeepSeek-R1");
  REQUIRE(After(cmd, "--disaggregation-mode") == "prefill");
  REQUIRE(After(cmd, "--dump-config-to") == "/logs/prefill_0_n1_config.json");
  REQUIRE(After(cmd, "--tp-size") == "16");
  REQUIRE(Contains(cmd, "--trust-remote-code"));
  REQUIRE_FALSE(Contains(cmd, "--dist-init-addr"));
}

TEST_CASE("Multi-node worker gets distributed init flags", "[sglang]") {
  SglangBackend backend(BaseConfig());
  WorkerLaunch launch;
  launch.mode = WorkerMode::kDecode;
  launch.leader_ip = "10.0.0.5";
  launch.num_nodes = 2;
  launch.node_rank = 1;

  auto cmd = backend.WorkerCommand(launch, "/model");
  REQUIRE(After(cmd, "--dist-init-addr") == "10.0.0.5:29500");
  REQUIRE(After(cmd, "--nnodes") == "2");
  REQUIRE(After(cmd, "--node-rank") == "1");
  REQUIRE(After(cmd, "--disaggregation-mode") == "decode");
  REQUIRE(After(cmd, "--tp-size") == "8");
  REQUIRE_FALSE(Contains(cmd, "--dump-config-to"));
}

TEST_CASE("Aggregated worker has no disaggregation mode", "[sglang]") {
  SglangBackend backend(BaseConfig());
  WorkerLaunch launch;
  launch.mode = WorkerMode::kAgg;
  auto cmd = backend.WorkerCommand(launch, "/model");
  REQUIRE_FALSE(Contains(cmd, "--disaggregation-mode"));
  REQUIRE(After(cmd, "--mem-fraction-static") == "0.8");
}

TEST_CASE("Router mode launches plain sglang servers", "[sglang]") {
  auto cfg = BaseConfig();
  cfg.frontend.use_sglang_router = true;
  SglangBackend backend(cfg);
  REQUIRE(backend.UsesRouter());

  WorkerLaunch launch;
  launch.mode = WorkerMode::kPrefill;
  launch.dump_config_path = "/logs/x.json";
  auto cmd = backend.WorkerCommand(launch, "/model");
  REQUIRE(cmd[2] == "sglang.launch_server");
  REQUIRE(After(cmd, "--disaggregation-mode") == "prefill");
  REQUIRE_FALSE(Contains(cmd, "--dump-config-to"));
}

TEST_CASE("Dynamo frontend command", "[sglang]") {
  auto cfg = BaseConfig();
  cfg.frontend.dynamo_frontend_args["router_mode"] = FlagValue::Scalar("kv");
  SglangBackend backend(cfg);
  REQUIRE(backend.FrontendCommand() ==
          std::vector<std::string>{"python3", "-m", "dynamo.frontend",
                                   "--http-port=8000", "--router-mode", "kv"});
}

TEST_CASE("Router command in prefill/decode mode", "[sglang]") {
  auto cfg = BaseConfig();
  cfg.frontend.use_sglang_router = true;
  SglangBackend backend(cfg);
  auto cmd = backend.RouterCommand({"10.0.0.1"}, {"10.0.0.2", "10.0.0.3"}, {});
  REQUIRE(cmd == std::vector<std::string>{
                     "python", "-m", "sglang_router.launch_router",
                     "--pd-disaggregation", "--prefill",
                     "http://10.0.0.1:30000", "30001", "--decode",
                     "http://10.0.0.2:30000", "--decode",
                     "http://10.0.0.3:30000", "--host", "0.0.0.0", "--port",
                     "8000"});
}

TEST_CASE("Router command for aggregated workers", "[sglang]") {
  auto cfg = BaseConfig();
  cfg.frontend.use_sglang_router = true;
  cfg.frontend.sglang_router_args["policy"] = FlagValue::Scalar("round_robin");
  SglangBackend backend(cfg);
  auto cmd = backend.RouterCommand({}, {}, {"a", "b"});
  REQUIRE(After(cmd, "--worker-urls") == "http://a:30000");
  REQUIRE(Contains(cmd, "http://b:30000"));
  REQUIRE_FALSE(Contains(cmd, "--pd-disaggregation"));
  REQUIRE(After(cmd, "--policy") == "round_robin");
}
