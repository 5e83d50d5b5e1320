#include <catch2/catch.hpp>

#include "common/errors.h"
#include "config/sweep_config.h"
#include "runtime/runtime_context.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sweepflux;

namespace {

SweepConfig DisaggConfig() {
  SweepConfig cfg;
  cfg.name = "sweep";
  cfg.model.path = "/models/llama";
  cfg.model.container = "/images/sglang.sqsh";
  cfg.resources.gpus_per_node = 4;
  cfg.resources.prefill_nodes = 1;
  cfg.resources.prefill_workers = 1;
  cfg.resources.decode_nodes = 2;
  cfg.resources.decode_workers = 2;
  cfg.extra_mounts = {"/scratch/data:/data"};
  return cfg;
}

RuntimeOptions Options() {
  RuntimeOptions opts;
  opts.job_id = "4242";
  opts.nodes = {"gpu01", "gpu02", "gpu03"};
  opts.log_dir_base = fs::temp_directory_path() / "sweepflux_rt_test";
  opts.timestamp = "20250101_120000";
  opts.create_directories = false;
  opts.resolve_head_ip = false;
  return opts;
}

} // namespace

TEST_CASE("RuntimeContext derives names and paths from the job", "[runtime]") {
  auto ctx = RuntimeContext::Create(DisaggConfig(), Options());
  REQUIRE(ctx.job_id == "4242");
  REQUIRE(ctx.run_name == "sweep_4242");
  REQUIRE(ctx.nodes.head == "gpu01");
  REQUIRE(ctx.nodes.bench == "gpu01");
  REQUIRE(ctx.nodes.workers.size() == 3);
  REQUIRE(ctx.head_node_ip == "gpu01");
  REQUIRE(ctx.gpus_per_node == 4);
  REQUIRE(ctx.log_dir.filename() == "4242_1P_2D_20250101_120000");
  REQUIRE(ctx.results_dir == ctx.log_dir / "results");
  REQUIRE(ctx.LogPath("prefill_0_gpu01") ==
          ctx.log_dir / "prefill_0_gpu01_4242.log");
}

TEST_CASE("Container mounts are ordered model, logs, results, extras",
          "[runtime]") {
  auto ctx = RuntimeContext::Create(DisaggConfig(), Options());
  REQUIRE(ctx.container_mounts.size() == 4);
  REQUIRE(ctx.container_mounts[0].second == "/model");
  REQUIRE(ctx.container_mounts[0].first == "/models/llama");
  REQUIRE(ctx.container_mounts[1].second == "/logs");
  REQUIRE(ctx.container_mounts[2].second == "/results");
  REQUIRE(ctx.container_mounts[3].first == "/scratch/data");
  REQUIRE(ctx.container_mounts[3].second == "/data");
  REQUIRE(ctx.ContainerMountsString() ==
          "/models/llama:/model," + ctx.log_dir.string() + ":/logs," +
              ctx.results_dir.string() + ":/results,/scratch/data:/data");
}

TEST_CASE("Format substitutes known placeholders only", "[runtime]") {
  auto ctx = RuntimeContext::Create(DisaggConfig(), Options());
  REQUIRE(ctx.Format("{run_name} on {head_node}") == "sweep_4242 on gpu01");
  REQUIRE(ctx.Format("--out {results_dir}/x.json") ==
          "--out " + ctx.results_dir.string() + "/x.json");
  REQUIRE(ctx.Format("{endpoint}/v1", {{"endpoint", "http://h:8000"}}) ==
          "http://h:8000/v1");
  REQUIRE(ctx.Format("{unknown} {job_id} {") == "{unknown} 4242 {");
}

TEST_CASE("Separate benchmark node shifts the head", "[runtime]") {
  auto layout = NodeLayout::FromList({"b", "h", "w"}, true);
  REQUIRE(layout.bench == "b");
  REQUIRE(layout.head == "h");
  REQUIRE(layout.workers == std::vector<std::string>{"h", "w"});

  REQUIRE_THROWS_AS(NodeLayout::FromList({"only"}, true), ConfigurationError);
  REQUIRE_THROWS_AS(NodeLayout::FromList({}), ConfigurationError);
}

TEST_CASE("Log directory suffix names the role counts", "[runtime]") {
  ResourceSettings r;
  r.prefill_workers = 2;
  r.decode_workers = 4;
  REQUIRE(LogDirSuffix(r) == "2P_4D");

  ResourceSettings agg;
  agg.agg_workers = 3;
  REQUIRE(LogDirSuffix(agg) == "3A");
}

TEST_CASE("A job id is required", "[runtime]") {
  auto opts = Options();
  opts.job_id.clear();
  REQUIRE_THROWS_AS(RuntimeContext::Create(DisaggConfig(), opts),
                    ConfigurationError);
}

TEST_CASE("Create makes the results directory", "[runtime]") {
  auto opts = Options();
  opts.create_directories = true;
  auto ctx = RuntimeContext::Create(DisaggConfig(), opts);
  REQUIRE(fs::is_directory(ctx.results_dir));
  fs::remove_all(opts.log_dir_base);
}

TEST_CASE("SLURM environment is read when present", "[runtime]") {
  ::setenv("SLURM_JOB_ID", "777", 1);
  ::setenv("SLURM_NODELIST", "gpu-[01-02]", 1);
  REQUIRE(SlurmJobIdFromEnv().value_or("") == "777");
  REQUIRE(SlurmNodesFromEnv() == std::vector<std::string>{"gpu-01", "gpu-02"});
  ::unsetenv("SLURM_JOB_ID");
  ::unsetenv("SLURM_JOBID");
  ::unsetenv("SLURM_NODELIST");
  REQUIRE_FALSE(SlurmJobIdFromEnv().has_value());
  REQUIRE(SlurmNodesFromEnv().empty());
}
