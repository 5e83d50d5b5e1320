#include <catch2/catch.hpp>

#include "common/logging/logger.h"
#include "launch/posix_process.h"
#include "supervisor/process_registry.h"
#include "tests/unit/fake_process.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace sweepflux;
using namespace sweepflux::testing;
using namespace std::chrono_literals;

namespace {

ManagedProcess MakeFake(const std::string &name,
                        std::shared_ptr<FakeProcessState> state,
                        bool critical = true, bool run_to_completion = false) {
  ManagedProcess p;
  p.name = name;
  p.node = "node1";
  p.handle = std::make_unique<FakeProcessHandle>(std::move(state));
  p.log_file = "/tmp/" + name + ".log";
  p.critical = critical;
  p.run_to_completion = run_to_completion;
  return p;
}

std::shared_ptr<FakeProcessState> Running() {
  return std::make_shared<FakeProcessState>();
}

// JSON logging into `out` for the lifetime of the object.
class JsonCapture {
public:
  explicit JsonCapture(std::ostringstream &out)
      : old_(std::cerr.rdbuf(out.rdbuf())) {
    log::SetJsonMode(true);
  }
  ~JsonCapture() {
    log::SetJsonMode(false);
    std::cerr.rdbuf(old_);
  }

private:
  std::streambuf *old_;
};

} // namespace

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

TEST_CASE("Registry rejects duplicate names and null handles", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  reg.Add(MakeFake("prefill_0_n1", Running()));
  REQUIRE(reg.Size() == 1);
  REQUIRE(reg.JobId() == "job1");

  REQUIRE_THROWS_AS(reg.Add(MakeFake("prefill_0_n1", Running())),
                    std::logic_error);

  ManagedProcess empty;
  empty.name = "nohandle";
  REQUIRE_THROWS_AS(reg.Add(std::move(empty)), std::invalid_argument);
  REQUIRE(reg.Size() == 1);
}

TEST_CASE("AddMany registers every process", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  NamedProcesses batch;
  batch.emplace("decode_0_n2", MakeFake("decode_0_n2", Running()));
  batch.emplace("decode_1_n3", MakeFake("decode_1_n3", Running()));
  reg.AddMany(std::move(batch));
  REQUIRE(reg.Names() == std::vector<std::string>{"decode_0_n2", "decode_1_n3"});
}

// ---------------------------------------------------------------------------
// Failure semantics
// ---------------------------------------------------------------------------

TEST_CASE("No failures while everything runs", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  reg.Add(MakeFake("a", Running()));
  reg.Add(MakeFake("b", Running(), /*critical=*/false));
  REQUIRE_FALSE(reg.CheckFailures());
  REQUIRE(reg.Failures().empty());
  REQUIRE(reg.StatusOf("a")->IsRunning());
  REQUIRE_FALSE(reg.StatusOf("missing").has_value());
}

TEST_CASE("Critical non-zero exit is a failure", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto state = Running();
  reg.Add(MakeFake("decode_0_n2", state));
  state->Finish(ProcessStatus::Exited(2));

  REQUIRE(reg.CheckFailures());
  auto failures = reg.ReportFailures();
  REQUIRE(failures.size() == 1);
  REQUIRE(failures[0].name == "decode_0_n2");
  REQUIRE(failures[0].node == "node1");
  REQUIRE(failures[0].status.exit_code == 2);
  REQUIRE(failures[0].critical);
}

TEST_CASE("Critical server exiting cleanly is still a failure", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto state = Running();
  reg.Add(MakeFake("frontend", state));
  state->Finish(ProcessStatus::Exited(0));
  REQUIRE(reg.CheckFailures());
}

TEST_CASE("Critical death by signal is a failure", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto state = Running();
  reg.Add(MakeFake("prefill_0_n1", state));
  state->Finish(ProcessStatus::Killed(SIGSEGV));
  REQUIRE(reg.CheckFailures());
  REQUIRE(reg.StatusOf("prefill_0_n1")->state == ProcessStatus::State::kKilled);
}

TEST_CASE("Run-to-completion process exiting zero is not a failure",
          "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto state = Running();
  reg.Add(MakeFake("benchmark", state, true, /*run_to_completion=*/true));
  state->Finish(ProcessStatus::Exited(0));
  REQUIRE_FALSE(reg.CheckFailures());
  REQUIRE(reg.StatusOf("benchmark")->IsCleanExit());
  REQUIRE(reg.Failures().empty());
}

TEST_CASE("Non-critical completions and failures do not fail the run",
          "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto ok = Running();
  auto bad = Running();
  reg.Add(MakeFake("helper_ok", ok, /*critical=*/false));
  reg.Add(MakeFake("helper_bad", bad, /*critical=*/false));
  ok->Finish(ProcessStatus::Exited(0));
  bad->Finish(ProcessStatus::Exited(1));

  REQUIRE_FALSE(reg.CheckFailures());
  auto failures = reg.Failures();
  REQUIRE(failures.size() == 1);
  REQUIRE(failures[0].name == "helper_bad");
  REQUIRE_FALSE(failures[0].critical);
}

TEST_CASE("Terminal status is sticky", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto state = Running();
  reg.Add(MakeFake("a", state));
  state->Finish(ProcessStatus::Exited(4));
  REQUIRE(reg.CheckFailures());
  int polls = state->poll_calls.load();
  REQUIRE(reg.CheckFailures());
  REQUIRE(state->poll_calls.load() == polls);
}

// ---------------------------------------------------------------------------
// Cleanup
// ---------------------------------------------------------------------------

TEST_CASE("Cleanup terminates running processes once", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto a = Running();
  auto b = Running();
  auto done = Running();
  reg.Add(MakeFake("a", a));
  reg.Add(MakeFake("b", b));
  reg.Add(MakeFake("done", done, true, true));
  done->Finish(ProcessStatus::Exited(0));

  REQUIRE_NOTHROW(reg.Cleanup());
  REQUIRE(a->terminate_calls.load() == 1);
  REQUIRE(b->terminate_calls.load() == 1);
  REQUIRE(done->terminate_calls.load() == 0);
  REQUIRE(a->kill_calls.load() == 0);

  // Stopped by the registry, so not reported as failures.
  REQUIRE_FALSE(reg.CheckFailures());
  REQUIRE(reg.Failures().empty());

  REQUIRE_NOTHROW(reg.Cleanup());
  REQUIRE(a->terminate_calls.load() == 1);
  REQUIRE(b->terminate_calls.load() == 1);
}

TEST_CASE("Cleanup force-kills processes that ignore SIGTERM", "[registry]") {
  ProcessRegistry reg("job1", 50ms, 5ms);
  auto stubborn = Running();
  stubborn->exits_on_terminate = false;
  reg.Add(MakeFake("stubborn", stubborn));

  auto start = std::chrono::steady_clock::now();
  reg.Cleanup();
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(stubborn->terminate_calls.load() == 1);
  REQUIRE(stubborn->kill_calls.load() == 1);
  REQUIRE(reg.StatusOf("stubborn")->signal == 9);
  REQUIRE(elapsed >= 50ms);
  REQUIRE(elapsed < 2s);
}

TEST_CASE("Failures before cleanup stay reported after it", "[registry]") {
  ProcessRegistry reg("job1", 100ms, 5ms);
  auto crashed = Running();
  auto healthy = Running();
  reg.Add(MakeFake("decode_0_n2", crashed));
  reg.Add(MakeFake("decode_1_n3", healthy));
  crashed->Finish(ProcessStatus::Exited(139));

  reg.Cleanup();
  auto failures = reg.Failures();
  REQUIRE(failures.size() == 1);
  REQUIRE(failures[0].name == "decode_0_n2");
  REQUIRE(crashed->terminate_calls.load() == 0);
}

TEST_CASE("Failure report survives non-UTF-8 log tails in JSON mode",
          "[registry][logger]") {
  auto log_path = fs::temp_directory_path() / "sweepflux_registry_binary.log";
  {
    std::ofstream f(log_path, std::ios::binary);
    f << "loading\n\xe2\x96 weights\n\xff\xfe\n";
  }
  ProcessRegistry reg("job1", 50ms, 5ms);
  auto crashed = Running();
  auto p = MakeFake("prefill_0_n1", crashed);
  p.log_file = log_path;
  reg.Add(std::move(p));
  crashed->Finish(ProcessStatus::Exited(1));
  REQUIRE(reg.CheckFailures());

  std::ostringstream captured;
  std::vector<FailureRecord> failures;
  {
    JsonCapture capture(captured);
    REQUIRE_NOTHROW(failures = reg.ReportFailures());
  }

  REQUIRE(failures.size() == 1);
  std::istringstream lines(captured.str());
  std::string line;
  bool saw_tail = false;
  while (std::getline(lines, line)) {
    auto j = nlohmann::json::parse(line);
    if (j["message"].get<std::string>().find("weights") != std::string::npos)
      saw_tail = true;
  }
  REQUIRE(saw_tail);
  fs::remove(log_path);
}

TEST_CASE("Registry destructor cleans up", "[registry]") {
  auto state = Running();
  {
    ProcessRegistry reg("job1", 100ms, 5ms);
    reg.Add(MakeFake("a", state));
  }
  REQUIRE(state->terminate_calls.load() == 1);
}

// ---------------------------------------------------------------------------
// Real child processes
// ---------------------------------------------------------------------------

TEST_CASE("Registry tracks real child processes", "[registry][posix]") {
  auto log = fs::temp_directory_path() / "sweepflux_registry_crash.log";
  fs::remove(log);

  ProcessRegistry reg("job2", 2s, 10ms);

  ManagedProcess crashing;
  crashing.name = "decode_0_local";
  crashing.node = "localhost";
  crashing.log_file = log;
  crashing.handle =
      SpawnProcess({"sh", "-c", "echo loading weights; exit 7"}, {}, log);
  reg.Add(std::move(crashing));

  ManagedProcess server;
  server.name = "frontend";
  server.node = "localhost";
  server.handle = SpawnProcess({"sleep", "30"}, {}, {});
  reg.Add(std::move(server));

  auto deadline = std::chrono::steady_clock::now() + 5s;
  bool failed = false;
  while (!failed && std::chrono::steady_clock::now() < deadline) {
    failed = reg.CheckFailures();
    if (!failed)
      std::this_thread::sleep_for(10ms);
  }
  REQUIRE(failed);
  REQUIRE(reg.StatusOf("decode_0_local")->exit_code == 7);
  REQUIRE(reg.StatusOf("frontend")->IsRunning());

  reg.Cleanup();
  REQUIRE(reg.StatusOf("frontend")->IsTerminal());

  auto failures = reg.ReportFailures();
  REQUIRE(failures.size() == 1);
  REQUIRE(failures[0].log_file == log);

  std::ifstream f(log);
  std::string first;
  std::getline(f, first);
  REQUIRE(first == "loading weights");
  fs::remove(log);
}
