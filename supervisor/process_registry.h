#pragma once

#include "launch/process_handle.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sweepflux {

// ── ManagedProcess ──────────────────────────────────────────────────────────
// A launched process as handed to the registry.
struct ManagedProcess {
  std::string name;
  std::string node;
  std::unique_ptr<ProcessHandle> handle;
  std::filesystem::path log_file;
  // Unexpected termination of a critical process fails the whole run.
  bool critical{true};
  // False for servers that are expected to run until cleanup: any exit is
  // then a failure. True for jobs such as a benchmark client where exit code
  // 0 is a normal completion.
  bool run_to_completion{false};
};

using NamedProcesses = std::map<std::string, ManagedProcess>;

// One process in a failure terminal state, as surfaced by ReportFailures().
struct FailureRecord {
  std::string name;
  std::string node;
  std::filesystem::path log_file;
  ProcessStatus status;
  bool critical{true};
};

// ── ProcessRegistry ─────────────────────────────────────────────────────────
// Sole owner of every launched process handle of a job.
//
// The orchestrator thread adds processes; the lifecycle supervisor polls them
// from its own thread. Both go through one mutex, and so do termination
// requests: nothing outside the registry signals or reaps a handle.
//
// A process is in a failure terminal state when it ended on its own (not
// because Cleanup() stopped it) and either exited non-zero, died from a
// signal, or was expected to run indefinitely and is critical.
//
// Thread safety: all public methods are thread-safe.
class ProcessRegistry {
public:
  explicit ProcessRegistry(
      std::string job_id,
      std::chrono::milliseconds grace_period = std::chrono::seconds(10),
      std::chrono::milliseconds reap_poll = std::chrono::milliseconds(50));
  // Runs Cleanup().
  ~ProcessRegistry();

  ProcessRegistry(const ProcessRegistry &) = delete;
  ProcessRegistry &operator=(const ProcessRegistry &) = delete;

  // Takes ownership of `process`. Throws std::logic_error when the name is
  // already registered (names are never reused within a run) and
  // std::invalid_argument when the handle is null.
  void Add(ManagedProcess process);
  void AddMany(NamedProcesses processes);

  // Non-blocking poll of every handle. True iff at least one critical process
  // is in a failure terminal state.
  bool CheckFailures();

  // Gracefully terminates every running process, waits up to the grace
  // period, then force-kills survivors. Already terminated processes are
  // skipped, so a second call sends no signals. Never throws; per-process
  // errors are logged as warnings.
  void Cleanup() noexcept;

  // Logs name, node, log path and exit status of every process in a failure
  // terminal state (with the tail of its log) and returns them.
  std::vector<FailureRecord> ReportFailures() const;

  // Same set as ReportFailures() without logging.
  std::vector<FailureRecord> Failures() const;

  const std::string &JobId() const { return job_id_; }
  std::size_t Size() const;
  std::vector<std::string> Names() const;
  std::optional<ProcessStatus> StatusOf(const std::string &name) const;

private:
  struct Entry {
    ManagedProcess process;
    ProcessStatus status;
    bool stop_requested{false};
  };

  static bool IsFailure(const Entry &entry);
  // Polls one handle and logs the first transition to a terminal state.
  void Observe(Entry &entry);
  FailureRecord ToRecord(const Entry &entry) const;
  Entry *Find(const std::string &name);
  const Entry *Find(const std::string &name) const;

  const std::string job_id_;
  const std::chrono::milliseconds grace_period_;
  const std::chrono::milliseconds reap_poll_;

  mutable std::mutex mutex_;
  // Registration order; cleanup signals in this order.
  std::vector<Entry> entries_;
};

} // namespace sweepflux
