#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sweepflux {

// Observed state of a launched process. Running is the only non-terminal
// state; once terminal the status never changes.
struct ProcessStatus {
  enum class State { kRunning, kExited, kKilled };

  State state{State::kRunning};
  int exit_code{0}; // kExited
  int signal{0};    // kKilled

  static ProcessStatus Running() { return {}; }
  static ProcessStatus Exited(int code) { return {State::kExited, code, 0}; }
  static ProcessStatus Killed(int sig) { return {State::kKilled, 0, sig}; }

  bool IsRunning() const { return state == State::kRunning; }
  bool IsTerminal() const { return state != State::kRunning; }
  bool IsCleanExit() const { return state == State::kExited && exit_code == 0; }

  // "running", "exit code 3", "signal 9 (Killed)".
  std::string Describe() const;
};

// Handle to one started process, local or remote. Owned exclusively by the
// ProcessRegistry once registered; nothing else signals or reaps it.
class ProcessHandle {
public:
  virtual ~ProcessHandle() = default;

  // Non-blocking liveness check. Reaps the process once it has ended and
  // keeps returning the same terminal status afterwards.
  virtual ProcessStatus Poll() = 0;

  // Graceful termination request (SIGTERM). Returns false when the signal
  // could not be delivered to a live process.
  virtual bool Terminate() = 0;

  // Forced termination (SIGKILL). Same return convention as Terminate().
  virtual bool Kill() = 0;

  virtual int Pid() const = 0;
};

// What to start and where.
struct LaunchSpec {
  std::vector<std::string> command;
  std::string node;
  std::filesystem::path output; // stdout + stderr
  std::vector<std::pair<std::string, std::string>> env;
  std::string container_image;
  std::string container_mounts; // "host:container,..."
};

// The capability to start a process on a named machine.
class RemoteLauncher {
public:
  virtual ~RemoteLauncher() = default;

  // Throws ProcessStartError when the process cannot be started.
  virtual std::unique_ptr<ProcessHandle> Start(const LaunchSpec &spec) = 0;

  virtual std::string Name() const = 0;
};

} // namespace sweepflux
