#pragma once

#include "launch/process_handle.h"

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace sweepflux {

// A child of this process started with fork/exec in its own process group.
// Signals go to the whole group so that wrappers such as srun or a shell take
// their children down with them.
class PosixProcessHandle : public ProcessHandle {
public:
  explicit PosixProcessHandle(pid_t pid) : pid_(pid) {}
  // Kills and reaps the group if it is still running.
  ~PosixProcessHandle() override;

  PosixProcessHandle(const PosixProcessHandle &) = delete;
  PosixProcessHandle &operator=(const PosixProcessHandle &) = delete;

  ProcessStatus Poll() override;
  bool Terminate() override;
  bool Kill() override;
  int Pid() const override { return static_cast<int>(pid_); }

private:
  bool SignalGroup(int sig);

  pid_t pid_;
  ProcessStatus status_;
};

// fork/exec `argv` (PATH lookup) with `env` added to the inherited
// environment. stdout and stderr go to `output` (appended) when it is set,
// stdin is /dev/null. Throws ProcessStartError when the log file cannot be
// opened, fork fails or exec fails in the child.
std::unique_ptr<PosixProcessHandle>
SpawnProcess(const std::vector<std::string> &argv,
             const std::vector<std::pair<std::string, std::string>> &env,
             const std::filesystem::path &output);

} // namespace sweepflux
