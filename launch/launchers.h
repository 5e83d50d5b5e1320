#pragma once

#include "launch/process_handle.h"

#include <memory>
#include <string>
#include <vector>

namespace sweepflux {

// Starts processes on cluster machines through `srun`, inside the job's
// allocation. The srun client runs locally; signals sent to it are forwarded
// to the remote task, so the returned handle controls the remote process.
class SrunLauncher : public RemoteLauncher {
public:
  explicit SrunLauncher(std::string srun_binary = "srun");

  std::unique_ptr<ProcessHandle> Start(const LaunchSpec &spec) override;
  std::string Name() const override { return "srun"; }

  // The full srun argv for `spec`, command included.
  std::vector<std::string> BuildArgv(const LaunchSpec &spec) const;

private:
  std::string srun_binary_;
};

// Starts every process on this machine, ignoring the node name and container
// settings. For single-host development runs and tests.
class LocalLauncher : public RemoteLauncher {
public:
  std::unique_ptr<ProcessHandle> Start(const LaunchSpec &spec) override;
  std::string Name() const override { return "local"; }
};

} // namespace sweepflux
