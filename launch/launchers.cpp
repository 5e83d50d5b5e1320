#include "launch/launchers.h"

#include "common/errors.h"
#include "common/logging/logger.h"
#include "launch/posix_process.h"

namespace sweepflux {

SrunLauncher::SrunLauncher(std::string srun_binary)
    : srun_binary_(std::move(srun_binary)) {}

std::vector<std::string> SrunLauncher::BuildArgv(const LaunchSpec &spec) const {
  if (spec.node.empty())
    throw ProcessStartError("srun launch needs a target node");
  if (spec.command.empty())
    throw ProcessStartError("srun launch needs a command");

  std::vector<std::string> argv = {
      srun_binary_,     "--overlap",       "--nodes=1",
      "--ntasks=1",     "--nodelist=" + spec.node,
  };
  if (!spec.output.empty())
    argv.push_back("--output=" + spec.output.string());
  if (!spec.container_image.empty()) {
    argv.push_back("--container-image=" + spec.container_image);
    argv.push_back("--no-container-entrypoint");
    argv.push_back("--no-container-mount-home");
    if (!spec.container_mounts.empty())
      argv.push_back("--container-mounts=" + spec.container_mounts);
  }
  // The launch environment (spec.env merged into ours) is exported to the
  // remote task.
  argv.push_back("--export=ALL");
  argv.insert(argv.end(), spec.command.begin(), spec.command.end());
  return argv;
}

std::unique_ptr<ProcessHandle> SrunLauncher::Start(const LaunchSpec &spec) {
  auto argv = BuildArgv(spec);
  log::Debug("launcher", "srun on " + spec.node + " -> " + spec.output.string());
  // srun writes the task output itself (--output); its own diagnostics stay on
  // our stderr.
  return SpawnProcess(argv, spec.env, {});
}

std::unique_ptr<ProcessHandle> LocalLauncher::Start(const LaunchSpec &spec) {
  if (spec.command.empty())
    throw ProcessStartError("local launch needs a command");
  if (!spec.container_image.empty())
    log::Debug("launcher", "local launcher ignores container image " +
                               spec.container_image);
  return SpawnProcess(spec.command, spec.env, spec.output);
}

} // namespace sweepflux
