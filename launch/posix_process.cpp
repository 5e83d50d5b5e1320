#include "launch/posix_process.h"

#include "common/errors.h"
#include "common/logging/logger.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>

extern char **environ;

namespace sweepflux {

std::string ProcessStatus::Describe() const {
  switch (state) {
  case State::kRunning:
    return "running";
  case State::kExited:
    return "exit code " + std::to_string(exit_code);
  case State::kKilled: {
    const char *name = strsignal(signal);
    return "signal " + std::to_string(signal) +
           (name ? std::string(" (") + name + ")" : std::string());
  }
  }
  return "unknown";
}

PosixProcessHandle::~PosixProcessHandle() {
  if (pid_ <= 0 || status_.IsTerminal())
    return;
  if (Poll().IsRunning()) {
    SignalGroup(SIGKILL);
    int st = 0;
    while (::waitpid(pid_, &st, 0) < 0 && errno == EINTR) {
    }
  }
}

ProcessStatus PosixProcessHandle::Poll() {
  if (status_.IsTerminal())
    return status_;
  int st = 0;
  pid_t r = ::waitpid(pid_, &st, WNOHANG);
  if (r == 0)
    return status_;
  if (r < 0) {
    if (errno == EINTR)
      return status_;
    // ECHILD: reaped elsewhere. The exit status is lost.
    log::Warn("process", "pid " + std::to_string(pid_) +
                             " was reaped outside the registry");
    status_ = ProcessStatus::Exited(-1);
    return status_;
  }
  if (WIFEXITED(st)) {
    status_ = ProcessStatus::Exited(WEXITSTATUS(st));
  } else if (WIFSIGNALED(st)) {
    status_ = ProcessStatus::Killed(WTERMSIG(st));
  }
  return status_;
}

bool PosixProcessHandle::SignalGroup(int sig) {
  if (::kill(-pid_, sig) == 0)
    return true;
  // The group may not exist yet if the child has not reached setpgid().
  if (::kill(pid_, sig) == 0)
    return true;
  return errno == ESRCH;
}

bool PosixProcessHandle::Terminate() {
  if (Poll().IsTerminal())
    return true;
  return SignalGroup(SIGTERM);
}

bool PosixProcessHandle::Kill() {
  if (Poll().IsTerminal())
    return true;
  return SignalGroup(SIGKILL);
}

std::unique_ptr<PosixProcessHandle>
SpawnProcess(const std::vector<std::string> &argv,
             const std::vector<std::pair<std::string, std::string>> &env,
             const std::filesystem::path &output) {
  if (argv.empty())
    throw ProcessStartError("empty command");

  // Everything the child needs is prepared before fork(); between fork and
  // exec the child only makes async-signal-safe calls.
  std::map<std::string, std::string> merged;
  for (char **e = environ; e && *e; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    if (eq == std::string::npos)
      continue;
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto &[key, value] : env)
    merged[key] = value;

  std::vector<std::string> env_list;
  env_list.reserve(merged.size());
  for (const auto &[key, value] : merged)
    env_list.push_back(key + "=" + value);
  std::vector<char *> envp;
  envp.reserve(env_list.size() + 1);
  for (auto &entry : env_list)
    envp.push_back(entry.data());
  envp.push_back(nullptr);

  std::vector<std::string> args = argv;
  std::vector<char *> cargv;
  cargv.reserve(args.size() + 1);
  for (auto &a : args)
    cargv.push_back(a.data());
  cargv.push_back(nullptr);

  int out_fd = -1;
  if (!output.empty()) {
    out_fd = ::open(output.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                    0644);
    if (out_fd < 0)
      throw ProcessStartError("cannot open log file " + output.string() + ": " +
                              std::strerror(errno));
  }
  int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  // exec failures are reported back through a close-on-exec pipe.
  int err_pipe[2];
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    int saved = errno;
    if (out_fd >= 0)
      ::close(out_fd);
    if (null_fd >= 0)
      ::close(null_fd);
    throw ProcessStartError(std::string("pipe failed: ") + std::strerror(saved));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int saved = errno;
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    if (out_fd >= 0)
      ::close(out_fd);
    if (null_fd >= 0)
      ::close(null_fd);
    throw ProcessStartError(std::string("fork failed: ") + std::strerror(saved));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    if (null_fd >= 0)
      ::dup2(null_fd, STDIN_FILENO);
    if (out_fd >= 0) {
      ::dup2(out_fd, STDOUT_FILENO);
      ::dup2(out_fd, STDERR_FILENO);
    }
    ::execvpe(cargv[0], cargv.data(), envp.data());
    int code = errno;
    ssize_t ignored = ::write(err_pipe[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  ::close(err_pipe[1]);
  if (out_fd >= 0)
    ::close(out_fd);
  if (null_fd >= 0)
    ::close(null_fd);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(err_pipe[0]);

  if (n > 0) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
    }
    throw ProcessStartError("cannot execute '" + argv[0] +
                            "': " + std::strerror(child_errno));
  }

  log::Debug("process", "spawned pid " + std::to_string(pid) + ": " + argv[0]);
  return std::make_unique<PosixProcessHandle>(pid);
}

} // namespace sweepflux
