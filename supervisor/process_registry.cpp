#include "supervisor/process_registry.h"

#include "common/logging/logger.h"

#include <deque>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace sweepflux {

namespace {

constexpr std::size_t kLogTailLines = 10;
constexpr std::chrono::milliseconds kKillReapTimeout{2000};

std::deque<std::string> TailLines(const std::filesystem::path &path,
                                  std::size_t count) {
  std::deque<std::string> tail;
  std::ifstream f(path);
  if (!f.is_open())
    return tail;
  std::string line;
  while (std::getline(f, line)) {
    tail.push_back(line);
    if (tail.size() > count)
      tail.pop_front();
  }
  return tail;
}

} // namespace

ProcessRegistry::ProcessRegistry(std::string job_id,
                                 std::chrono::milliseconds grace_period,
                                 std::chrono::milliseconds reap_poll)
    : job_id_(std::move(job_id)), grace_period_(grace_period),
      reap_poll_(reap_poll) {}

ProcessRegistry::~ProcessRegistry() { Cleanup(); }

void ProcessRegistry::Add(ManagedProcess process) {
  if (!process.handle) {
    throw std::invalid_argument("process '" + process.name + "' has no handle");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (Find(process.name)) {
    throw std::logic_error("process name already registered: " + process.name);
  }
  log::Debug("registry", "tracking " + process.name + " on " + process.node,
             "pid=" + std::to_string(process.handle->Pid()));
  Entry entry;
  entry.process = std::move(process);
  entries_.push_back(std::move(entry));
}

void ProcessRegistry::AddMany(NamedProcesses processes) {
  for (auto &[name, process] : processes) {
    Add(std::move(process));
  }
}

bool ProcessRegistry::IsFailure(const Entry &entry) {
  if (!entry.status.IsTerminal() || entry.stop_requested)
    return false;
  if (!entry.status.IsCleanExit())
    return true;
  return entry.process.critical && !entry.process.run_to_completion;
}

void ProcessRegistry::Observe(Entry &entry) {
  if (entry.status.IsTerminal())
    return;
  entry.status = entry.process.handle->Poll();
  if (entry.status.IsRunning())
    return;

  const auto &p = entry.process;
  std::string extra = "node=" + p.node + " log=" + p.log_file.string();
  if (entry.stop_requested) {
    log::Debug("registry", p.name + " stopped (" + entry.status.Describe() + ")");
  } else if (!IsFailure(entry)) {
    log::Info("registry", p.name + " completed (" + entry.status.Describe() + ")",
              extra);
  } else if (p.critical) {
    log::Error("registry",
               "critical process " + p.name + " ended: " + entry.status.Describe(),
               extra);
  } else {
    log::Warn("registry", p.name + " ended: " + entry.status.Describe(), extra);
  }
}

bool ProcessRegistry::CheckFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  bool failed = false;
  for (auto &entry : entries_) {
    Observe(entry);
    if (entry.process.critical && IsFailure(entry))
      failed = true;
  }
  return failed;
}

void ProcessRegistry::Cleanup() noexcept {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Entry *> signaled;
  for (auto &entry : entries_) {
    try {
      Observe(entry);
      if (entry.status.IsTerminal())
        continue;
      entry.stop_requested = true;
      if (!entry.process.handle->Terminate()) {
        log::Warn("registry", "failed to send SIGTERM to " + entry.process.name);
      }
      signaled.push_back(&entry);
    } catch (const std::exception &ex) {
      log::Warn("registry", "error stopping " + entry.process.name + ": " + ex.what());
    }
  }
  if (signaled.empty())
    return;

  log::Info("registry", "terminating " + std::to_string(signaled.size()) +
                            " process(es) for job " + job_id_);

  auto wait_all = [&](std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (true) {
      bool any_running = false;
      for (auto *entry : signaled) {
        try {
          Observe(*entry);
        } catch (const std::exception &ex) {
          log::Warn("registry",
                    "error polling " + entry->process.name + ": " + ex.what());
          entry->status = ProcessStatus::Exited(-1);
        }
        if (entry->status.IsRunning())
          any_running = true;
      }
      if (!any_running || std::chrono::steady_clock::now() >= deadline)
        return !any_running;
      std::this_thread::sleep_for(reap_poll_);
    }
  };

  if (wait_all(grace_period_))
    return;

  for (auto *entry : signaled) {
    if (!entry->status.IsRunning())
      continue;
    log::Warn("registry", entry->process.name + " ignored SIGTERM for " +
                              std::to_string(grace_period_.count()) +
                              "ms; sending SIGKILL");
    try {
      if (!entry->process.handle->Kill()) {
        log::Warn("registry", "failed to send SIGKILL to " + entry->process.name);
      }
    } catch (const std::exception &ex) {
      log::Warn("registry",
                "error killing " + entry->process.name + ": " + ex.what());
    }
  }

  if (!wait_all(kKillReapTimeout)) {
    for (auto *entry : signaled) {
      if (entry->status.IsRunning())
        log::Warn("registry", entry->process.name + " still running after SIGKILL");
    }
  }
}

FailureRecord ProcessRegistry::ToRecord(const Entry &entry) const {
  FailureRecord rec;
  rec.name = entry.process.name;
  rec.node = entry.process.node;
  rec.log_file = entry.process.log_file;
  rec.status = entry.status;
  rec.critical = entry.process.critical;
  return rec;
}

std::vector<FailureRecord> ProcessRegistry::Failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FailureRecord> out;
  for (const auto &entry : entries_) {
    if (IsFailure(entry))
      out.push_back(ToRecord(entry));
  }
  return out;
}

std::vector<FailureRecord> ProcessRegistry::ReportFailures() const {
  auto failures = Failures();
  if (failures.empty()) {
    log::Info("registry", "no failed processes for job " + job_id_);
    return failures;
  }

  log::Error("registry", std::to_string(failures.size()) +
                             " failed process(es) for job " + job_id_ + ":");
  for (const auto &rec : failures) {
    log::Error("registry",
               "  " + rec.name + (rec.critical ? " [critical]" : "") + " on " +
                   rec.node + ": " + rec.status.Describe(),
               "log=" + rec.log_file.string());
    for (const auto &line : TailLines(rec.log_file, kLogTailLines)) {
      log::Error("registry", "    | " + line);
    }
  }
  return failures;
}

std::size_t ProcessRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::string> ProcessRegistry::Names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &entry : entries_)
    names.push_back(entry.process.name);
  return names;
}

std::optional<ProcessStatus>
ProcessRegistry::StatusOf(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Entry *entry = Find(name);
  if (!entry)
    return std::nullopt;
  return entry->status;
}

ProcessRegistry::Entry *ProcessRegistry::Find(const std::string &name) {
  for (auto &entry : entries_) {
    if (entry.process.name == name)
      return &entry;
  }
  return nullptr;
}

const ProcessRegistry::Entry *
ProcessRegistry::Find(const std::string &name) const {
  for (const auto &entry : entries_) {
    if (entry.process.name == name)
      return &entry;
  }
  return nullptr;
}

} // namespace sweepflux
