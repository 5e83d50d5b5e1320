#pragma once

#include <stdexcept>
#include <string>

namespace sweepflux {

// Base of every error raised by the sweep core. Callers that only care about
// "the sweep cannot proceed" catch this; the subclasses let the orchestrator
// and tests tell the failure kinds apart.
class SweepError : public std::runtime_error {
public:
  explicit SweepError(const std::string &what) : std::runtime_error(what) {}
};

// Invalid GPU / machine arithmetic or a malformed job file.
class ConfigurationError : public SweepError {
public:
  explicit ConfigurationError(const std::string &what) : SweepError(what) {}
};

// The request needs more machines than the job was given.
class InsufficientResourcesError : public SweepError {
public:
  InsufficientResourcesError(const std::string &what, int required,
                             int available)
      : SweepError(what), required_(required), available_(available) {}

  int Required() const { return required_; }
  int Available() const { return available_; }

private:
  int required_;
  int available_;
};

// The remote-start capability could not start a process.
class ProcessStartError : public SweepError {
public:
  explicit ProcessStartError(const std::string &what) : SweepError(what) {}
};

// A critical process terminated while the run depended on it.
class CriticalProcessFailure : public SweepError {
public:
  explicit CriticalProcessFailure(const std::string &what) : SweepError(what) {}
};

// A readiness probe never succeeded within its attempt budget.
class HealthCheckTimeout : public SweepError {
public:
  explicit HealthCheckTimeout(const std::string &what) : SweepError(what) {}
};

} // namespace sweepflux
