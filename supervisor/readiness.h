#pragma once

#include "common/cancellation.h"
#include "net/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace sweepflux {

enum class WaitResult { kReady, kTimedOut, kCancelled };

const char *WaitResultName(WaitResult result);

// Bounded polling budget: at most `max_attempts` checks, `interval` apart.
struct WaitPolicy {
  int max_attempts{60};
  std::chrono::milliseconds interval{1000};
};

// A single readiness check. Check() must not throw and must return within a
// bounded time.
class ReadinessProbe {
public:
  virtual ~ReadinessProbe() = default;
  virtual bool Check() = 0;
  virtual std::string Describe() const = 0;
};

// Polls `probe` until it succeeds, the attempt budget runs out, or `cancel`
// is raised. The flag is checked before each attempt and the pause between
// attempts wakes up as soon as it is raised, so cancellation is observed
// promptly rather than at the timeout bound.
WaitResult WaitUntilReady(ReadinessProbe &probe, const WaitPolicy &policy,
                          const CancellationFlag &cancel);

// Succeeds once a TCP connection to host:port can be opened.
class TcpPortProbe : public ReadinessProbe {
public:
  TcpPortProbe(std::string host, int port,
               std::chrono::milliseconds connect_timeout =
                   std::chrono::milliseconds(2000));
  bool Check() override;
  std::string Describe() const override;

private:
  std::string host_;
  int port_;
  std::chrono::milliseconds connect_timeout_;
};

// GET http://host:port/health. Ready on HTTP 200 when no worker count is
// expected; otherwise the JSON body must report at least `expected_workers`
// instances (see HealthBodyReady).
class HttpHealthProbe : public ReadinessProbe {
public:
  HttpHealthProbe(std::string host, int port, int expected_workers,
                  std::string path = "/health");
  bool Check() override;
  std::string Describe() const override;

private:
  HttpClient client_;
  std::string host_;
  int port_;
  int expected_workers_;
  std::string path_;
};

// True when `body` is a health document with status "healthy" (or no status
// field) and at least `expected_workers` entries in "instances" whose
// "endpoint" is "generate" (entries without an endpoint field count too).
// `expected_workers` <= 0 accepts any body.
bool HealthBodyReady(const std::string &body, int expected_workers);

// Creates the probes the orchestrator waits on. Replaced in tests.
class ProbeFactory {
public:
  virtual ~ProbeFactory() = default;
  virtual std::unique_ptr<ReadinessProbe> Port(const std::string &host,
                                               int port) = 0;
  virtual std::unique_ptr<ReadinessProbe>
  Health(const std::string &host, int port, int expected_workers) = 0;
};

class NetworkProbeFactory : public ProbeFactory {
public:
  std::unique_ptr<ReadinessProbe> Port(const std::string &host,
                                       int port) override;
  std::unique_ptr<ReadinessProbe> Health(const std::string &host, int port,
                                         int expected_workers) override;
};

} // namespace sweepflux
