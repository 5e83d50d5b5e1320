#include "supervisor/readiness.h"

#include "common/logging/logger.h"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

using json = nlohmann::json;

namespace sweepflux {

const char *WaitResultName(WaitResult result) {
  switch (result) {
  case WaitResult::kReady:
    return "ready";
  case WaitResult::kTimedOut:
    return "timed_out";
  case WaitResult::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

WaitResult WaitUntilReady(ReadinessProbe &probe, const WaitPolicy &policy,
                          const CancellationFlag &cancel) {
  for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (cancel.IsCancelled())
      return WaitResult::kCancelled;
    if (probe.Check()) {
      log::Debug("readiness", probe.Describe() + " ready",
                 "attempt=" + std::to_string(attempt));
      return WaitResult::kReady;
    }
    if (attempt == policy.max_attempts)
      break;
    if (attempt % 10 == 0) {
      log::Info("readiness", "still waiting for " + probe.Describe(),
                "attempt=" + std::to_string(attempt) + "/" +
                    std::to_string(policy.max_attempts));
    }
    if (cancel.WaitFor(policy.interval))
      return WaitResult::kCancelled;
  }
  return WaitResult::kTimedOut;
}

// ── TcpPortProbe ────────────────────────────────────────────────────────────

TcpPortProbe::TcpPortProbe(std::string host, int port,
                           std::chrono::milliseconds connect_timeout)
    : host_(std::move(host)), port_(port), connect_timeout_(connect_timeout) {}

std::string TcpPortProbe::Describe() const {
  return "tcp://" + host_ + ":" + std::to_string(port_);
}

bool TcpPortProbe::Check() {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  if (getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &res) !=
      0) {
    return false;
  }
  bool ok = false;
  for (addrinfo *it = res; it != nullptr && !ok; it = it->ai_next) {
    int fd = ::socket(it->ai_family, it->ai_socktype | SOCK_NONBLOCK |
                                         SOCK_CLOEXEC,
                      it->ai_protocol);
    if (fd < 0)
      continue;
    int rc = ::connect(fd, it->ai_addr, it->ai_addrlen);
    if (rc == 0) {
      ok = true;
    } else if (errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      if (::poll(&pfd, 1, static_cast<int>(connect_timeout_.count())) == 1) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
          ok = true;
      }
    }
    ::close(fd);
  }
  freeaddrinfo(res);
  return ok;
}

// ── HttpHealthProbe ─────────────────────────────────────────────────────────

bool HealthBodyReady(const std::string &body, int expected_workers) {
  if (expected_workers <= 0)
    return true;
  json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object())
    return false;
  if (doc.contains("status") && doc["status"].is_string() &&
      doc["status"].get<std::string>() != "healthy") {
    return false;
  }
  if (!doc.contains("instances") || !doc["instances"].is_array())
    return false;
  int workers = 0;
  for (const auto &inst : doc["instances"]) {
    if (inst.is_object() && inst.contains("endpoint") &&
        inst["endpoint"].is_string() &&
        inst["endpoint"].get<std::string>() != "generate") {
      continue;
    }
    ++workers;
  }
  return workers >= expected_workers;
}

HttpHealthProbe::HttpHealthProbe(std::string host, int port,
                                 int expected_workers, std::string path)
    : client_(std::chrono::milliseconds(5000)), host_(std::move(host)),
      port_(port), expected_workers_(expected_workers), path_(std::move(path)) {}

std::string HttpHealthProbe::Describe() const {
  return "http://" + host_ + ":" + std::to_string(port_) + path_ +
         (expected_workers_ > 0
              ? " (" + std::to_string(expected_workers_) + " workers)"
              : std::string());
}

bool HttpHealthProbe::Check() {
  try {
    auto resp = client_.Get("http://" + host_ + ":" + std::to_string(port_) +
                            path_);
    if (resp.status != 200)
      return false;
    return HealthBodyReady(resp.body, expected_workers_);
  } catch (const std::exception &ex) {
    log::Debug("readiness", Describe() + ": " + ex.what());
    return false;
  }
}

std::unique_ptr<ReadinessProbe>
NetworkProbeFactory::Port(const std::string &host, int port) {
  return std::make_unique<TcpPortProbe>(host, port);
}

std::unique_ptr<ReadinessProbe>
NetworkProbeFactory::Health(const std::string &host, int port,
                            int expected_workers) {
  return std::make_unique<HttpHealthProbe>(host, port, expected_workers);
}

} // namespace sweepflux
