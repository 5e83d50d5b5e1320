#include "net/host_resolver.h"

#include "common/logging/logger.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

namespace sweepflux {

std::string ResolveHostIp(const std::string &hostname) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 ||
      result == nullptr) {
    log::Debug("resolver", "cannot resolve " + hostname + "; using it as-is");
    return hostname;
  }
  char buf[INET_ADDRSTRLEN] = {0};
  auto *addr = reinterpret_cast<sockaddr_in *>(result->ai_addr);
  const char *text = inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf));
  freeaddrinfo(result);
  return text ? std::string(text) : hostname;
}

} // namespace sweepflux
