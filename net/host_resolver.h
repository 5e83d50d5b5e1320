#pragma once

#include <string>

namespace sweepflux {

// Resolves a host name to its first IPv4 address. Falls back to returning
// `hostname` unchanged when resolution fails (it may already be an address).
std::string ResolveHostIp(const std::string &hostname);

} // namespace sweepflux
