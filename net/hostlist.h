#pragma once

#include <string>
#include <vector>

namespace sweepflux {

// Expands a SLURM compressed host list into individual host names, in order,
// without calling scontrol:
//
//   "gb200-[01-03,07],login1"  ->  gb200-01 gb200-02 gb200-03 gb200-07 login1
//
// Zero padding of the lower bound is preserved. Nested or multiple bracket
// groups per name are not part of SLURM's common output and are rejected.
// Throws ConfigurationError on malformed input. Duplicates are removed,
// keeping the first occurrence.
std::vector<std::string> ExpandHostList(const std::string &hostlist);

} // namespace sweepflux
