#include "allocation/endpoint.h"

namespace sweepflux {

const char *WorkerModeName(WorkerMode mode) {
  switch (mode) {
  case WorkerMode::kPrefill:
    return "prefill";
  case WorkerMode::kDecode:
    return "decode";
  case WorkerMode::kAgg:
    return "agg";
  }
  return "unknown";
}

std::string Process::CudaVisibleDevices() const {
  std::string out;
  for (std::size_t i = 0; i < gpu_indices.size(); ++i) {
    if (i > 0)
      out += ",";
    out += std::to_string(gpu_indices[i]);
  }
  return out;
}

std::string Process::Name() const {
  return std::string(WorkerModeName(endpoint_mode)) + "_" +
         std::to_string(endpoint_index) + "_" + node;
}

} // namespace sweepflux
