#pragma once
#include <string>
#include <vector>

#include "ncnn/option.h"

namespace db_text {

enum BackendId : int {
  kBackendNcnn = 0,
  kBackendVulkan = 1,
};

enum TargetId : int {
  kTargetCpu = 0,
  kTargetGpu = 1,
  kTargetGpuFp16 = 2,
};

struct BackendCapabilities {
  std::vector<int> backends;
  std::vector<int> targets;

  bool supportsBackend(int id) const;
  bool supportsTarget(int id) const;

  std::string backendHelp() const;
  std::string targetHelp() const;
};

// Evaluated once at startup. Vulkan ids are only listed when the linked ncnn
// was built with Vulkan and a GPU is present.
BackendCapabilities queryBackendCapabilities();

// Translates a backend/target pair into ncnn options. Unusable combinations
// fall back to CPU execution.
ncnn::Option makeNetOption(int backend, int target);

} // namespace db_text
