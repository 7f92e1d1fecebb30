#include "Backends.h"
#include "ncnn/gpu.h"
#include "ncnn/platform.h"
#include "ylt/easylog.hpp"
#include <algorithm>
#include <format>

namespace db_text {

bool BackendCapabilities::supportsBackend(int id) const {
  return std::ranges::find(backends, id) != backends.end();
}

bool BackendCapabilities::supportsTarget(int id) const {
  return std::ranges::find(targets, id) != targets.end();
}

std::string BackendCapabilities::backendHelp() const {
  std::string help = std::format(
      "Choose one of the computation backends: {}: ncnn implementation "
      "(default)",
      static_cast<int>(kBackendNcnn));
  if (supportsBackend(kBackendVulkan)) {
    help += std::format("; {}: Vulkan", static_cast<int>(kBackendVulkan));
  }
  return help;
}

std::string BackendCapabilities::targetHelp() const {
  std::string help =
      std::format("Choose one of the target computation devices: {}: CPU "
                  "(default)",
                  static_cast<int>(kTargetCpu));
  if (supportsTarget(kTargetGpu)) {
    help += std::format("; {}: GPU; {}: GPU fp16", static_cast<int>(kTargetGpu),
                        static_cast<int>(kTargetGpuFp16));
  }
  return help;
}

static bool vulkanAvailable() {
#if NCNN_VULKAN
  return ncnn::get_gpu_count() > 0;
#else
  return false;
#endif
}

BackendCapabilities queryBackendCapabilities() {
  BackendCapabilities caps{.backends = {kBackendNcnn},
                           .targets = {kTargetCpu}};

  if (!vulkanAvailable()) {
    ELOGFMT(WARNING, "This build of ncnn has no usable Vulkan device, only "
                     "the CPU backend is available");
    return caps;
  }

  caps.backends.push_back(kBackendVulkan);
  caps.targets.push_back(kTargetGpu);
  caps.targets.push_back(kTargetGpuFp16);
  return caps;
}

ncnn::Option makeNetOption(int backend, int target) {
  ncnn::Option opt;
  opt.use_vulkan_compute = false;

  bool wants_gpu = target == kTargetGpu || target == kTargetGpuFp16;
  if (backend == kBackendVulkan && wants_gpu) {
    opt.use_vulkan_compute = true;
    opt.use_fp16_storage = target == kTargetGpuFp16;
    opt.use_fp16_packed = target == kTargetGpuFp16;
    opt.use_fp16_arithmetic = target == kTargetGpuFp16;
  } else if (backend == kBackendVulkan || wants_gpu) {
    ELOGFMT(WARNING,
            "Backend {} cannot run on target {}, falling back to CPU",
            backend, target);
  }

  return opt;
}

} // namespace db_text
