#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <opencv2/core.hpp>

#include "infer/Backends.h"
#include "infer/DBDetector.h"

namespace db_text {

inline constexpr std::string_view kDefaultModelPath =
    "text_detection_DB_TD500_resnet18_2021sep.onnx";
inline constexpr std::string_view kResultPath = "result.jpg";

// Everything the command line decides, fixed for the lifetime of the run.
struct DemoConfig {
  // Image mode when set, camera stream otherwise.
  std::optional<std::string> input;
  int device = 0;

  std::string model_path{kDefaultModelPath};
  int backend_id = kBackendNcnn;
  int target_id = kTargetCpu;
  cv::Size input_size{736, 736};
  DBPostProcessOptions postprocess;

  bool save = false;
  bool vis = true;
  std::string result_path{kResultPath};

  DBDetectorOptions detectorOptions() const;
};

struct UsageError {
  bool help_requested = false;
  std::string message;
};

// Accepts on/yes/true/y/t and off/no/false/n/f, ignoring case.
std::expected<bool, std::string> parseBool(std::string_view value);

std::expected<DemoConfig, UsageError>
parseDemoConfig(int argc, const char *const argv[],
                const BackendCapabilities &caps);

} // namespace db_text
