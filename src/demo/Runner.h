#pragma once
#include <cstddef>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>

#include "demo/Capture.h"
#include "demo/DemoConfig.h"
#include "demo/Renderer.h"
#include "demo/Viewer.h"
#include "infer/TextDetector.h"

namespace db_text {

// Key poll interval between camera frames.
inline constexpr int kStreamPollMs = 1;

class Runner {
public:
  Runner(const DemoConfig &config, TextDetector &detector, Viewer &viewer,
         const VisualStyle &style = {});

  // Image mode when an input path is configured, camera stream otherwise.
  void run();

  // Detects, draws, optionally saves and shows one image. Throws
  // std::runtime_error when the image cannot be read or saved.
  cv::Mat runImage(const std::string &path);

  // Processes frames until a key is pressed or the source runs dry.
  // Returns the number of frames shown.
  size_t runStream(FrameSource &source);

private:
  // Boxes in the result are already in `frame` coordinates.
  DetectionResult detect(const cv::Mat &frame, cv::TickMeter *meter);

  const DemoConfig &config;
  TextDetector &detector;
  Viewer &viewer;
  VisualStyle style;
};

} // namespace db_text
