#pragma once
#include <opencv2/core.hpp>

#include "CVUtils.h"

namespace db_text {

struct DBPostProcessOptions {
  float binary_threshold = 0.3f;
  float polygon_threshold = 0.5f;
  int max_candidates = 200;
  double unclip_ratio = 2.0;
};

// Turns a DB probability map into text quadrilaterals in map coordinates.
class DBPostProcess {
public:
  explicit DBPostProcess(const DBPostProcessOptions &options)
      : options(options) {}

  // `prob` is a single channel CV_32F map with values in [0, 1].
  DetectionResult process(const cv::Mat &prob) const;

private:
  DBPostProcessOptions options;
};

} // namespace db_text
