#pragma once
#include <string_view>

#include <opencv2/core.hpp>

#include "CVUtils.h"

namespace db_text {

// Anything that turns a model-sized BGR image into text quadrilaterals.
class TextDetector {
public:
  virtual ~TextDetector() = default;

  // Boxes are in the coordinate space of `image`.
  virtual DetectionResult infer(const cv::Mat &image) = 0;

  virtual std::string_view name() const = 0;
};

} // namespace db_text
