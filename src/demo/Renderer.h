#pragma once
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "infer/CVUtils.h"

namespace db_text {

struct VisualStyle {
  cv::Scalar box_color{0, 255, 0};
  cv::Scalar text_color{0, 0, 255};
  bool closed = true;
  int thickness = 2;
};

// Draws the boxes, and the FPS counter when given, on a copy of `frame`.
cv::Mat render(const cv::Mat &frame, const std::vector<Quad> &boxes,
               const VisualStyle &style = {},
               std::optional<double> fps = std::nullopt);

} // namespace db_text
