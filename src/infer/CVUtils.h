#pragma once
#include <array>
#include <vector>

#include <opencv2/core.hpp>

namespace db_text {

// Four corners of a text region, in the order the detector emits them.
using Quad = std::array<cv::Point2f, 4>;

struct DetectionResult {
  std::vector<Quad> boxes;
  // scores[i] belongs to boxes[i]
  std::vector<float> scores;
};

struct ScaleFactors {
  float width = 1.0f;
  float height = 1.0f;

  // Factors mapping model-input coordinates back to the original frame.
  static ScaleFactors between(const cv::Size &original,
                              const cv::Size &model) {
    return {static_cast<float>(original.width) / model.width,
            static_cast<float>(original.height) / model.height};
  }
};

inline std::vector<cv::Point> toIntPoints(const Quad &quad) {
  std::vector<cv::Point> points;
  points.reserve(quad.size());
  for (const auto &p : quad) {
    points.emplace_back(cvRound(p.x), cvRound(p.y));
  }
  return points;
}

} // namespace db_text
