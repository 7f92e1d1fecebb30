#include "DBPostProcess.h"
#include "ylt/easylog.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace db_text {

// Mean probability inside the contour.
static double contourScore(const cv::Mat &prob,
                           const std::vector<cv::Point> &contour) {
  cv::Rect rect =
      cv::boundingRect(contour) & cv::Rect(0, 0, prob.cols, prob.rows);
  if (rect.empty()) {
    return 0.0;
  }

  cv::Mat mask = cv::Mat::zeros(rect.size(), CV_8UC1);
  std::vector<std::vector<cv::Point>> shifted(1);
  shifted[0].reserve(contour.size());
  for (const auto &p : contour) {
    shifted[0].push_back(p - rect.tl());
  }
  cv::fillPoly(mask, shifted, cv::Scalar(1));

  return cv::mean(prob(rect), mask)[0];
}

// minAreaRect may report a box standing on its short side; lay it down so
// width is the text direction.
static cv::RotatedRect normalizeBox(cv::RotatedRect box) {
  constexpr float angle_threshold = 60.0f;
  if (box.size.width < box.size.height ||
      std::abs(box.angle) >= angle_threshold) {
    std::swap(box.size.width, box.size.height);
    if (box.angle < 0) {
      box.angle += 90.0f;
    } else if (box.angle > 0) {
      box.angle -= 90.0f;
    }
  }
  return box;
}

// Pushes every side of the box outward by area * ratio / perimeter.
static std::optional<cv::RotatedRect> unclip(const cv::RotatedRect &box,
                                             double ratio) {
  double length = 2.0 * (box.size.width + box.size.height);
  if (length <= 0.0) {
    return {};
  }
  auto distance = static_cast<float>(box.size.area() * ratio / length);
  cv::Size2f grown(box.size.width + 2 * distance,
                   box.size.height + 2 * distance);
  return cv::RotatedRect(box.center, grown, box.angle);
}

DetectionResult DBPostProcess::process(const cv::Mat &prob) const {
  DetectionResult result;
  if (prob.empty()) {
    return result;
  }

  cv::Mat binary = prob > options.binary_threshold;

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(binary, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

  size_t candidates = std::min(
      contours.size(), static_cast<size_t>(std::max(options.max_candidates, 0)));
  ELOGFMT(DEBUG, "Found {} contours, scoring {}", contours.size(), candidates);

  for (size_t i = 0; i < candidates; ++i) {
    const auto &contour = contours[i];
    if (contour.size() < 4) {
      continue;
    }

    double score = contourScore(prob, contour);
    if (score < options.polygon_threshold) {
      continue;
    }

    cv::RotatedRect box = cv::minAreaRect(contour);
    if (std::min(box.size.width, box.size.height) < 3.0f) {
      continue;
    }

    auto grown = unclip(normalizeBox(box), options.unclip_ratio);
    if (!grown || grown->size.empty()) {
      continue;
    }

    cv::Point2f vertices[4];
    normalizeBox(*grown).points(vertices);

    result.boxes.push_back({vertices[0], vertices[1], vertices[2], vertices[3]});
    result.scores.push_back(static_cast<float>(score));
  }

  return result;
}

} // namespace db_text
