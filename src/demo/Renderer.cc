#include "Renderer.h"
#include <opencv2/imgproc.hpp>

namespace db_text {

cv::Mat render(const cv::Mat &frame, const std::vector<Quad> &boxes,
               const VisualStyle &style, std::optional<double> fps) {
  cv::Mat output = frame.clone();

  if (fps) {
    cv::putText(output, cv::format("FPS: %.2f", *fps), cv::Point(0, 15),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, style.text_color);
  }

  // Later boxes overwrite earlier ones.
  for (const auto &box : boxes) {
    cv::polylines(output, toIntPoints(box), style.closed, style.box_color,
                  style.thickness);
  }

  return output;
}

} // namespace db_text
