#include "Viewer.h"
#include <opencv2/highgui.hpp>

namespace db_text {

void HighGuiViewer::show(const std::string &title, const cv::Mat &image) {
  cv::namedWindow(title, cv::WINDOW_AUTOSIZE);
  cv::imshow(title, image);
}

int HighGuiViewer::pollKey(int timeout_ms) { return cv::waitKey(timeout_ms); }

} // namespace db_text
