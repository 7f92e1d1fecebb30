#pragma once
#include <string>

#include <opencv2/core.hpp>

namespace db_text {

// Result display and key polling.
class Viewer {
public:
  virtual ~Viewer() = default;

  virtual void show(const std::string &title, const cv::Mat &image) = 0;

  // Waits up to `timeout_ms` (0 blocks indefinitely) and returns the pressed
  // key, or a negative value when none arrived.
  virtual int pollKey(int timeout_ms) = 0;
};

class HighGuiViewer : public Viewer {
public:
  void show(const std::string &title, const cv::Mat &image) override;
  int pollKey(int timeout_ms) override;
};

} // namespace db_text
