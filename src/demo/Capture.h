#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace db_text {

class FrameSource {
public:
  virtual ~FrameSource() = default;

  // False once no further frame can be delivered.
  virtual bool read(cv::Mat &frame) = 0;
};

class CameraSource : public FrameSource {
public:
  explicit CameraSource(int device_id);

  bool read(cv::Mat &frame) override;

private:
  cv::VideoCapture cap;
};

} // namespace db_text
