#include "Capture.h"
#include "ylt/easylog.hpp"

namespace db_text {

CameraSource::CameraSource(int device_id) : cap(device_id) {
  if (!cap.isOpened()) {
    ELOGFMT(WARNING, "Failed to open camera {}", device_id);
  }
}

bool CameraSource::read(cv::Mat &frame) {
  return cap.read(frame) && !frame.empty();
}

} // namespace db_text
