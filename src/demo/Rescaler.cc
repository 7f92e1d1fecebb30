#include "Rescaler.h"

namespace db_text {

std::vector<Quad> rescale(const std::vector<Quad> &boxes,
                          const ScaleFactors &scale) {
  std::vector<Quad> scaled;
  scaled.reserve(boxes.size());

  for (const auto &box : boxes) {
    Quad out;
    for (size_t j = 0; j < box.size(); ++j) {
      out[j].x = box[j].x * scale.width;
      out[j].y = box[j].y * scale.height;
    }
    scaled.push_back(out);
  }
  return scaled;
}

} // namespace db_text
