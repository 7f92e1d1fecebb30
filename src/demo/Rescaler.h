#pragma once
#include <vector>

#include "infer/CVUtils.h"

namespace db_text {

// Maps model-input boxes into original-frame coordinates, one axis at a time.
// Coordinates are not clamped.
std::vector<Quad> rescale(const std::vector<Quad> &boxes,
                          const ScaleFactors &scale);

} // namespace db_text
