#pragma once
#include "ncnn/net.h"
#include <memory>
#include <string>
#include <string_view>

#include "DBPostProcess.h"
#include "TextDetector.h"

namespace db_text {

struct DBDetectorOptions {
  std::string model_path;
  cv::Size input_size{736, 736};
  DBPostProcessOptions postprocess;
  int backend_id = 0;
  int target_id = 0;
};

// Real-time Scene Text Detection with Differentiable Binarization
// (https://arxiv.org/abs/1911.08947), executed by ncnn.
class DBDetector : public TextDetector {
public:
  explicit DBDetector(const DBDetectorOptions &options);
  ~DBDetector() override = default;

  // Expects a BGR image already resized to the configured input size.
  DetectionResult infer(const cv::Mat &image) override;

  std::string_view name() const override { return "DB"; }

private:
  std::unique_ptr<ncnn::Net> net;
  DBPostProcess postprocess;
  cv::Size input_size;
  // TD500 training statistics, BGR order
  float mean_vals[3] = {122.67891434f, 116.66876762f, 104.00698793f};
  float norm_vals[3] = {1.0f / 255.f, 1.0f / 255.f, 1.0f / 255.f};
};
} // namespace db_text
