#include "DBDetector.h"
#include "Backends.h"
#include "ModelLoader.h"
#include "ylt/easylog.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace db_text {

DBDetector::DBDetector(const DBDetectorOptions &options)
    : postprocess(options.postprocess), input_size(options.input_size) {
  net = loadModel(options.model_path,
                  makeNetOption(options.backend_id, options.target_id));
  ELOGFMT(INFO, "DB detector ready, input {}x{}, vulkan {}", input_size.width,
          input_size.height, net->opt.use_vulkan_compute);
}

DetectionResult DBDetector::infer(const cv::Mat &image) {
  if (image.empty() || !net) {
    return {};
  }
  if (image.type() != CV_8UC3) {
    throw std::invalid_argument("DB detector expects an 8-bit BGR image");
  }

  cv::Mat input = image.isContinuous() ? image : image.clone();
  ncnn::Mat in = ncnn::Mat::from_pixels(input.data, ncnn::Mat::PIXEL_BGR,
                                        input.cols, input.rows);
  in.substract_mean_normalize(mean_vals, norm_vals);

  ncnn::Extractor ex = net->create_extractor();
  ex.input("in0", in);

  ncnn::Mat out;
  if (ex.extract("out0", out) != 0 || out.empty()) {
    throw std::runtime_error("DB detector produced no probability map");
  }

  // out is 1 x h x w; wrap channel 0 and copy before `out` goes away.
  cv::Mat prob = cv::Mat(out.h, out.w, CV_32FC1, out.channel(0).data).clone();
  if (prob.size() != image.size()) {
    cv::resize(prob, prob, image.size());
  }

  DetectionResult result = postprocess.process(prob);
  ELOGFMT(DEBUG, "DB detector found {} boxes", result.boxes.size());
  return result;
}

} // namespace db_text
