#include "Runner.h"
#include "demo/Rescaler.h"
#include "ylt/easylog.hpp"
#include <format>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace db_text {

static std::string formatQuad(const Quad &quad) {
  std::string text;
  for (const auto &p : quad) {
    if (!text.empty()) {
      text += ' ';
    }
    text += std::format("({:.1f}, {:.1f})", p.x, p.y);
  }
  return text;
}

Runner::Runner(const DemoConfig &config, TextDetector &detector,
               Viewer &viewer, const VisualStyle &style)
    : config(config), detector(detector), viewer(viewer), style(style) {}

void Runner::run() {
  if (config.input) {
    runImage(*config.input);
    return;
  }

  CameraSource camera(config.device);
  runStream(camera);
}

DetectionResult Runner::detect(const cv::Mat &frame, cv::TickMeter *meter) {
  auto scale = ScaleFactors::between(frame.size(), config.input_size);

  cv::Mat resized;
  cv::resize(frame, resized, config.input_size);

  if (meter) {
    meter->start();
  }
  DetectionResult result = detector.infer(resized);
  if (meter) {
    meter->stop();
  }

  if (result.scores.size() != result.boxes.size()) {
    throw std::runtime_error(std::format(
        "{} returned {} boxes but {} scores", detector.name(),
        result.boxes.size(), result.scores.size()));
  }

  result.boxes = rescale(result.boxes, scale);
  return result;
}

cv::Mat Runner::runImage(const std::string &path) {
  cv::Mat original = cv::imread(path, cv::IMREAD_COLOR);
  if (original.empty()) {
    throw std::runtime_error("Failed to read image: " + path);
  }

  DetectionResult result = detect(original, nullptr);

  ELOGFMT(INFO, "{} texts detected.", result.boxes.size());
  for (size_t i = 0; i < result.boxes.size(); ++i) {
    ELOGFMT(INFO, "{}: {}, {:.2f}", i, formatQuad(result.boxes[i]),
            result.scores[i]);
  }

  cv::Mat rendered = render(original, result.boxes, style);

  if (config.save) {
    if (!cv::imwrite(config.result_path, rendered)) {
      throw std::runtime_error("Failed to write " + config.result_path);
    }
    ELOGFMT(INFO, "Results saved to {}", config.result_path);
  }

  if (config.vis) {
    viewer.show(path, rendered);
    viewer.pollKey(0);
  }

  return rendered;
}

size_t Runner::runStream(FrameSource &source) {
  if (config.save) {
    ELOGFMT(WARNING, "--save only applies to image input, camera frames "
                     "are not written");
  }

  const std::string title = std::format("{} Demo", detector.name());
  cv::TickMeter tm;
  cv::Mat frame;
  size_t shown = 0;

  while (viewer.pollKey(kStreamPollMs) < 0) {
    if (!source.read(frame)) {
      ELOGFMT(INFO, "No frames grabbed!");
      break;
    }

    tm.reset();
    DetectionResult result = detect(frame, &tm);

    viewer.show(title, render(frame, result.boxes, style, tm.getFPS()));
    ++shown;
  }

  return shown;
}

} // namespace db_text
