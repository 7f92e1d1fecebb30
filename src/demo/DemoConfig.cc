#include "DemoConfig.h"
#include "ylt/easylog.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace db_text {

DBDetectorOptions DemoConfig::detectorOptions() const {
  return {.model_path = model_path,
          .input_size = input_size,
          .postprocess = postprocess,
          .backend_id = backend_id,
          .target_id = target_id};
}

std::expected<bool, std::string> parseBool(std::string_view value) {
  std::string lowered(value);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  constexpr std::array<std::string_view, 5> truthy = {"on", "yes", "true", "y",
                                                      "t"};
  constexpr std::array<std::string_view, 5> falsy = {"off", "no", "false", "n",
                                                     "f"};
  if (std::ranges::find(truthy, lowered) != truthy.end()) {
    return true;
  }
  if (std::ranges::find(falsy, lowered) != falsy.end()) {
    return false;
  }
  return std::unexpected("not a boolean: '" + std::string(value) + "'");
}

static std::string buildKeys(const BackendCapabilities &caps) {
  std::string keys =
      "{ help h            |       | Print help message. }"
      "{ input i           |       | Set path to the input image. Omit for "
      "using default camera. }"
      "{ device d          | 0     | Camera device index used when no input "
      "image is given. }"
      "{ model m           | ";
  keys += kDefaultModelPath;
  keys += " | Set model path, the ncnn .param/.bin pair is looked up next to "
          "it. }";
  keys += "{ backend b         | 0     | " + caps.backendHelp() + ". }";
  keys += "{ target t          | 0     | " + caps.targetHelp() + ". }";
  keys += "{ width             | 736   | Resize input image to certain width. "
          "It should be multiple by 32. }"
          "{ height            | 736   | Resize input image to certain "
          "height. It should be multiple by 32. }"
          "{ binary_threshold  | 0.3   | Threshold of the binary map. }"
          "{ polygon_threshold | 0.5   | Threshold of polygons. }"
          "{ max_candidates    | 200   | Set maximum number of polygon "
          "candidates. }"
          "{ unclip_ratio      | 2.0   | The unclip ratio of the detected text "
          "region, which determines the output size. }"
          "{ save s            | false | Set true to save the result to "
          "result.jpg. Invalid in case of camera input. }"
          "{ vis v             | true  | Set false to skip showing the result "
          "window. Invalid in case of camera input. }";
  return keys;
}

std::expected<DemoConfig, UsageError>
parseDemoConfig(int argc, const char *const argv[],
                const BackendCapabilities &caps) {
  // CommandLineParser reads "--input photo.jpg" as a bare --input flag and
  // drops the value, so every token has to carry its own dash.
  for (int i = 1; i < argc; ++i) {
    std::string_view token(argv[i]);
    if (!token.starts_with('-')) {
      return std::unexpected(
          UsageError{.message = "unexpected argument '" + std::string(token) +
                                "'; use --name=value"});
    }
  }

  cv::CommandLineParser parser(argc, argv, buildKeys(caps));
  parser.about("Real-time Scene Text Detection with Differentiable "
               "Binarization (https://arxiv.org/abs/1911.08947).");

  if (parser.has("help")) {
    parser.printMessage();
    return std::unexpected(UsageError{.help_requested = true});
  }

  DemoConfig config;
  if (parser.has("input")) {
    config.input = parser.get<std::string>("input");
  }
  config.device = parser.get<int>("device");
  config.model_path = parser.get<std::string>("model");
  config.backend_id = parser.get<int>("backend");
  config.target_id = parser.get<int>("target");
  config.input_size = {parser.get<int>("width"), parser.get<int>("height")};
  config.postprocess.binary_threshold = parser.get<float>("binary_threshold");
  config.postprocess.polygon_threshold =
      parser.get<float>("polygon_threshold");
  config.postprocess.max_candidates = parser.get<int>("max_candidates");
  config.postprocess.unclip_ratio = parser.get<double>("unclip_ratio");
  auto save = parseBool(parser.get<std::string>("save"));
  auto vis = parseBool(parser.get<std::string>("vis"));

  if (!parser.check()) {
    parser.printErrors();
    return std::unexpected(UsageError{.message = "invalid arguments"});
  }
  if (!save) {
    return std::unexpected(UsageError{.message = "--save: " + save.error()});
  }
  if (!vis) {
    return std::unexpected(UsageError{.message = "--vis: " + vis.error()});
  }
  config.save = *save;
  config.vis = *vis;

  if (config.input && config.input->empty()) {
    return std::unexpected(UsageError{.message = "--input must not be empty"});
  }
  if (config.input_size.width <= 0 || config.input_size.height <= 0) {
    return std::unexpected(
        UsageError{.message = "--width and --height must be positive"});
  }
  if (config.input_size.width % 32 != 0 || config.input_size.height % 32 != 0) {
    ELOGFMT(WARNING, "Input size {}x{} is not a multiple of 32",
            config.input_size.width, config.input_size.height);
  }
  if (!caps.supportsBackend(config.backend_id)) {
    return std::unexpected(UsageError{
        .message = "unsupported backend " + std::to_string(config.backend_id)});
  }
  if (!caps.supportsTarget(config.target_id)) {
    return std::unexpected(UsageError{
        .message = "unsupported target " + std::to_string(config.target_id)});
  }

  return config;
}

} // namespace db_text
