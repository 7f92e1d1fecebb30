#include <gtest/gtest.h>

#include <vector>

#include "demo/DemoConfig.h"

using db_text::BackendCapabilities;
using db_text::parseBool;
using db_text::parseDemoConfig;

namespace {

BackendCapabilities cpuOnly() {
  return {.backends = {db_text::kBackendNcnn},
          .targets = {db_text::kTargetCpu}};
}

BackendCapabilities withVulkan() {
  return {.backends = {db_text::kBackendNcnn, db_text::kBackendVulkan},
          .targets = {db_text::kTargetCpu, db_text::kTargetGpu,
                      db_text::kTargetGpuFp16}};
}

auto parse(std::vector<const char *> args,
           const BackendCapabilities &caps = cpuOnly()) {
  args.insert(args.begin(), "db_text_demo");
  return parseDemoConfig(static_cast<int>(args.size()), args.data(), caps);
}

} // namespace

TEST(ParseBoolTest, AcceptsCommonSpellings) {
  for (const char *v : {"on", "yes", "true", "y", "t", "TRUE", "Yes"}) {
    auto b = parseBool(v);
    ASSERT_TRUE(b.has_value()) << v;
    EXPECT_TRUE(*b) << v;
  }
  for (const char *v : {"off", "no", "false", "n", "f", "False", "OFF"}) {
    auto b = parseBool(v);
    ASSERT_TRUE(b.has_value()) << v;
    EXPECT_FALSE(*b) << v;
  }
}

TEST(ParseBoolTest, RejectsAnythingElse) {
  EXPECT_FALSE(parseBool("maybe").has_value());
  EXPECT_FALSE(parseBool("").has_value());
  EXPECT_FALSE(parseBool("1").has_value());
}

TEST(DemoConfigTest, Defaults) {
  auto config = parse({});

  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->input.has_value());
  EXPECT_EQ(config->device, 0);
  EXPECT_EQ(config->model_path,
            "text_detection_DB_TD500_resnet18_2021sep.onnx");
  EXPECT_EQ(config->backend_id, db_text::kBackendNcnn);
  EXPECT_EQ(config->target_id, db_text::kTargetCpu);
  EXPECT_EQ(config->input_size, cv::Size(736, 736));
  EXPECT_FLOAT_EQ(config->postprocess.binary_threshold, 0.3f);
  EXPECT_FLOAT_EQ(config->postprocess.polygon_threshold, 0.5f);
  EXPECT_EQ(config->postprocess.max_candidates, 200);
  EXPECT_DOUBLE_EQ(config->postprocess.unclip_ratio, 2.0);
  EXPECT_FALSE(config->save);
  EXPECT_TRUE(config->vis);
  EXPECT_EQ(config->result_path, "result.jpg");
}

TEST(DemoConfigTest, LongOptions) {
  auto config = parse({"--input=sign.jpg", "--model=db_ic15.onnx",
                       "--width=640", "--height=480",
                       "--binary_threshold=0.25", "--polygon_threshold=0.6",
                       "--max_candidates=50", "--unclip_ratio=1.5",
                       "--save=true", "--vis=false", "--device=2"});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->input, "sign.jpg");
  EXPECT_EQ(config->model_path, "db_ic15.onnx");
  EXPECT_EQ(config->input_size, cv::Size(640, 480));
  EXPECT_FLOAT_EQ(config->postprocess.binary_threshold, 0.25f);
  EXPECT_FLOAT_EQ(config->postprocess.polygon_threshold, 0.6f);
  EXPECT_EQ(config->postprocess.max_candidates, 50);
  EXPECT_DOUBLE_EQ(config->postprocess.unclip_ratio, 1.5);
  EXPECT_TRUE(config->save);
  EXPECT_FALSE(config->vis);
  EXPECT_EQ(config->device, 2);
}

TEST(DemoConfigTest, ShortAliases) {
  auto config = parse({"-i=photo.png", "-m=model.param", "-s=yes", "-v=off"});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->input, "photo.png");
  EXPECT_EQ(config->model_path, "model.param");
  EXPECT_TRUE(config->save);
  EXPECT_FALSE(config->vis);
}

TEST(DemoConfigTest, DetectorOptionsFollowConfig) {
  auto config = parse({"--width=320", "--height=320", "--unclip_ratio=3"});
  ASSERT_TRUE(config.has_value());

  auto options = config->detectorOptions();

  EXPECT_EQ(options.model_path, config->model_path);
  EXPECT_EQ(options.input_size, cv::Size(320, 320));
  EXPECT_DOUBLE_EQ(options.postprocess.unclip_ratio, 3.0);
  EXPECT_EQ(options.backend_id, config->backend_id);
  EXPECT_EQ(options.target_id, config->target_id);
}

TEST(DemoConfigTest, SpaceSeparatedValueIsUsageError) {
  auto config = parse({"--input", "photo.jpg"});

  ASSERT_FALSE(config.has_value());
  EXPECT_FALSE(config.error().help_requested);
  EXPECT_NE(config.error().message.find("photo.jpg"), std::string::npos);

  EXPECT_FALSE(parse({"-m", "model.param"}).has_value());
}

TEST(DemoConfigTest, NegativeValueAfterEqualsIsNotAStrayToken) {
  auto config = parse({"--device=-1"});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->device, -1);
}

TEST(DemoConfigTest, MalformedNumberIsUsageError) {
  auto config = parse({"--width=wide"});

  ASSERT_FALSE(config.has_value());
  EXPECT_FALSE(config.error().help_requested);
}

TEST(DemoConfigTest, MalformedUnclipRatioIsUsageError) {
  EXPECT_FALSE(parse({"--unclip_ratio=big"}).has_value());
}

TEST(DemoConfigTest, MalformedBooleanIsUsageError) {
  auto config = parse({"--vis=maybe"});

  ASSERT_FALSE(config.has_value());
  EXPECT_NE(config.error().message.find("--vis"), std::string::npos);
}

TEST(DemoConfigTest, NonPositiveSizeIsUsageError) {
  EXPECT_FALSE(parse({"--width=0"}).has_value());
  EXPECT_FALSE(parse({"--height=-32"}).has_value());
}

TEST(DemoConfigTest, SizeNotMultipleOf32IsAccepted) {
  auto config = parse({"--width=700"});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->input_size.width, 700);
}

TEST(DemoConfigTest, VulkanIdsNeedVulkanCapability) {
  EXPECT_FALSE(parse({"--backend=1"}).has_value());
  EXPECT_FALSE(parse({"--target=2"}).has_value());

  auto config = parse({"--backend=1", "--target=2"}, withVulkan());
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->backend_id, db_text::kBackendVulkan);
  EXPECT_EQ(config->target_id, db_text::kTargetGpuFp16);
}

TEST(DemoConfigTest, HelpIsReportedSeparately) {
  auto config = parse({"--help"});

  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().help_requested);
}

TEST(BackendCapabilitiesTest, HelpListsOnlySupportedIds) {
  EXPECT_EQ(cpuOnly().backendHelp().find("Vulkan"), std::string::npos);
  EXPECT_NE(withVulkan().backendHelp().find("1: Vulkan"), std::string::npos);
  EXPECT_NE(withVulkan().targetHelp().find("2: GPU fp16"), std::string::npos);
}

TEST(BackendCapabilitiesTest, QueryAlwaysContainsTheCpuBaseSet) {
  auto caps = db_text::queryBackendCapabilities();

  EXPECT_TRUE(caps.supportsBackend(db_text::kBackendNcnn));
  EXPECT_TRUE(caps.supportsTarget(db_text::kTargetCpu));
}

TEST(BackendCapabilitiesTest, MismatchedPairFallsBackToCpu) {
  EXPECT_FALSE(db_text::makeNetOption(db_text::kBackendVulkan,
                                      db_text::kTargetCpu)
                   .use_vulkan_compute);
  EXPECT_FALSE(
      db_text::makeNetOption(db_text::kBackendNcnn, db_text::kTargetGpu)
          .use_vulkan_compute);
  EXPECT_FALSE(
      db_text::makeNetOption(db_text::kBackendNcnn, db_text::kTargetCpu)
          .use_vulkan_compute);
}
