#include "config/StegoConfig.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace stegomotion;

namespace {
fs::path writeTempFile(const std::string &name, const std::string &content) {
  const fs::path path = fs::temp_directory_path() / name;
  std::ofstream(path) << content;
  return path;
}
} // namespace

TEST(StegoConfigTest, EmptyDocumentKeepsDefaults) {
  auto config = parseConfig(json::object());
  ASSERT_TRUE(config);

  EXPECT_EQ(config->engine.codec.bitDepth, 8);
  EXPECT_EQ(config->engine.codec.channelMode, ChannelMode::Interleaved);
  EXPECT_EQ(config->engine.codec.bitOrder, BitOrder::MsbFirst);
  EXPECT_EQ(config->engine.headerFrames, 1);
  EXPECT_FALSE(config->engine.useParallel);
  EXPECT_EQ(config->video.fourcc, "FFV1");
  EXPECT_EQ(config->video.extensions,
            (std::vector<std::string>{".avi", ".mov"}));
  EXPECT_EQ(config->logging.level, "info");
}

TEST(StegoConfigTest, ParsesEverySection) {
  const json document = json::parse(R"({
    "codec": {"bit_depth": 16, "channel_mode": "single", "channel": 2,
              "bit_order": "lsb_first"},
    "header_frames": 2,
    "use_parallel": true,
    "video": {"fourcc": "HFYU", "extensions": [".avi"]},
    "logging": {"level": "debug", "file": "out.log"}
  })");

  auto config = parseConfig(document);
  ASSERT_TRUE(config);
  EXPECT_EQ(config->engine.codec.bitDepth, 16);
  EXPECT_EQ(config->engine.codec.channelMode, ChannelMode::Single);
  EXPECT_EQ(config->engine.codec.channel, 2);
  EXPECT_EQ(config->engine.codec.bitOrder, BitOrder::LsbFirst);
  EXPECT_EQ(config->engine.headerFrames, 2);
  EXPECT_TRUE(config->engine.useParallel);
  EXPECT_EQ(config->video.fourcc, "HFYU");
  EXPECT_EQ(config->video.extensions, std::vector<std::string>{".avi"});
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_EQ(config->logging.file, "out.log");
}

TEST(StegoConfigTest, RejectsInvalidValues) {
  const std::vector<std::string> documents = {
      R"({"codec": {"channel_mode": "diagonal"}})",
      R"({"codec": {"bit_order": "middle_out"}})",
      R"({"codec": {"bit_depth": 0}})",
      R"({"codec": {"bit_depth": "eight"}})",
      R"({"header_frames": 0})",
      R"({"header_frames": 268435456})",
      R"({"header_frames": 8})",
      R"({"codec": {"bit_depth": 4294967304}})",
      R"({"codec": {"bit_depth": 8.5}})",
      R"({"codec": {"channel": -1}})",
      R"({"video": {"fourcc": "FFV"}})",
      R"({"video": {"extensions": []}})",
      R"({"logging": {"level": "loud"}})",
      R"([1, 2, 3])"};

  for (const auto &text : documents) {
    auto config = parseConfig(json::parse(text));
    ASSERT_FALSE(config) << text;
    EXPECT_EQ(config.error(), ConfigError::InvalidValue) << text;
  }
}

TEST(StegoConfigTest, SerializedConfigParsesBack) {
  AppConfig original;
  original.engine.codec.bitOrder = BitOrder::LsbFirst;
  original.engine.headerFrames = 3;
  original.video.fourcc = "HFYU";

  auto parsed = parseConfig(toJson(original));
  ASSERT_TRUE(parsed);
  EXPECT_EQ(toJson(*parsed), toJson(original));
}

TEST(StegoConfigTest, LoadsFromFile) {
  const auto path = writeTempFile("stegomotion_config_test.json",
                                  R"({"header_frames": 2})");
  auto config = loadConfig(path);
  ASSERT_TRUE(config);
  EXPECT_EQ(config->engine.headerFrames, 2);
  fs::remove(path);
}

TEST(StegoConfigTest, ReportsMissingAndMalformedFiles) {
  EXPECT_EQ(loadConfig("/nonexistent/stegomotion.json").error(),
            ConfigError::FileNotFound);

  const auto path =
      writeTempFile("stegomotion_config_broken.json", "{ not json");
  EXPECT_EQ(loadConfig(path).error(), ConfigError::ParseError);
  fs::remove(path);
}
