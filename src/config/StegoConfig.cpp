#include "StegoConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <opencv2/core.hpp>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace stegomotion {

namespace {
std::shared_ptr<spdlog::logger> configLogger =
    spdlog::basic_logger_mt("ConfigLogger", "logs/config.log");

constexpr std::int64_t kMaxBitDepth = 32;
constexpr std::int64_t kMaxChannel = CV_CN_MAX - 1;
constexpr std::int64_t kMaxHeaderFrames = 63;

const std::vector<std::string> LOG_LEVELS = {"trace", "debug",    "info", "warn",
                                             "error", "critical", "off"};

auto parseChannelMode(const std::string &name) -> std::optional<ChannelMode> {
  if (name == "interleaved")
    return ChannelMode::Interleaved;
  if (name == "single")
    return ChannelMode::Single;
  return std::nullopt;
}

auto parseBitOrder(const std::string &name) -> std::optional<BitOrder> {
  if (name == "msb_first")
    return BitOrder::MsbFirst;
  if (name == "lsb_first")
    return BitOrder::LsbFirst;
  return std::nullopt;
}

std::string channelModeName(ChannelMode mode) {
  return mode == ChannelMode::Interleaved ? "interleaved" : "single";
}

std::string bitOrderName(BitOrder order) {
  return order == BitOrder::MsbFirst ? "msb_first" : "lsb_first";
}

bool invalid(std::string_view key) {
  configLogger->error("Invalid value for '{}'", key);
  return false;
}

// Reads an optional integer and rejects values outside [low, high]
bool readInteger(const json &node, const char *key, std::int64_t low,
                 std::int64_t high, int &out) {
  if (!node.is_object() || !node.contains(key))
    return true;
  const json &value = node.at(key);
  if (!value.is_number_integer())
    return invalid(key);
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(high))
      return invalid(key);
  } else {
    const auto number = value.get<std::int64_t>();
    if (number < low || number > high)
      return invalid(key);
  }
  out = static_cast<int>(value.get<std::int64_t>());
  return true;
}

bool readCodec(const json &node, CodecConfig &codec) {
  if (!node.is_object())
    return invalid("codec");
  if (!readInteger(node, "bit_depth", 1, kMaxBitDepth, codec.bitDepth) ||
      !readInteger(node, "channel", 0, kMaxChannel, codec.channel))
    return false;

  auto mode = parseChannelMode(
      node.value("channel_mode", channelModeName(codec.channelMode)));
  if (!mode)
    return invalid("codec.channel_mode");
  codec.channelMode = *mode;

  auto order =
      parseBitOrder(node.value("bit_order", bitOrderName(codec.bitOrder)));
  if (!order)
    return invalid("codec.bit_order");
  codec.bitOrder = *order;

  if (!validateCodecConfig(codec))
    return invalid("codec");
  return true;
}

bool readVideo(const json &node, VideoConfig &video) {
  video.fourcc = node.value("fourcc", video.fourcc);
  if (video.fourcc.size() != 4)
    return invalid("video.fourcc");

  video.extensions = node.value("extensions", video.extensions);
  if (video.extensions.empty())
    return invalid("video.extensions");
  return true;
}

bool readLogging(const json &node, LoggingConfig &logging) {
  logging.level = node.value("level", logging.level);
  logging.file = node.value("file", logging.file);
  if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), logging.level) ==
      LOG_LEVELS.end())
    return invalid("logging.level");
  if (logging.file.empty())
    return invalid("logging.file");
  return true;
}
} // namespace

auto parseConfig(const json &document)
    -> std::expected<AppConfig, ConfigError> {
  AppConfig config;
  if (!document.is_object()) {
    configLogger->error("Configuration root must be an object");
    return std::unexpected(ConfigError::InvalidValue);
  }

  try {
    if (document.contains("codec") &&
        !readCodec(document.at("codec"), config.engine.codec))
      return std::unexpected(ConfigError::InvalidValue);

    if (!readInteger(document, "header_frames", 1, kMaxHeaderFrames,
                     config.engine.headerFrames))
      return std::unexpected(ConfigError::InvalidValue);
    // The header must fit the 63 bits a length can occupy
    if (!LengthCodec::create(config.engine.codec, config.engine.headerFrames)) {
      configLogger->error("Header of {} frames at {} bits is too wide",
                          config.engine.headerFrames,
                          config.engine.codec.bitDepth);
      return std::unexpected(ConfigError::InvalidValue);
    }
    config.engine.useParallel =
        document.value("use_parallel", config.engine.useParallel);

    if (document.contains("video") &&
        !readVideo(document.at("video"), config.video))
      return std::unexpected(ConfigError::InvalidValue);
    if (document.contains("logging") &&
        !readLogging(document.at("logging"), config.logging))
      return std::unexpected(ConfigError::InvalidValue);
  } catch (const json::exception &e) {
    // Type mismatches such as a string where a number is expected
    configLogger->error("Configuration has wrong value type: {}", e.what());
    return std::unexpected(ConfigError::InvalidValue);
  }

  return config;
}

auto loadConfig(const fs::path &path) -> std::expected<AppConfig, ConfigError> {
  if (!fs::exists(path) || fs::is_directory(path)) {
    configLogger->error("Configuration file not found: {}", path.string());
    return std::unexpected(ConfigError::FileNotFound);
  }

  std::ifstream file(path);
  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    configLogger->error("Failed to parse configuration: {}", path.string());
    return std::unexpected(ConfigError::ParseError);
  }

  configLogger->info("Loaded configuration: {}", path.string());
  return parseConfig(document);
}

json toJson(const AppConfig &config) {
  const auto &codec = config.engine.codec;
  return {
      {"codec",
       {{"bit_depth", codec.bitDepth},
        {"channel_mode", channelModeName(codec.channelMode)},
        {"channel", codec.channel},
        {"bit_order", bitOrderName(codec.bitOrder)}}},
      {"header_frames", config.engine.headerFrames},
      {"use_parallel", config.engine.useParallel},
      {"video",
       {{"fourcc", config.video.fourcc},
        {"extensions", config.video.extensions}}},
      {"logging",
       {{"level", config.logging.level}, {"file", config.logging.file}}}};
}

std::string_view errorToString(ConfigError error) noexcept {
  switch (error) {
  case ConfigError::FileNotFound:
    return "Configuration file not found";
  case ConfigError::ParseError:
    return "Configuration file is not valid JSON";
  case ConfigError::InvalidValue:
    return "Configuration contains an invalid value";
  }
  return "Unknown error";
}

} // namespace stegomotion
