#include "StegoEngine.hpp"

#include <atomic>
#include <opencv2/core.hpp>
#include <span>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace stegomotion {

namespace {
std::shared_ptr<spdlog::logger> engineLogger =
    spdlog::basic_logger_mt("StegoEngineLogger", "logs/stego_engine.log");

constexpr std::uint32_t kMaxCharCode = 0xFF;
} // namespace

auto StegoEngine::create(const EngineConfig &config)
    -> std::expected<StegoEngine, StegoError> {
  auto lengthCodec = LengthCodec::create(config.codec, config.headerFrames);
  if (!lengthCodec) {
    engineLogger->error("Invalid header configuration: bit depth {}, {} frames",
                        config.codec.bitDepth, config.headerFrames);
    return std::unexpected(lengthCodec.error());
  }
  auto charCodec = CharacterCodec::create(config.codec);
  if (!charCodec) {
    engineLogger->error("Invalid character configuration: bit depth {}",
                        config.codec.bitDepth);
    return std::unexpected(charCodec.error());
  }
  return StegoEngine(config, *lengthCodec, *charCodec);
}

std::size_t StegoEngine::maxPayloadChars(std::size_t frameCount) const noexcept {
  const auto reserved = static_cast<std::size_t>(config_.headerFrames);
  return frameCount > reserved ? frameCount - reserved : 0;
}

auto StegoEngine::embed(const std::vector<cv::Mat> &frames,
                        std::string_view message) const
    -> std::expected<std::vector<cv::Mat>, StegoError> {
  std::vector<std::uint32_t> codes;
  codes.reserve(message.size());
  for (char c : message) {
    codes.push_back(static_cast<unsigned char>(c));
  }
  return embedCodes(frames, codes);
}

auto StegoEngine::embed(const std::vector<cv::Mat> &frames,
                        std::u32string_view message) const
    -> std::expected<std::vector<cv::Mat>, StegoError> {
  return embedCodes(frames,
                    std::vector<std::uint32_t>(message.begin(), message.end()));
}

auto StegoEngine::embedCodes(const std::vector<cv::Mat> &frames,
                             const std::vector<std::uint32_t> &codes) const
    -> std::expected<std::vector<cv::Mat>, StegoError> {
  const std::size_t length = codes.size();
  const auto headerFrames = static_cast<std::size_t>(config_.headerFrames);

  engineLogger->info("Embedding {} characters into {} frames", length,
                     frames.size());

  if (length > maxPayloadChars(frames.size())) {
    engineLogger->warn("Message too long: {} characters, capacity {}", length,
                       maxPayloadChars(frames.size()));
    return std::unexpected(StegoError::MessageTooLong);
  }
  for (std::size_t k = 0; k < length; ++k) {
    if (codes[k] > kMaxCharCode) {
      engineLogger->warn("Unsupported character U+{:04X} at position {}",
                         codes[k], k);
      return std::unexpected(StegoError::UnsupportedCharacter);
    }
  }
  if (length > lengthCodec_.maxLength()) {
    engineLogger->warn("Length {} exceeds header maximum {}", length,
                       lengthCodec_.maxLength());
    return std::unexpected(StegoError::LengthOverflow);
  }
  if (frames.empty()) {
    return std::unexpected(StegoError::EmptyInput);
  }
  if (frames.size() < headerFrames) {
    return std::unexpected(StegoError::InsufficientCapacity);
  }

  // Validate every frame that will be touched before writing anything
  const std::size_t touched = headerFrames + length;
  for (std::size_t i = 0; i < touched; ++i) {
    if (auto word = readLsbWord(frames[i], config_.codec); !word) {
      engineLogger->error("Frame {} cannot be used: {}", i,
                          errorToString(word.error()));
      return std::unexpected(word.error());
    }
  }

  std::vector<cv::Mat> output;
  output.reserve(frames.size());
  for (std::size_t i = 0; i < frames.size(); ++i) {
    output.push_back(i < touched ? frames[i].clone() : frames[i]);
  }

  if (auto header = lengthCodec_.encode(
          std::span<cv::Mat>(output.data(), headerFrames), length);
      !header) {
    return std::unexpected(header.error());
  }

  if (config_.useParallel) {
    std::atomic<bool> failed{false};
    std::atomic<int> failure{0};
    cv::parallel_for_(cv::Range(0, static_cast<int>(length)),
                      [&](const cv::Range &range) {
                        for (int k = range.start; k < range.end; ++k) {
                          auto written = charCodec_.encode(
                              output[headerFrames + k], codes[k]);
                          if (!written && !failed.exchange(true)) {
                            failure = static_cast<int>(written.error());
                          }
                        }
                      });
    if (failed) {
      return std::unexpected(static_cast<StegoError>(failure.load()));
    }
  } else {
    for (std::size_t k = 0; k < length; ++k) {
      if (auto written = charCodec_.encode(output[headerFrames + k], codes[k]);
          !written) {
        return std::unexpected(written.error());
      }
    }
  }

  engineLogger->info("Embedded {} characters, frames 0..{} altered", length,
                     touched - 1);
  return output;
}

auto StegoEngine::readHeader(const std::vector<cv::Mat> &frames) const
    -> std::expected<std::size_t, StegoError> {
  if (frames.empty()) {
    engineLogger->error("No frames to extract from");
    return std::unexpected(StegoError::EmptyInput);
  }
  if (frames.size() < static_cast<std::size_t>(config_.headerFrames)) {
    engineLogger->warn("{} frames cannot hold a {}-frame header", frames.size(),
                       config_.headerFrames);
    return std::unexpected(StegoError::CorruptHeader);
  }

  auto length = lengthCodec_.decode(std::span<const cv::Mat>(frames));
  if (!length) {
    engineLogger->error("Length header unreadable: {}",
                        errorToString(length.error()));
    return std::unexpected(length.error());
  }
  if (*length > maxPayloadChars(frames.size())) {
    engineLogger->warn("Header announces {} characters but only {} fit",
                       *length, maxPayloadChars(frames.size()));
    return std::unexpected(StegoError::CorruptHeader);
  }
  return static_cast<std::size_t>(*length);
}

auto StegoEngine::extract(const std::vector<cv::Mat> &frames) const
    -> std::expected<std::string, StegoError> {
  auto length = readHeader(frames);
  if (!length) {
    return std::unexpected(length.error());
  }

  const auto headerFrames = static_cast<std::size_t>(config_.headerFrames);
  std::string message;
  message.reserve(*length);
  for (std::size_t k = 0; k < *length; ++k) {
    auto c = charCodec_.decode(frames[headerFrames + k]);
    if (!c) {
      engineLogger->error("Frame {} unreadable: {}", headerFrames + k,
                          errorToString(c.error()));
      return std::unexpected(c.error());
    }
    message.push_back(static_cast<char>(*c));
  }

  engineLogger->info("Extracted {} characters from {} frames", message.size(),
                     frames.size());
  return message;
}

} // namespace stegomotion
