#include "LengthCodec.hpp"

#include <opencv2/core.hpp>

namespace stegomotion {

namespace {
constexpr int kMaxHeaderBits = 63;
} // namespace

auto LengthCodec::create(const CodecConfig &config, int headerFrames)
    -> std::expected<LengthCodec, StegoError> {
  if (auto valid = validateCodecConfig(config); !valid) {
    return std::unexpected(valid.error());
  }
  // bitDepth is at least 1 here, so the division cannot fault
  if (headerFrames < 1 || headerFrames > kMaxHeaderBits / config.bitDepth) {
    return std::unexpected(StegoError::InvalidConfig);
  }
  return LengthCodec(config, headerFrames);
}

std::uint64_t LengthCodec::maxLength() const noexcept {
  return (std::uint64_t{1} << (config_.bitDepth * headerFrames_)) - 1;
}

auto LengthCodec::encode(std::span<cv::Mat> frames, std::uint64_t length) const
    -> std::expected<void, StegoError> {
  if (length > maxLength()) {
    return std::unexpected(StegoError::LengthOverflow);
  }
  if (frames.size() < static_cast<std::size_t>(headerFrames_)) {
    return std::unexpected(StegoError::InsufficientCapacity);
  }

  // Check every header frame first so a failure leaves all of them untouched
  for (int i = 0; i < headerFrames_; ++i) {
    if (auto word = readLsbWord(frames[i], config_); !word) {
      return std::unexpected(word.error());
    }
  }

  const std::uint64_t chunkMask = (std::uint64_t{1} << config_.bitDepth) - 1;
  for (int i = 0; i < headerFrames_; ++i) {
    const int shift = config_.bitDepth * (headerFrames_ - 1 - i);
    const auto chunk = static_cast<std::uint32_t>((length >> shift) & chunkMask);
    if (auto written = writeLsbWord(frames[i], chunk, config_); !written) {
      return written;
    }
  }
  return {};
}

auto LengthCodec::encode(cv::Mat &frame, std::uint64_t length) const
    -> std::expected<void, StegoError> {
  return encode(std::span<cv::Mat>(&frame, 1), length);
}

auto LengthCodec::decode(std::span<const cv::Mat> frames) const
    -> std::expected<std::uint64_t, StegoError> {
  if (frames.size() < static_cast<std::size_t>(headerFrames_)) {
    return std::unexpected(StegoError::InsufficientCapacity);
  }

  std::uint64_t length = 0;
  for (int i = 0; i < headerFrames_; ++i) {
    auto chunk = readLsbWord(frames[i], config_);
    if (!chunk) {
      return std::unexpected(chunk.error());
    }
    length = (length << config_.bitDepth) | *chunk;
  }
  return length;
}

auto LengthCodec::decode(const cv::Mat &frame) const
    -> std::expected<std::uint64_t, StegoError> {
  return decode(std::span<const cv::Mat>(&frame, 1));
}

} // namespace stegomotion
