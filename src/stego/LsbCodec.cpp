#include "LsbCodec.hpp"

#include <opencv2/core.hpp>

namespace stegomotion {

namespace {

constexpr int kMaxBitDepth = 32;

auto checkFrame(const cv::Mat &frame, const CodecConfig &config)
    -> std::expected<void, StegoError> {
  if (frame.empty() || frame.dims != 2 || frame.depth() != CV_8U) {
    return std::unexpected(StegoError::UnsupportedFrameFormat);
  }
  if (config.channelMode == ChannelMode::Single &&
      config.channel >= frame.channels()) {
    return std::unexpected(StegoError::UnsupportedFrameFormat);
  }
  if (embeddableSamples(frame, config) <
      static_cast<std::size_t>(config.bitDepth)) {
    return std::unexpected(StegoError::InsufficientCapacity);
  }
  return {};
}

// Address of the index-th embeddable sample in row-major order
template <typename MatT, typename Ptr>
Ptr samplePtr(MatT &frame, std::size_t index, const CodecConfig &config) {
  const auto cols = static_cast<std::size_t>(frame.cols);
  const auto channels = static_cast<std::size_t>(frame.channels());
  if (config.channelMode == ChannelMode::Interleaved) {
    const std::size_t rowLen = cols * channels;
    return frame.template ptr<uchar>(static_cast<int>(index / rowLen)) +
           index % rowLen;
  }
  return frame.template ptr<uchar>(static_cast<int>(index / cols)) +
         (index % cols) * channels + static_cast<std::size_t>(config.channel);
}

// Bit of the word that belongs in the given slot
int bitForSlot(int slot, const CodecConfig &config) noexcept {
  return config.bitOrder == BitOrder::MsbFirst ? config.bitDepth - 1 - slot
                                               : slot;
}

} // namespace

auto validateCodecConfig(const CodecConfig &config) noexcept
    -> std::expected<void, StegoError> {
  if (config.bitDepth < 1 || config.bitDepth > kMaxBitDepth ||
      config.channel < 0) {
    return std::unexpected(StegoError::InvalidConfig);
  }
  return {};
}

std::size_t embeddableSamples(const cv::Mat &frame,
                              const CodecConfig &config) noexcept {
  if (frame.empty() || frame.dims != 2) {
    return 0;
  }
  const std::size_t pixels = frame.total();
  return config.channelMode == ChannelMode::Interleaved
             ? pixels * static_cast<std::size_t>(frame.channels())
             : pixels;
}

auto writeLsbWord(cv::Mat &frame, std::uint32_t value,
                  const CodecConfig &config) -> std::expected<void, StegoError> {
  if (auto valid = validateCodecConfig(config); !valid) {
    return valid;
  }
  if (auto usable = checkFrame(frame, config); !usable) {
    return usable;
  }

  for (int slot = 0; slot < config.bitDepth; ++slot) {
    uchar *sample =
        samplePtr<cv::Mat, uchar *>(frame, static_cast<std::size_t>(slot), config);
    const auto bit =
        static_cast<uchar>((value >> bitForSlot(slot, config)) & 1U);
    *sample = static_cast<uchar>((*sample & 0xFE) | bit);
  }
  return {};
}

auto readLsbWord(const cv::Mat &frame, const CodecConfig &config)
    -> std::expected<std::uint32_t, StegoError> {
  if (auto valid = validateCodecConfig(config); !valid) {
    return std::unexpected(valid.error());
  }
  if (auto usable = checkFrame(frame, config); !usable) {
    return std::unexpected(usable.error());
  }

  std::uint32_t value = 0;
  for (int slot = 0; slot < config.bitDepth; ++slot) {
    const uchar *sample = samplePtr<const cv::Mat, const uchar *>(
        frame, static_cast<std::size_t>(slot), config);
    value |= static_cast<std::uint32_t>(*sample & 1U)
             << bitForSlot(slot, config);
  }
  return value;
}

} // namespace stegomotion
