#pragma once

#include "StegoError.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>

namespace cv {
class Mat;
}

namespace stegomotion {

/**
 * @brief Which samples of a frame carry embedded bits.
 */
enum class ChannelMode {
  Interleaved, ///< Every channel sample, row-major, channels interleaved
  Single       ///< Only samples of CodecConfig::channel
};

/**
 * @brief Order in which the bits of a word are laid over the slots.
 */
enum class BitOrder {
  MsbFirst, ///< Slot 0 holds the most significant bit
  LsbFirst  ///< Slot 0 holds bit 0
};

/**
 * @brief Layout parameters shared by the length and character codecs.
 */
struct CodecConfig {
  int bitDepth = 8; ///< Slots per frame (bits per embedded word)
  ChannelMode channelMode = ChannelMode::Interleaved;
  int channel = 0; ///< Channel index used in ChannelMode::Single
  BitOrder bitOrder = BitOrder::MsbFirst;
};

/**
 * @brief Checks the ranges of a codec configuration.
 * @param config The configuration to check.
 * @return Success or StegoError::InvalidConfig.
 */
auto validateCodecConfig(const CodecConfig &config) noexcept
    -> std::expected<void, StegoError>;

/**
 * @brief Counts the samples of a frame that can carry one bit each.
 * @param frame The frame.
 * @param config The codec configuration.
 * @return Number of embeddable samples, 0 if the frame is unusable.
 */
std::size_t embeddableSamples(const cv::Mat &frame,
                              const CodecConfig &config) noexcept;

/**
 * @brief Writes the low config.bitDepth bits of a word into the LSBs of the
 * first config.bitDepth embeddable samples. Nothing is written on failure.
 * @param frame The frame, modified in place.
 * @param value The word to embed.
 * @param config The codec configuration.
 * @return Success or the reason the frame cannot hold the word.
 */
auto writeLsbWord(cv::Mat &frame, std::uint32_t value,
                  const CodecConfig &config) -> std::expected<void, StegoError>;

/**
 * @brief Reads a word of config.bitDepth bits back from the LSBs of a frame.
 * @param frame The frame.
 * @param config The codec configuration.
 * @return The word or the reason the frame cannot hold one.
 */
auto readLsbWord(const cv::Mat &frame, const CodecConfig &config)
    -> std::expected<std::uint32_t, StegoError>;

} // namespace stegomotion
