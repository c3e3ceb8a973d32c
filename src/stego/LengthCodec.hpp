#pragma once

#include "LsbCodec.hpp"

#include <cstdint>
#include <expected>
#include <opencv2/core.hpp>
#include <span>

namespace stegomotion {

/**
 * @brief Stores the message length in the reserved header frames.
 *
 * Each header frame carries bitDepth bits of the length using the same LSB
 * layout as CharacterCodec. With more than one header frame the length is
 * split big-endian: frame 0 holds the most significant chunk.
 */
class LengthCodec {
public:
  /**
   * @brief Creates a codec; requires headerFrames >= 1 and
   * bitDepth * headerFrames <= 63.
   * @param config The codec configuration.
   * @param headerFrames Number of frames reserved for the header.
   * @return The codec or StegoError::InvalidConfig.
   */
  static auto create(const CodecConfig &config = {}, int headerFrames = 1)
      -> std::expected<LengthCodec, StegoError>;

  /**
   * @brief Largest length the header can represent.
   */
  std::uint64_t maxLength() const noexcept;

  int headerFrames() const noexcept { return headerFrames_; }
  const CodecConfig &config() const noexcept { return config_; }

  /**
   * @brief Writes a length into the first headerFrames() frames in place.
   * Nothing is written on failure.
   * @param frames The frame sequence, at least headerFrames() long.
   * @param length The message length.
   * @return Success, LengthOverflow, or the reason a frame is unusable.
   */
  auto encode(std::span<cv::Mat> frames, std::uint64_t length) const
      -> std::expected<void, StegoError>;

  /**
   * @brief Single-frame form of encode() for a one-frame header.
   */
  auto encode(cv::Mat &frame, std::uint64_t length) const
      -> std::expected<void, StegoError>;

  /**
   * @brief Reads the length back from the first headerFrames() frames.
   * @param frames The frame sequence.
   * @return The length or the reason the header cannot be read.
   */
  auto decode(std::span<const cv::Mat> frames) const
      -> std::expected<std::uint64_t, StegoError>;

  /**
   * @brief Single-frame form of decode() for a one-frame header.
   */
  auto decode(const cv::Mat &frame) const
      -> std::expected<std::uint64_t, StegoError>;

private:
  LengthCodec(const CodecConfig &config, int headerFrames)
      : config_(config), headerFrames_(headerFrames) {}

  CodecConfig config_;
  int headerFrames_;
};

} // namespace stegomotion
