#pragma once

#include "LsbCodec.hpp"

#include <cstdint>
#include <expected>

namespace stegomotion {

/**
 * @brief Hides one single-byte character per frame in the LSBs of the first
 * bitDepth embeddable samples.
 */
class CharacterCodec {
public:
  /**
   * @brief Creates a codec; requires 8 <= bitDepth <= 32.
   * @param config The codec configuration.
   * @return The codec or StegoError::InvalidConfig.
   */
  static auto create(const CodecConfig &config = {})
      -> std::expected<CharacterCodec, StegoError>;

  /**
   * @brief Embeds a character code into a frame in place.
   * @param frame The frame to modify.
   * @param charCode The character code, 0..255.
   * @return Success or UnsupportedCharacter / InsufficientCapacity /
   * UnsupportedFrameFormat.
   */
  auto encode(cv::Mat &frame, std::uint32_t charCode) const
      -> std::expected<void, StegoError>;

  /**
   * @brief Recovers the character code embedded in a frame.
   * @param frame The frame to read.
   * @return The character code or the reason it cannot be read.
   */
  auto decode(const cv::Mat &frame) const
      -> std::expected<std::uint8_t, StegoError>;

  const CodecConfig &config() const noexcept { return config_; }

private:
  explicit CharacterCodec(const CodecConfig &config) : config_(config) {}

  CodecConfig config_;
};

} // namespace stegomotion
