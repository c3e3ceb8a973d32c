#pragma once

#include "CharacterCodec.hpp"
#include "LengthCodec.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <opencv2/core.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace stegomotion {

// Configuration for the steganography engine
struct EngineConfig {
  CodecConfig codec;        // Slot layout shared by header and characters
  int headerFrames = 1;     // Frames reserved for the length header
  bool useParallel = false; // Encode character frames with cv::parallel_for_
};

/**
 * @brief Hides a message in a frame sequence: the length header goes into the
 * first headerFrames frames and character k into frame headerFrames + k.
 *
 * The engine keeps no state between calls.
 */
class StegoEngine {
public:
  /**
   * @brief Creates an engine from a configuration.
   * @param config The engine configuration.
   * @return The engine or StegoError::InvalidConfig.
   */
  static auto create(const EngineConfig &config = {})
      -> std::expected<StegoEngine, StegoError>;

  /**
   * @brief Maximum number of characters a sequence of frameCount frames can
   * hold, floored at 0.
   */
  std::size_t maxPayloadChars(std::size_t frameCount) const noexcept;

  /**
   * @brief Embeds a byte message. Frames that are altered are deep copies; the
   * input frames are never modified and later frames are passed through.
   * @param frames The cover frames.
   * @param message The message bytes.
   * @return The stego frames or the reason nothing was embedded.
   */
  auto embed(const std::vector<cv::Mat> &frames, std::string_view message) const
      -> std::expected<std::vector<cv::Mat>, StegoError>;

  /**
   * @brief Embeds a message given as code points; each must be <= U+00FF.
   */
  auto embed(const std::vector<cv::Mat> &frames,
             std::u32string_view message) const
      -> std::expected<std::vector<cv::Mat>, StegoError>;

  /**
   * @brief Recovers an embedded message.
   * @param frames The stego frames.
   * @return The message bytes, or EmptyInput / CorruptHeader / a frame error.
   */
  auto extract(const std::vector<cv::Mat> &frames) const
      -> std::expected<std::string, StegoError>;

  /**
   * @brief Decodes and validates only the length header.
   * @param frames The stego frames.
   * @return The announced message length.
   */
  auto readHeader(const std::vector<cv::Mat> &frames) const
      -> std::expected<std::size_t, StegoError>;

  /**
   * @brief Largest length the header can announce, independent of frames.
   */
  std::uint64_t headerCapacity() const noexcept {
    return lengthCodec_.maxLength();
  }

  const EngineConfig &config() const noexcept { return config_; }

private:
  StegoEngine(const EngineConfig &config, LengthCodec lengthCodec,
              CharacterCodec charCodec)
      : config_(config), lengthCodec_(lengthCodec), charCodec_(charCodec) {}

  auto embedCodes(const std::vector<cv::Mat> &frames,
                  const std::vector<std::uint32_t> &codes) const
      -> std::expected<std::vector<cv::Mat>, StegoError>;

  EngineConfig config_;
  LengthCodec lengthCodec_;
  CharacterCodec charCodec_;
};

} // namespace stegomotion
