#include "CharacterCodec.hpp"

#include <limits>

namespace stegomotion {

namespace {
constexpr std::uint32_t kMaxCharCode = std::numeric_limits<std::uint8_t>::max();
constexpr int kMinCharBitDepth = 8;
} // namespace

auto CharacterCodec::create(const CodecConfig &config)
    -> std::expected<CharacterCodec, StegoError> {
  if (auto valid = validateCodecConfig(config); !valid) {
    return std::unexpected(valid.error());
  }
  if (config.bitDepth < kMinCharBitDepth) {
    return std::unexpected(StegoError::InvalidConfig);
  }
  return CharacterCodec(config);
}

auto CharacterCodec::encode(cv::Mat &frame, std::uint32_t charCode) const
    -> std::expected<void, StegoError> {
  if (charCode > kMaxCharCode) {
    return std::unexpected(StegoError::UnsupportedCharacter);
  }
  return writeLsbWord(frame, charCode, config_);
}

auto CharacterCodec::decode(const cv::Mat &frame) const
    -> std::expected<std::uint8_t, StegoError> {
  auto word = readLsbWord(frame, config_);
  if (!word) {
    return std::unexpected(word.error());
  }
  // Wider slots than a byte can decode to values no character maps to
  if (*word > kMaxCharCode) {
    return std::unexpected(StegoError::UnsupportedCharacter);
  }
  return static_cast<std::uint8_t>(*word);
}

} // namespace stegomotion
