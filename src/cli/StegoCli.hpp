#pragma once

#include "config/StegoConfig.hpp"
#include "stego/StegoEngine.hpp"
#include "video/FrameStore.hpp"

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace stegomotion {

/**
 * @brief Interactive dialogue that hides a message in, or detects a message
 * from, a video.
 */
class StegoCli {
public:
  StegoCli(const AppConfig &config, const StegoEngine &engine,
           FrameStore &store, std::istream &in, std::ostream &out);

  /**
   * @brief Runs one dialogue on a video.
   * @param videoPath Path to the cover or stego video.
   * @return Process exit status: 0 on success, 1 on failure.
   */
  int run(const std::string &videoPath);

private:
  int hide(const VideoClip &clip);
  int detect(const VideoClip &clip);
  std::optional<std::string> prompt(std::string_view text);
  void printError(std::string_view text);

  const AppConfig &config_;
  const StegoEngine &engine_;
  FrameStore &store_;
  std::istream &in_;
  std::ostream &out_;
};

/**
 * @brief Decodes UTF-8 text into code points.
 * @param text UTF-8 encoded text.
 * @return The code points, or UnsupportedCharacter for malformed input.
 */
auto decodeUtf8(std::string_view text)
    -> std::expected<std::u32string, StegoError>;

/**
 * @brief Converts single-byte (Latin-1) text to UTF-8 for display.
 */
std::string latin1ToUtf8(std::string_view text);

} // namespace stegomotion
