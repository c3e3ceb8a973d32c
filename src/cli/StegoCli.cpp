#include "StegoCli.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <istream>
#include <ostream>
#include <utility>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace stegomotion {

namespace {
std::shared_ptr<spdlog::logger> cliLogger =
    spdlog::basic_logger_mt("StegoCliLogger", "logs/stego_cli.log");

constexpr std::string_view CYAN = "\033[96m";
constexpr std::string_view MAGENTA = "\033[95m";
constexpr std::string_view WHITE = "\033[97m";
constexpr std::string_view RED = "\033[91m";
} // namespace

StegoCli::StegoCli(const AppConfig &config, const StegoEngine &engine,
                   FrameStore &store, std::istream &in, std::ostream &out)
    : config_(config), engine_(engine), store_(store), in_(in), out_(out) {}

int StegoCli::run(const std::string &videoPath) {
  if (!VideoIO::isSupportedContainer(videoPath, config_.video.extensions)) {
    printError(fmt::format("Only {} files are supported.",
                           fmt::join(config_.video.extensions, " and ")));
    return 1;
  }

  out_ << CYAN << "Select the mode of operation:\n";
  out_ << MAGENTA << "D." << WHITE << " Detect Message\n";
  out_ << MAGENTA << "H." << WHITE << " Hide Message\n";

  auto mode = prompt(fmt::format("{}Enter the mode (D/H): {}", CYAN, WHITE));
  if (!mode) {
    return 1;
  }
  if (*mode != "H" && *mode != "h" && *mode != "D" && *mode != "d") {
    printError("Invalid mode!");
    return 1;
  }

  auto clip = store_.load(videoPath);
  if (!clip) {
    printError(fmt::format("Cannot read {}: {}", videoPath,
                           errorToString(clip.error())));
    return 1;
  }
  cliLogger->info("Loaded {} frames from {}", clip->frames.size(), videoPath);

  return (*mode == "H" || *mode == "h") ? hide(*clip) : detect(*clip);
}

int StegoCli::hide(const VideoClip &clip) {
  const std::size_t maxChars = static_cast<std::size_t>(
      std::min<std::uint64_t>(engine_.maxPayloadChars(clip.frames.size()),
                              engine_.headerCapacity()));
  out_ << fmt::format("You can enter a message up to {} characters.\n",
                      maxChars);

  auto text = prompt("Enter the message to hide: ");
  if (!text) {
    return 1;
  }
  auto message = decodeUtf8(*text);
  if (!message) {
    printError("Message contains characters outside the single-byte range.");
    return 1;
  }
  if (message->size() > maxChars) {
    printError("Message is too long for the video!");
    return 1;
  }

  auto outputPath = prompt("Enter the output video path (e.g., output.avi): ");
  if (!outputPath) {
    return 1;
  }
  if (!VideoIO::isSupportedContainer(*outputPath, config_.video.extensions)) {
    printError(fmt::format("Output must be one of: {}",
                           fmt::join(config_.video.extensions, ", ")));
    return 1;
  }

  auto stego = engine_.embed(clip.frames, std::u32string_view(*message));
  if (!stego) {
    printError(fmt::format("Embedding failed: {}", errorToString(stego.error())));
    return 1;
  }

  VideoClip output{std::move(*stego), clip.fps};
  if (auto saved = store_.save(*outputPath, output); !saved) {
    printError(fmt::format("Cannot write {}: {}", *outputPath,
                           errorToString(saved.error())));
    return 1;
  }

  cliLogger->info("Hid {} characters in {}", message->size(), *outputPath);
  out_ << fmt::format("Message successfully hidden in {}.\n", *outputPath);
  return 0;
}

int StegoCli::detect(const VideoClip &clip) {
  auto message = engine_.extract(clip.frames);
  if (!message) {
    cliLogger->warn("Extraction failed: {}", errorToString(message.error()));
    out_ << fmt::format("No message detected. ({})\n",
                        errorToString(message.error()));
    return 1;
  }
  if (message->empty()) {
    out_ << "No message detected.\n";
    return 0;
  }

  out_ << fmt::format("{}Detected message: {}{}{}\n", WHITE, RED,
                      latin1ToUtf8(*message), WHITE);
  return 0;
}

std::optional<std::string> StegoCli::prompt(std::string_view text) {
  out_ << text << std::flush;
  std::string line;
  if (!std::getline(in_, line)) {
    printError("Input ended unexpectedly.");
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

void StegoCli::printError(std::string_view text) {
  cliLogger->error("{}", text);
  out_ << RED << text << WHITE << '\n';
}

auto decodeUtf8(std::string_view text)
    -> std::expected<std::u32string, StegoError> {
  std::u32string result;
  result.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    int extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      return std::unexpected(StegoError::UnsupportedCharacter);
    }

    if (i + static_cast<std::size_t>(extra) >= text.size()) {
      return std::unexpected(StegoError::UnsupportedCharacter);
    }
    for (int j = 1; j <= extra; ++j) {
      const auto next = static_cast<unsigned char>(text[i + j]);
      if ((next & 0xC0) != 0x80) {
        return std::unexpected(StegoError::UnsupportedCharacter);
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF are malformed
    constexpr char32_t kMinForLength[] = {0x0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[extra] || (cp >= 0xD800 && cp <= 0xDFFF) ||
        cp > 0x10FFFF) {
      return std::unexpected(StegoError::UnsupportedCharacter);
    }
    result.push_back(cp);
    i += static_cast<std::size_t>(extra) + 1;
  }
  return result;
}

std::string latin1ToUtf8(std::string_view text) {
  std::string result;
  result.reserve(text.size() * 2);
  for (char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80) {
      result.push_back(static_cast<char>(byte));
    } else {
      result.push_back(static_cast<char>(0xC0 | (byte >> 6)));
      result.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
  }
  return result;
}

} // namespace stegomotion
