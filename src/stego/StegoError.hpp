#pragma once

#include <string_view>

namespace stegomotion {

// Error kinds reported by the codecs and the engine
enum class StegoError {
  InsufficientCapacity,   // frame has fewer samples than one slot needs
  LengthOverflow,         // length does not fit in the header width
  MessageTooLong,         // more characters than frames available
  UnsupportedCharacter,   // code point outside a single byte
  EmptyInput,             // no frames supplied
  CorruptHeader,          // decoded length inconsistent with the frame count
  UnsupportedFrameFormat, // empty, non-2D, non-8-bit or missing channel
  InvalidConfig
};

// String representation for StegoError
std::string_view errorToString(StegoError error) noexcept;

} // namespace stegomotion
