#include "StegoError.hpp"

namespace stegomotion {

std::string_view errorToString(StegoError error) noexcept {
  switch (error) {
  case StegoError::InsufficientCapacity:
    return "Frame has too few samples for the embedding slots";
  case StegoError::LengthOverflow:
    return "Message length does not fit in the length header";
  case StegoError::MessageTooLong:
    return "Message is longer than the available frames";
  case StegoError::UnsupportedCharacter:
    return "Character is not a single-byte value";
  case StegoError::EmptyInput:
    return "No frames supplied";
  case StegoError::CorruptHeader:
    return "Length header is inconsistent with the frame count";
  case StegoError::UnsupportedFrameFormat:
    return "Frame format is not supported";
  case StegoError::InvalidConfig:
    return "Invalid codec configuration";
  }
  return "Unknown error";
}

} // namespace stegomotion
