#pragma once

#include <expected>
#include <opencv2/videoio.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stegomotion {

// Error types for video container access
enum class VideoIOError {
  FileNotFound,
  UnsupportedContainer,
  OpenFailed,
  ReadError,
  WriteError,
  EmptyVideo
};

class VideoIO {
public:
  struct VideoInfo {
    int width;
    int height;
    double fps;
    int fourcc;
    int frameCount;
    std::string codecName;
  };

  // Reading
  static auto openVideo(const std::string &filename)
      -> std::expected<cv::VideoCapture, VideoIOError>;
  static VideoInfo getVideoInfo(const cv::VideoCapture &cap);
  static auto extractFrames(const std::string &filename, int maxFrames = -1)
      -> std::expected<std::vector<cv::Mat>, VideoIOError>;

  // Writing
  static auto createVideo(const std::string &filename, int fourcc, double fps,
                          const cv::Size &frameSize, bool isColor = true)
      -> std::expected<cv::VideoWriter, VideoIOError>;
  static auto saveFramesToVideo(const std::string &filename,
                                const std::vector<cv::Mat> &frames, double fps,
                                const std::string &codec = getLosslessCodec())
      -> std::expected<void, VideoIOError>;

  // Codecs
  static int getFourCC(std::string_view codec);
  static std::string getFourCCString(int fourcc);
  static std::string getLosslessCodec();

  // Containers that keep every bit of the frames written to them
  static bool isSupportedContainer(const std::string &filename,
                                   std::span<const std::string> extensions);
};

// String representation for VideoIOError
std::string_view errorToString(VideoIOError error) noexcept;

} // namespace stegomotion
