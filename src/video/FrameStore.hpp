#pragma once

#include "VideoIO.hpp"

#include <expected>
#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace stegomotion {

/**
 * @brief Decoded frames of a video together with the timing needed to write
 * them back.
 */
struct VideoClip {
  std::vector<cv::Mat> frames;
  double fps = 0.0;
};

/**
 * @brief Source and sink of raw frame sequences.
 */
class FrameStore {
public:
  virtual ~FrameStore() = default;

  /**
   * @brief Loads every frame of a video.
   * @param path Path to the video.
   * @return The clip or the reason it could not be read.
   */
  virtual auto load(const std::string &path)
      -> std::expected<VideoClip, VideoIOError> = 0;

  /**
   * @brief Stores a clip. The store must keep samples bit-exact.
   * @param path Destination path.
   * @param clip The frames to store.
   * @return Success or the reason writing failed.
   */
  virtual auto save(const std::string &path, const VideoClip &clip)
      -> std::expected<void, VideoIOError> = 0;
};

/**
 * @brief FrameStore over video files, writing with a lossless codec.
 */
class VideoFileStore : public FrameStore {
public:
  explicit VideoFileStore(std::string fourcc = VideoIO::getLosslessCodec())
      : fourcc_(std::move(fourcc)) {}

  auto load(const std::string &path)
      -> std::expected<VideoClip, VideoIOError> override;
  auto save(const std::string &path, const VideoClip &clip)
      -> std::expected<void, VideoIOError> override;

private:
  std::string fourcc_;
};

} // namespace stegomotion
