#include "FrameStore.hpp"

namespace stegomotion {

namespace {
constexpr double kFallbackFps = 30.0;
} // namespace

auto VideoFileStore::load(const std::string &path)
    -> std::expected<VideoClip, VideoIOError> {
  auto cap = VideoIO::openVideo(path);
  if (!cap) {
    return std::unexpected(cap.error());
  }
  const double fps = VideoIO::getVideoInfo(*cap).fps;
  cap->release();

  auto frames = VideoIO::extractFrames(path);
  if (!frames) {
    return std::unexpected(frames.error());
  }

  VideoClip clip;
  clip.frames = std::move(*frames);
  clip.fps = fps > 0.0 ? fps : kFallbackFps;
  return clip;
}

auto VideoFileStore::save(const std::string &path, const VideoClip &clip)
    -> std::expected<void, VideoIOError> {
  return VideoIO::saveFramesToVideo(path, clip.frames, clip.fps, fourcc_);
}

} // namespace stegomotion
