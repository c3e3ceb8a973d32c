#include "VideoIO.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace stegomotion {

namespace {
std::shared_ptr<spdlog::logger> videoLogger =
    spdlog::basic_logger_mt("VideoIOLogger", "logs/video_io.log");

void handleException(const std::exception &e, const std::string &context) {
  videoLogger->error("{}: {}", context, e.what());
}
} // namespace

auto VideoIO::openVideo(const std::string &filename)
    -> std::expected<cv::VideoCapture, VideoIOError> {
  try {
    videoLogger->info("Opening video file: {}", filename);

    if (!std::filesystem::exists(filename)) {
      videoLogger->error("Video file does not exist: {}", filename);
      return std::unexpected(VideoIOError::FileNotFound);
    }

    cv::VideoCapture cap(filename);
    if (!cap.isOpened()) {
      videoLogger->error("Cannot open video file: {}", filename);
      return std::unexpected(VideoIOError::OpenFailed);
    }

    VideoInfo info = getVideoInfo(cap);
    videoLogger->info("Opened video: {}x{} @{}fps, {} frames, codec {}",
                      info.width, info.height, info.fps, info.frameCount,
                      info.codecName);
    return cap;
  } catch (const std::exception &e) {
    handleException(e, "openVideo");
    return std::unexpected(VideoIOError::OpenFailed);
  }
}

VideoIO::VideoInfo VideoIO::getVideoInfo(const cv::VideoCapture &cap) {
  VideoInfo info;
  info.width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
  info.height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
  info.fps = cap.get(cv::CAP_PROP_FPS);
  info.fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
  info.frameCount = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
  info.codecName = getFourCCString(info.fourcc);
  return info;
}

auto VideoIO::extractFrames(const std::string &filename, int maxFrames)
    -> std::expected<std::vector<cv::Mat>, VideoIOError> {
  auto cap = openVideo(filename);
  if (!cap) {
    return std::unexpected(cap.error());
  }

  try {
    std::vector<cv::Mat> frames;
    auto startTime = std::chrono::steady_clock::now();

    cv::Mat frame;
    while (maxFrames < 0 || static_cast<int>(frames.size()) < maxFrames) {
      if (!cap->read(frame) || frame.empty()) {
        break;
      }
      frames.push_back(frame.clone());

      if (frames.size() % 100 == 0) {
        videoLogger->debug("Read {} frames", frames.size());
      }
    }

    if (frames.empty()) {
      videoLogger->error("No frames could be read from {}", filename);
      return std::unexpected(VideoIOError::EmptyVideo);
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - startTime)
                        .count();
    videoLogger->info("Read {} frames in {}ms", frames.size(), duration);
    return frames;
  } catch (const std::exception &e) {
    handleException(e, "extractFrames");
    return std::unexpected(VideoIOError::ReadError);
  }
}

auto VideoIO::createVideo(const std::string &filename, int fourcc, double fps,
                          const cv::Size &frameSize, bool isColor)
    -> std::expected<cv::VideoWriter, VideoIOError> {
  try {
    videoLogger->info("Creating video file: {} ({}x{} @{}fps, codec {})",
                      filename, frameSize.width, frameSize.height, fps,
                      getFourCCString(fourcc));

    cv::VideoWriter writer(filename, fourcc, fps, frameSize, isColor);
    if (!writer.isOpened()) {
      videoLogger->error("Cannot create video writer for {}", filename);
      return std::unexpected(VideoIOError::OpenFailed);
    }
    return writer;
  } catch (const std::exception &e) {
    handleException(e, "createVideo");
    return std::unexpected(VideoIOError::OpenFailed);
  }
}

auto VideoIO::saveFramesToVideo(const std::string &filename,
                                const std::vector<cv::Mat> &frames, double fps,
                                const std::string &codec)
    -> std::expected<void, VideoIOError> {
  if (frames.empty()) {
    videoLogger->error("No frames to save");
    return std::unexpected(VideoIOError::EmptyVideo);
  }

  const cv::Size frameSize(frames[0].cols, frames[0].rows);
  const bool isColor = frames[0].channels() > 1;
  auto writer =
      createVideo(filename, getFourCC(codec), fps, frameSize, isColor);
  if (!writer) {
    return std::unexpected(writer.error());
  }

  try {
    for (size_t i = 0; i < frames.size(); ++i) {
      if (frames[i].size() != frameSize) {
        videoLogger->error("Frame {} is {}x{}, expected {}x{}", i,
                           frames[i].cols, frames[i].rows, frameSize.width,
                           frameSize.height);
        return std::unexpected(VideoIOError::WriteError);
      }
      writer->write(frames[i]);
    }
    writer->release();
  } catch (const std::exception &e) {
    handleException(e, "saveFramesToVideo");
    return std::unexpected(VideoIOError::WriteError);
  }

  videoLogger->info("Saved {} frames to {}", frames.size(), filename);
  return {};
}

int VideoIO::getFourCC(std::string_view codec) {
  if (codec.size() != 4) {
    return -1;
  }
  return cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
}

std::string VideoIO::getFourCCString(int fourcc) {
  char code[5] = {0};
  for (int i = 0; i < 4; ++i) {
    code[i] = static_cast<char>(fourcc & 0xFF);
    fourcc >>= 8;
  }
  return std::string(code);
}

std::string VideoIO::getLosslessCodec() { return "FFV1"; }

bool VideoIO::isSupportedContainer(const std::string &filename,
                                   std::span<const std::string> extensions) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  return std::any_of(extensions.begin(), extensions.end(),
                     [&ext](const std::string &candidate) {
                       std::string lowered = candidate;
                       std::transform(lowered.begin(), lowered.end(),
                                      lowered.begin(), [](unsigned char c) {
                                        return std::tolower(c);
                                      });
                       return lowered == ext;
                     });
}

std::string_view errorToString(VideoIOError error) noexcept {
  switch (error) {
  case VideoIOError::FileNotFound:
    return "Video file not found";
  case VideoIOError::UnsupportedContainer:
    return "Only lossless-capable containers are supported";
  case VideoIOError::OpenFailed:
    return "Video could not be opened";
  case VideoIOError::ReadError:
    return "Failed to read video frames";
  case VideoIOError::WriteError:
    return "Failed to write video frames";
  case VideoIOError::EmptyVideo:
    return "Video contains no frames";
  }
  return "Unknown error";
}

} // namespace stegomotion
