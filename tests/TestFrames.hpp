#pragma once

#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

namespace stegomotion::test {

// Frames filled with one value
inline std::vector<cv::Mat> makeFrames(int count, int rows, int cols, int type,
                                       int fill = 0) {
  std::vector<cv::Mat> frames;
  for (int i = 0; i < count; ++i) {
    frames.emplace_back(rows, cols, type, cv::Scalar::all(fill));
  }
  return frames;
}

// Frames filled with reproducible noise
inline std::vector<cv::Mat> makeNoiseFrames(int count, int rows, int cols,
                                            int type, std::uint64_t seed = 42) {
  cv::RNG rng(seed);
  std::vector<cv::Mat> frames;
  for (int i = 0; i < count; ++i) {
    cv::Mat frame(rows, cols, type);
    rng.fill(frame, cv::RNG::UNIFORM, 0, 256);
    frames.push_back(frame);
  }
  return frames;
}

inline std::vector<cv::Mat> cloneFrames(const std::vector<cv::Mat> &frames) {
  std::vector<cv::Mat> copies;
  for (const auto &frame : frames) {
    copies.push_back(frame.clone());
  }
  return copies;
}

inline bool identical(const cv::Mat &a, const cv::Mat &b) {
  return a.size() == b.size() && a.type() == b.type() &&
         cv::norm(a, b, cv::NORM_INF) == 0;
}

} // namespace stegomotion::test
