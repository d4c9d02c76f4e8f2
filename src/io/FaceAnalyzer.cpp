/* @file FaceAnalyzer.cpp
 * @brief cascade face detection and turn-to-face steering for face-tracking mode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// OpenCV headers
#include <opencv2/imgproc.hpp>

// Marich headers
#include "core/Errors.hpp"
#include "io/FaceAnalyzer.hpp"
#include "io/HardwareHandle.hpp"

using namespace marich::io;

FaceAnalyzer::FaceAnalyzer(const std::string& cascadePath, HardwareHandle& hardware)
    : steering_(hardware, kSpeed) {
  if (cascadePath.empty() || !cascade_.load(cascadePath))
    throw marich::core::AssetMissing(
        "[CAMERA] face cascade could not be loaded: " + cascadePath +
            "\n  (set camera.face_cascade to haarcascade_frontalface_default.xml)",
        { cascadePath });
}

void FaceAnalyzer::analyze(const cv::Mat& bgr) {
  if (bgr.empty() || bgr.channels() != 3)
    return;

  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  cv::equalizeHist(gray, gray);

  std::vector<cv::Rect> faces;
  cascade_.detectMultiScale(gray, faces, 1.1, 5, 0, cv::Size(40, 40));

  const auto face = largest(faces);
  seen_ = face.has_value();
  steering_.apply(decide(face, bgr.cols));
}

void FaceAnalyzer::reset() {
  seen_ = false;
  steering_.halt();
}

std::optional<std::string> FaceAnalyzer::label() const {
  if (!seen_)
    return std::nullopt;
  return std::string("face");
}

std::optional<cv::Rect> FaceAnalyzer::largest(const std::vector<cv::Rect>& faces) {
  if (faces.empty())
    return std::nullopt;
  return *std::max_element(faces.begin(), faces.end(),
                           [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });
}

Steer FaceAnalyzer::decide(const std::optional<cv::Rect>& face, int frameWidth) {
  if (!face || frameWidth <= 1)
    return Steer::Stop;

  const double centre = face->x + face->width / 2.0;
  const double offset = (centre / static_cast<double>(frameWidth - 1)) * 2.0 - 1.0;
  if (offset < -kCenterBand)
    return Steer::Left;
  if (offset > kCenterBand)
    return Steer::Right;
  return Steer::Stop;
}
