/* @file GestureAnalyzer.cpp
 * @brief skin segmentation and convexity-defect finger counting for gesture mode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// OpenCV headers
#include <opencv2/imgproc.hpp>

// Marich headers
#include "io/GestureAnalyzer.hpp"
#include "io/HardwareHandle.hpp"

using namespace marich::io;

namespace {

  const cv::Scalar kSkinLow(0, 133, 77);
  const cv::Scalar kSkinHigh(255, 173, 127);

  double gapDegrees(const cv::Point& start, const cv::Point& end, const cv::Point& far) {
    const cv::Point2d a = start - far;
    const cv::Point2d b = end - far;
    const double len = cv::norm(a) * cv::norm(b);
    if (len <= 0.0)
      return 180.0;
    return std::acos(std::clamp(a.dot(b) / len, -1.0, 1.0)) * 180.0 / CV_PI;
  }

} // namespace

GestureAnalyzer::GestureAnalyzer(bool actionsEnabled, HardwareHandle& hardware)
    : actionsEnabled_(actionsEnabled), steering_(hardware, kSpeed) {}

cv::Mat GestureAnalyzer::skinMask(const cv::Mat& bgr) {
  cv::Mat ycrcb;
  cv::cvtColor(bgr, ycrcb, cv::COLOR_BGR2YCrCb);

  cv::Mat mask;
  cv::inRange(ycrcb, kSkinLow, kSkinHigh, mask);
  cv::morphologyEx(mask, mask, cv::MORPH_OPEN,
                   cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3)));
  return mask;
}

int GestureAnalyzer::countFingers(const std::vector<cv::Point>& contour) {
  if (contour.size() < 5)
    return 0;

  std::vector<int> hull;
  cv::convexHull(contour, hull, false, false);
  if (hull.size() < 4)
    return 0;

  std::vector<cv::Vec4i> defects;
  cv::convexityDefects(contour, hull, defects);

  const double minDepth = kMinGapDepth * cv::boundingRect(contour).height;
  int gaps = 0;
  for (const auto& d : defects) {
    if (d[3] / 256.0 < minDepth)
      continue;
    if (gapDegrees(contour[d[0]], contour[d[1]], contour[d[2]]) > kMaxGapDegrees)
      continue;
    ++gaps;
  }
  return gaps == 0 ? 0 : std::min(gaps + 1, 5);
}

std::string GestureAnalyzer::labelFor(int fingers) {
  static const char* const kNames[] = { "Zero", "One", "Two", "Three", "Four", "Five" };
  return kNames[std::clamp(fingers, 0, 5)];
}

Steer GestureAnalyzer::actionFor(int fingers) {
  switch (fingers) {
  case 5:
    return Steer::Forward;
  case 2:
    return Steer::Left;
  case 3:
    return Steer::Right;
  default:
    return Steer::Stop;
  }
}

void GestureAnalyzer::analyze(const cv::Mat& bgr) {
  if (bgr.empty() || bgr.channels() != 3)
    return;

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(skinMask(bgr), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  const auto hand = std::max_element(contours.begin(), contours.end(),
                                     [](const auto& a, const auto& b) {
                                       return cv::contourArea(a) < cv::contourArea(b);
                                     });
  if (hand == contours.end() ||
      cv::contourArea(*hand) < kMinHandFraction * static_cast<double>(bgr.total())) {
    label_.reset();
    if (actionsEnabled_)
      steering_.apply(Steer::Stop);
    return;
  }

  const int fingers = countFingers(*hand);
  label_ = labelFor(fingers);
  if (actionsEnabled_)
    steering_.apply(actionFor(fingers));
}

void GestureAnalyzer::reset() {
  label_.reset();
  if (actionsEnabled_)
    steering_.halt();
}
