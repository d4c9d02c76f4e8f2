/* @file ColorBlobAnalyzer.cpp
 * @brief HSV threshold, centroid and steering for colour-tracking mode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// OpenCV headers
#include <opencv2/imgproc.hpp>

// Marich headers
#include "io/ColorBlobAnalyzer.hpp"
#include "io/HardwareHandle.hpp"

using namespace marich::io;

namespace {

  // OpenCV stores 8-bit hue as degrees / 2
  constexpr int kMinSaturation = 115;
  constexpr int kMinValue = 64;

  cv::Scalar lower(int hueDegrees) { return cv::Scalar(hueDegrees / 2, kMinSaturation, kMinValue); }
  cv::Scalar upper(int hueDegrees) { return cv::Scalar(hueDegrees / 2, 255, 255); }

} // namespace

HueBand marich::io::hueBandFor(const std::string& colorName) {
  if (colorName == "red")
    return { 340, 10, true };
  if (colorName == "yellow")
    return { 40, 70, false };
  if (colorName == "green")
    return { 80, 160, false };
  if (colorName == "blue")
    return { 190, 260, false };
  throw std::invalid_argument("[ColorBlobAnalyzer] unsupported colour: " + colorName);
}

ColorBlobAnalyzer::ColorBlobAnalyzer(std::string colorName, HardwareHandle& hardware)
    : colorName_(std::move(colorName)), band_(hueBandFor(colorName_)),
      steering_(hardware, kSpeed) {}

cv::Mat ColorBlobAnalyzer::mask(const cv::Mat& bgr, const HueBand& band) {
  cv::Mat hsv;
  cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

  cv::Mat out;
  if (band.wraps) {
    cv::Mat high;
    cv::Mat low;
    cv::inRange(hsv, lower(band.lo), upper(358), high);
    cv::inRange(hsv, lower(0), upper(band.hi), low);
    cv::bitwise_or(high, low, out);
  } else {
    cv::inRange(hsv, lower(band.lo), upper(band.hi), out);
  }
  return out;
}

ColorBlobAnalyzer::Blob ColorBlobAnalyzer::locate(const cv::Mat& bgr, const HueBand& band) {
  Blob blob;
  if (bgr.empty() || bgr.channels() != 3)
    return blob;

  const cv::Moments m = cv::moments(mask(bgr, band), true);
  if (m.m00 <= 0.0)
    return blob;

  blob.fraction = m.m00 / static_cast<double>(bgr.total());
  const double meanX = m.m10 / m.m00;
  blob.centerX = bgr.cols > 1 ? (meanX / static_cast<double>(bgr.cols - 1)) * 2.0 - 1.0 : 0.0;
  return blob;
}

ColorBlobAnalyzer::Steer ColorBlobAnalyzer::decide(const Blob& blob) {
  if (blob.fraction < kLostFraction)
    return Steer::Stop;
  if (blob.centerX < -kCenterBand)
    return Steer::Left;
  if (blob.centerX > kCenterBand)
    return Steer::Right;
  return blob.fraction < kNearFraction ? Steer::Forward : Steer::Stop;
}

void ColorBlobAnalyzer::analyze(const cv::Mat& bgr) { steering_.apply(decide(locate(bgr, band_))); }

void ColorBlobAnalyzer::reset() { steering_.halt(); }
