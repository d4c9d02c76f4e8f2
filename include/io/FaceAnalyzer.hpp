#pragma once
/** @file  FaceAnalyzer.hpp
 *  @brief Haar-cascade face detection that turns the robot toward the largest face.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include <opencv2/objdetect.hpp>

#include "io/FrameAnalyzer.hpp"
#include "io/Steering.hpp"

namespace marich::io {

  class HardwareHandle;

  class FaceAnalyzer : public FrameAnalyzer {
  public:
    static constexpr double kCenterBand = 0.2;
    static constexpr int kSpeed = 30;

    /// Throws core::AssetMissing when \p cascadePath cannot be loaded.
    FaceAnalyzer(const std::string& cascadePath, HardwareHandle& hardware);

    void analyze(const cv::Mat& bgr) override;
    void reset() override;

    /// "face" while the last frame showed one.
    std::optional<std::string> label() const override;

    static std::optional<cv::Rect> largest(const std::vector<cv::Rect>& faces);

    /// Rotate toward a face outside the centre band; stop when centred or none is seen.
    static Steer decide(const std::optional<cv::Rect>& face, int frameWidth);

  private:
    cv::CascadeClassifier cascade_;
    Steering steering_;
    bool seen_{ false };
  };

} // namespace marich::io
