#pragma once
/** @file  ColorBlobAnalyzer.hpp
 *  @brief Built-in colour-tracking detector: hue-band blob centroid → wheel steering.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/FrameAnalyzer.hpp"
#include "io/Steering.hpp"

namespace marich::io {

  class HardwareHandle;

  /// Inclusive hue window in degrees; `wraps` means [lo,360) ∪ [0,hi].
  struct HueBand {
    int lo{ 0 };
    int hi{ 0 };
    bool wraps{ false };
  };

  /// Band for "red", "green", "blue", "yellow"; throws std::invalid_argument otherwise.
  HueBand hueBandFor(const std::string& colorName);

  /**
 * @class ColorBlobAnalyzer
 * @brief Thresholds the frame in HSV, keeps saturated pixels inside the hue band and
 *        steers toward their centroid.
 *
 *  * blob < kLostFraction of the frame      → stop (target lost)
 *  * |centroid x| > kCenterBand             → rotate toward it
 *  * centred and < kNearFraction            → drive forward
 *  * centred and ≥ kNearFraction            → stop (close enough)
 *  * Motor commands are only sent when the steering decision changes.
 */
  class ColorBlobAnalyzer : public FrameAnalyzer {
  public:
    using Steer = io::Steer;

    struct Blob {
      double fraction{ 0.0 }; ///< matching pixels / frame pixels
      double centerX{ 0.0 };  ///< -1 (left edge) … +1 (right edge)
    };

    static constexpr double kLostFraction = 0.002;
    static constexpr double kNearFraction = 0.08;
    static constexpr double kCenterBand = 0.25;
    static constexpr int kSpeed = 40;

    ColorBlobAnalyzer(std::string colorName, HardwareHandle& hardware);

    void analyze(const cv::Mat& bgr) override;
    void reset() override;
    std::optional<std::string> label() const override { return colorName_; }

    /// 8-bit mask of the pixels of \p bgr that fall inside \p band.
    static cv::Mat mask(const cv::Mat& bgr, const HueBand& band);

    /// Pure part of analyze(): locate the blob in a BGR frame.
    static Blob locate(const cv::Mat& bgr, const HueBand& band);

    /// Pure part of analyze(): steering decision for a blob.
    static Steer decide(const Blob& blob);

    Steer lastSteer() const { return steering_.last(); }

  private:
    std::string colorName_;
    HueBand band_;
    Steering steering_;
  };

} // namespace marich::io
