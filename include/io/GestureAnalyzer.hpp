#pragma once
/** @file  GestureAnalyzer.hpp
 *  @brief Finger counting on the largest skin-coloured blob ("Zero".."Five").
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "io/FrameAnalyzer.hpp"
#include "io/Steering.hpp"

namespace marich::io {

  class HardwareHandle;

  /**
 * @class GestureAnalyzer
 * @brief Skin mask in YCrCb, largest contour, convexity defects between raised fingers.
 *
 *  * A closed fist and a single raised finger both read as "Zero".
 *  * With actions enabled: Five drives forward, Two rotates left, Three rotates right,
 *    anything else (or no hand) stops.
 *  * The label clears as soon as a frame shows no hand.
 */
  class GestureAnalyzer : public FrameAnalyzer {
  public:
    static constexpr double kMinHandFraction = 0.01;  ///< of the frame area
    static constexpr double kMinGapDepth = 0.15;      ///< of the hand's bounding-box height
    static constexpr double kMaxGapDegrees = 90.0;
    static constexpr int kSpeed = 30;

    GestureAnalyzer(bool actionsEnabled, HardwareHandle& hardware);

    void analyze(const cv::Mat& bgr) override;
    void reset() override;
    std::optional<std::string> label() const override { return label_; }

    static cv::Mat skinMask(const cv::Mat& bgr);

    /// Raised fingers (0..5) of one hand outline.
    static int countFingers(const std::vector<cv::Point>& contour);

    static std::string labelFor(int fingers);
    static Steer actionFor(int fingers);

  private:
    bool actionsEnabled_;
    Steering steering_;
    std::optional<std::string> label_{};
  };

} // namespace marich::io
