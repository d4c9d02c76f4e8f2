#pragma once
/** @file  FrameAnalyzer.hpp
 *  @brief Plug-in interface for per-frame detection running inside V4l2Camera.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace marich::io {

  /// Parameters a detector was started with; unused fields stay empty.
  struct DetectorParams {
    std::string color{};
    bool actionsEnabled{ true };
    std::string modelPath{};
    std::string labelPath{};
    std::string fontPath{};
    std::string sensitivity{};
  };

  /**
 * @class FrameAnalyzer
 * @brief One detection algorithm (colour blob, face, gesture, …).
 *
 *  * Called on the UI thread from `CameraBackend::pollFrame()` with a BGR frame that is
 *    only valid for the duration of the call.
 *  * May drive hardware (e.g. steer the wheels) when its detector has actions enabled.
 */
  class FrameAnalyzer {
  public:
    virtual ~FrameAnalyzer() = default;

    virtual void analyze(const cv::Mat& bgr) = 0;

    /// Called when the owning detector stops; analyzers that move the robot halt it here.
    virtual void reset() {}

    /// Latest classification label, if the analyzer produces one.
    virtual std::optional<std::string> label() const { return std::nullopt; }
  };

} // namespace marich::io
