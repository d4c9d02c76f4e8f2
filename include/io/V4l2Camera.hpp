#pragma once
/** @file  V4l2Camera.hpp
 *  @brief CameraBackend over cv::VideoCapture on the Video4Linux2 API.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "io/AnalyzerPipeline.hpp"
#include "io/CameraBackend.hpp"

namespace marich {
  namespace io {

    class HardwareHandle;

    struct CameraSettings {
      std::string device{ "/dev/video0" };
      int width{ 640 };
      int height{ 480 };
      std::string fourcc{ "YUYV" };
      std::string faceCascade{ "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml" };
    };

    /**
 * @class V4l2Camera
 * @brief Holds the capture device for as long as the object lives.
 *
 *  * `open()` throws `core::CameraUnavailable` (node missing, busy, or no frames).
 *  * Detector start/stop only toggles which FrameAnalyzer sees frames; capture keeps
 *    streaming while the device is held.
 *  * Colour, face and gesture analyzers are registered on construction; object and
 *    plate recognition run capture-only unless `registerAnalyzer()` installs one.
 */
    class V4l2Camera : public CameraBackend {
    public:
      using AnalyzerMaker = AnalyzerPipeline::AnalyzerMaker;

      /// Upper bound on how long pollFrame() waits for the driver.
      static constexpr std::int64_t kPollTimeoutNs = 1'000'000;

      V4l2Camera(CameraSettings settings, HardwareHandle& hardware);
      ~V4l2Camera() override; ///< releaseAll()

      void open();

      /// Install the factory used when \p kind starts; replaces a built-in one.
      void registerAnalyzer(DetectorKind kind, AnalyzerMaker maker);

      void startColorTracking(const std::string& colorName) override;
      void startFaceTracking() override;
      void startGestureFollowing(bool actionsEnabled) override;
      void startObjectRecognition(const std::string& modelPath,
                                  const std::string& labelPath) override;
      void startLicensePlateRecognition(const std::string& fontPath,
                                        const std::string& sensitivity) override;

      void stopColorTracking() override { analyzers_.stop(DetectorKind::Color); }
      void stopFaceTracking() override { analyzers_.stop(DetectorKind::Face); }
      void stopGestureFollowing() override { analyzers_.stop(DetectorKind::Gesture); }
      void stopObjectRecognition() override { analyzers_.stop(DetectorKind::Object); }
      void stopLicensePlateRecognition() override { analyzers_.stop(DetectorKind::Plate); }

      void releaseAll() override;
      FrameEvent pollFrame() override;
      std::optional<std::string> latestGesture() const override;

      V4l2Camera(const V4l2Camera&) = delete;
      V4l2Camera& operator=(const V4l2Camera&) = delete;

    private:
      void start(DetectorKind kind, const DetectorParams& params);
      bool opened() const { return !streams_.empty() && streams_.front().isOpened(); }

      CameraSettings settings_;
      std::vector<cv::VideoCapture> streams_; ///< one capture; a vector for VideoCapture::waitAny
      cv::Mat frame_;
      std::uint64_t sequence_{ 0 };
      AnalyzerPipeline analyzers_;
    };

  } // namespace io
} // namespace marich
