#pragma once
/** @file  CameraBackend.hpp
 *  @brief Boundary of the camera device + detector backends.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace marich {
  namespace io {

    enum class DetectorKind : std::uint8_t { None, Color, Face, Gesture, Object, Plate, Count };
    static_assert(static_cast<std::uint8_t>(DetectorKind::Count) == 6,
                  "DetectorKind count changed please update code that depends on it");

    inline const char* toString(DetectorKind k) {
      switch (k) {
      case DetectorKind::None:
        return "none";
      case DetectorKind::Color:
        return "color";
      case DetectorKind::Face:
        return "face";
      case DetectorKind::Gesture:
        return "gesture";
      case DetectorKind::Object:
        return "object";
      case DetectorKind::Plate:
        return "plate";
      default:
        return "unknown";
      }
    }

    /// What the UI loop gets back from one non-blocking poll.
    struct FrameEvent {
      enum class Kind { Idle, Frame, Key };

      Kind kind{ Kind::Idle };
      std::uint64_t sequence{ 0 }; ///< frames delivered since the device was opened
      int width{ 0 };
      int height{ 0 };
      DetectorKind detector{ DetectorKind::None };
      char key{ 0 }; ///< valid when kind == Key

      static FrameEvent idle() { return {}; }
    };

    /**
 * @class CameraBackend
 * @brief One opened camera device plus its detection sub-modes.
 *
 *  * Instances exist only while the device is held (factory opens, destructor closes).
 *  * start/stop calls may throw on driver / detector failure.
 *  * `pollFrame()` never blocks.
 */
    class CameraBackend {
    public:
      virtual ~CameraBackend() = default;

      virtual void startColorTracking(const std::string& colorName) = 0;
      virtual void startFaceTracking() = 0;
      virtual void startGestureFollowing(bool actionsEnabled) = 0;
      virtual void startObjectRecognition(const std::string& modelPath,
                                          const std::string& labelPath) = 0;
      virtual void startLicensePlateRecognition(const std::string& fontPath,
                                                const std::string& sensitivity) = 0;

      virtual void stopColorTracking() = 0;
      virtual void stopFaceTracking() = 0;
      virtual void stopGestureFollowing() = 0;
      virtual void stopObjectRecognition() = 0;
      virtual void stopLicensePlateRecognition() = 0;

      /// Stop everything and hand the device back to the OS.
      virtual void releaseAll() = 0;

      virtual FrameEvent pollFrame() = 0;

      /// Latest gesture label ("Zero".."Five") from the gesture detector, if any.
      virtual std::optional<std::string> latestGesture() const = 0;
    };

  } // namespace io
} // namespace marich
