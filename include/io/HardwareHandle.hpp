#pragma once
/** @file  HardwareHandle.hpp
 *  @brief Imperative façade over wheels, LED bar, buzzer and IR receiver.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string_view>

#include "core/Emotion.hpp"

namespace marich {
  namespace io {

    /// LED bar palette as indexed by the expansion board; `Off` switches the bar off.
    enum class LedColor : std::uint8_t {
      Red = 0,
      Green = 1,
      Blue = 2,
      Yellow = 3,
      Purple = 4,
      Cyan = 5,
      White = 6,
      Off = 0xFF
    };

    const char* toString(LedColor c);

    /// happy→Green, neutral→Blue, angry→Red, shy→Purple, confused→Yellow, scared→Red
    LedColor ledForEmotion(core::Emotion e);

    /// red/green/blue/yellow (any case) → matching colour, anything else → White
    LedColor ledForTrackedColor(std::string_view colorName);

    /**
 * @class HardwareHandle
 * @brief Stateless command surface; no internal state machine.
 *
 *  * Every command throws `core::HardwareError` when the bus transfer fails.
 *  * `readIRRegister()` instead reports failure as `std::nullopt` (polled at 20 Hz).
 *  * Process-lifetime singleton owned by the Application.
 */
    class HardwareHandle {
    public:
      virtual ~HardwareHandle() = default;

      virtual void setIRReceiver(bool enabled) = 0;
      virtual std::optional<std::uint8_t> readIRRegister() = 0;

      virtual void motorStop() = 0;
      /// Signed speeds in [-255, 255]: front-left, front-right, rear-left, rear-right.
      virtual void setWheels(int fl, int fr, int rl, int rr) = 0;

      virtual void setLED(LedColor color) = 0;
      virtual void beep() = 0;
      virtual void setUltrasonic(bool enabled) = 0;
    };

    //---motion helpers (mecanum chassis)----------------------------------
    inline void moveForward(HardwareHandle& hw, int speed) { hw.setWheels(speed, speed, speed, speed); }
    inline void moveBackward(HardwareHandle& hw, int speed) { moveForward(hw, -speed); }
    inline void strafeLeft(HardwareHandle& hw, int speed) { hw.setWheels(-speed, speed, speed, -speed); }
    inline void strafeRight(HardwareHandle& hw, int speed) { strafeLeft(hw, -speed); }
    inline void rotateLeft(HardwareHandle& hw, int speed) { hw.setWheels(-speed, speed, -speed, speed); }
    inline void rotateRight(HardwareHandle& hw, int speed) { rotateLeft(hw, -speed); }
    inline void diagonalLeftFront(HardwareHandle& hw, int speed) { hw.setWheels(0, speed, speed, 0); }
    inline void diagonalRightFront(HardwareHandle& hw, int speed) { hw.setWheels(speed, 0, 0, speed); }
    inline void diagonalLeftBack(HardwareHandle& hw, int speed) { diagonalRightFront(hw, -speed); }
    inline void diagonalRightBack(HardwareHandle& hw, int speed) { diagonalLeftFront(hw, -speed); }

  } // namespace io
} // namespace marich
