#pragma once
/** @file  Steering.hpp
 *  @brief Edge-triggered wheel commands shared by the tracking analyzers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace marich::io {

  class HardwareHandle;

  enum class Steer { Stop, Left, Right, Forward };

  const char* toString(Steer s);

  /**
 * @class Steering
 * @brief Sends a motor command only when the requested direction differs from the last one.
 */
  class Steering {
  public:
    Steering(HardwareHandle& hardware, int speed) : hardware_(hardware), speed_(speed) {}

    /// @returns true when a command went out.
    bool apply(Steer s);

    /// Unconditional motor stop; the next apply() always sends.
    void halt();

    Steer last() const { return last_; }

  private:
    HardwareHandle& hardware_;
    int speed_;
    Steer last_{ Steer::Stop };
  };

} // namespace marich::io
