#pragma once
/** @file  IrDebouncer.hpp
 *  @brief Drops repeats of the same IR code inside a time window.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>

namespace marich {
  namespace input {

    /**
 * @class IrDebouncer
 * @brief Remote controls repeat a held key every ~100 ms; only the first press of a
 *        run (and then one per window) gets through.
 *
 *  * Only accepted codes refresh the timestamp.
 *  * `bypass` (IR debug mode) accepts everything.
 *  * Owned and called by the router thread only.
 */
    class IrDebouncer {
    public:
      using Clock = std::chrono::steady_clock;

      explicit IrDebouncer(std::chrono::milliseconds window, bool bypass = false)
          : window_(window), bypass_(bypass) {}

      /// @returns true when \p code should be dispatched.
      bool accept(std::uint8_t code, Clock::time_point now) {
        if (!bypass_ && hasLast_ && code == lastCode_ && now - lastTime_ < window_)
          return false;
        lastCode_ = code;
        lastTime_ = now;
        hasLast_ = true;
        return true;
      }

      std::uint8_t lastCode() const { return lastCode_; }

    private:
      std::chrono::milliseconds window_;
      bool bypass_{ false };

      // simple debounce state
      std::uint8_t lastCode_{ 0 };
      Clock::time_point lastTime_{};
      bool hasLast_{ false };
    };

  } // namespace input
} // namespace marich
