#pragma once
/** @file  Routines.hpp
 *  @brief Canned motion + LED sequences shared by the chatbot, game and presentation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <random>

namespace marich {
  namespace core {
    class CancelSignal;
  } // namespace core
  namespace io {
    class HardwareHandle;
  } // namespace io

  namespace services {

    /* Every routine runs on the caller's thread, sleeps through the cancel signal
     * and always leaves the motors stopped. @returns false if cancelled part-way. */

    /// Purple/cyan/yellow/green light show with rotations and strafes (speed 80).
    bool danceRoutine(io::HardwareHandle& hw, const core::CancelSignal& cancel);

    /// Square: forward, right, back, left at speed 100 with a one second stop between legs.
    bool carPatrol(io::HardwareHandle& hw, const core::CancelSignal& cancel);

    /// Short jerky wiggle (speed 120, 200 ms per move).
    bool angryMovement(io::HardwareHandle& hw, const core::CancelSignal& cancel);

    /// Random non-red colour every 100 ms for \p duration, then LEDs off.
    bool winLedSequence(io::HardwareHandle& hw, const core::CancelSignal& cancel, std::mt19937& rng,
                        std::chrono::milliseconds duration = std::chrono::milliseconds{ 1500 });

    /// Solid red for \p duration, then LEDs off.
    bool loseLedSequence(io::HardwareHandle& hw, const core::CancelSignal& cancel,
                         std::chrono::milliseconds duration = std::chrono::milliseconds{ 1500 });

  } // namespace services
} // namespace marich
