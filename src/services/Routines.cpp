/* @file Routines.cpp
 * @brief motion / LED choreography
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <functional>
#include <initializer_list>

// Marich headers
#include "core/CancelSignal.hpp"
#include "io/HardwareHandle.hpp"
#include "services/Routines.hpp"

using namespace marich::services;
using marich::io::HardwareHandle;
using marich::io::LedColor;

namespace {

  using Move = std::function<void(HardwareHandle&)>;

  struct Leg {
    Move move;
    std::chrono::milliseconds hold;
  };

  bool runLegs(HardwareHandle& hw, const marich::core::CancelSignal& cancel,
               std::initializer_list<Leg> legs) {
    for (const auto& leg : legs) {
      if (cancel.requested())
        break;
      leg.move(hw);
      if (!cancel.sleepFor(leg.hold))
        break;
    }
    hw.motorStop();
    return !cancel.requested();
  }

  Move led(LedColor c, void (*motion)(HardwareHandle&, int), int speed) {
    return [c, motion, speed](HardwareHandle& hw) {
      hw.setLED(c);
      motion(hw, speed);
    };
  }

  Move go(void (*motion)(HardwareHandle&, int), int speed) {
    return [motion, speed](HardwareHandle& hw) { motion(hw, speed); };
  }

  Move halt() {
    return [](HardwareHandle& hw) { hw.motorStop(); };
  }

} // namespace

bool marich::services::danceRoutine(HardwareHandle& hw, const core::CancelSignal& cancel) {
  constexpr int kSpeed = 80;
  constexpr std::chrono::milliseconds kStep{ 400 };

  const bool done = runLegs(hw, cancel,
                            { { led(LedColor::Purple, io::rotateLeft, kSpeed), kStep },
                              { led(LedColor::Cyan, io::rotateRight, kSpeed), kStep },
                              { led(LedColor::Yellow, io::strafeRight, kSpeed), kStep },
                              { led(LedColor::Green, io::strafeLeft, kSpeed), kStep },
                              { go(io::rotateRight, kSpeed), kStep },
                              { go(io::rotateLeft, kSpeed), kStep } });
  hw.setLED(io::ledForEmotion(core::Emotion::Neutral));
  return done;
}

bool marich::services::carPatrol(HardwareHandle& hw, const core::CancelSignal& cancel) {
  constexpr int kSpeed = 100;
  constexpr std::chrono::milliseconds kLeg{ 1000 };
  constexpr std::chrono::milliseconds kSide{ 1200 };
  constexpr std::chrono::milliseconds kPause{ 1000 };

  return runLegs(hw, cancel,
                 { { go(io::moveForward, kSpeed), kLeg },
                   { halt(), kPause },
                   { go(io::strafeRight, kSpeed), kSide },
                   { halt(), kPause },
                   { go(io::moveBackward, kSpeed), kLeg },
                   { halt(), kPause },
                   { go(io::strafeLeft, kSpeed), kSide },
                   { halt(), kPause } });
}

bool marich::services::angryMovement(HardwareHandle& hw, const core::CancelSignal& cancel) {
  constexpr int kSpeed = 120;
  constexpr std::chrono::milliseconds kStep{ 200 };

  return runLegs(hw, cancel,
                 { { go(io::moveForward, kSpeed), kStep },
                   { go(io::rotateRight, kSpeed), kStep },
                   { go(io::moveBackward, kSpeed), kStep },
                   { go(io::rotateLeft, kSpeed), kStep } });
}

bool marich::services::winLedSequence(HardwareHandle& hw, const core::CancelSignal& cancel,
                                      std::mt19937& rng, std::chrono::milliseconds duration) {
  static constexpr std::array<LedColor, 6> kParty{ LedColor::Green,  LedColor::Blue, LedColor::Yellow,
                                                   LedColor::Purple, LedColor::Cyan, LedColor::White };
  std::uniform_int_distribution<std::size_t> pick(0, kParty.size() - 1);

  const auto end = std::chrono::steady_clock::now() + duration;
  bool done = true;
  while (std::chrono::steady_clock::now() < end) {
    hw.setLED(kParty[pick(rng)]);
    if (!cancel.sleepFor(std::chrono::milliseconds{ 100 })) {
      done = false;
      break;
    }
  }
  hw.setLED(LedColor::Off);
  return done;
}

bool marich::services::loseLedSequence(HardwareHandle& hw, const core::CancelSignal& cancel,
                                       std::chrono::milliseconds duration) {
  hw.setLED(LedColor::Red);
  const bool done = cancel.sleepFor(duration);
  hw.setLED(LedColor::Off);
  return done;
}
