/* @file Steering.cpp
 * @brief wheel commands for the colour, face and gesture followers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Marich headers
#include "io/HardwareHandle.hpp"
#include "io/Steering.hpp"

using namespace marich::io;

const char* marich::io::toString(Steer s) {
  switch (s) {
  case Steer::Stop:
    return "stop";
  case Steer::Left:
    return "left";
  case Steer::Right:
    return "right";
  case Steer::Forward:
    return "forward";
  default:
    return "unknown";
  }
}

bool Steering::apply(Steer s) {
  if (s == last_)
    return false;
  switch (s) {
  case Steer::Left:
    rotateLeft(hardware_, speed_);
    break;
  case Steer::Right:
    rotateRight(hardware_, speed_);
    break;
  case Steer::Forward:
    moveForward(hardware_, speed_);
    break;
  case Steer::Stop:
  default:
    hardware_.motorStop();
    break;
  }
  last_ = s;
  return true;
}

void Steering::halt() {
  last_ = Steer::Stop;
  hardware_.motorStop();
}
