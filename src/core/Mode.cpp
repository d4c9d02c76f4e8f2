/* @file Mode.cpp
 * @brief mode naming helpers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>

// Marich headers
#include "core/Mode.hpp"

using namespace marich::core;

const char* marich::core::toString(ModeKind k) {
  switch (k) {
  case ModeKind::Idle:
    return "idle";
  case ModeKind::Color:
    return "color";
  case ModeKind::Face:
    return "face";
  case ModeKind::Gesture:
    return "gesture";
  case ModeKind::Object:
    return "object";
  case ModeKind::Plate:
    return "plate";
  case ModeKind::Rps:
    return "rps";
  case ModeKind::Presentation:
    return "presentation";
  default:
    return "unknown";
  }
}

bool marich::core::isCameraMode(ModeKind k) {
  return k == ModeKind::Color || k == ModeKind::Face || k == ModeKind::Gesture ||
         k == ModeKind::Object || k == ModeKind::Plate;
}

bool marich::core::isWorkerMode(ModeKind k) {
  return k == ModeKind::Rps || k == ModeKind::Presentation;
}

Mode Mode::colorTracking(const std::string& colorName) {
  Mode m{ ModeKind::Color, colorName, true };
  std::transform(m.color.begin(), m.color.end(), m.color.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return m;
}

std::string marich::core::describe(const Mode& m) {
  std::string out = toString(m.kind);
  if (m.kind == ModeKind::Color)
    out += "(" + m.color + ")";
  else if (m.kind == ModeKind::Gesture && !m.actionsEnabled)
    out += "(no actions)";
  return out;
}

std::string marich::core::effectiveModeName(const CoordinatorState& s) {
  return s.aiEnabled ? std::string("AIChat") : describe(s.active);
}
