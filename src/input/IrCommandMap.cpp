/* @file IrCommandMap.cpp
 * @brief IR command table + help rendering
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <spdlog/fmt/fmt.h>

#include "input/IrCommandMap.hpp"

using namespace marich::input;

const char* marich::input::toString(IrCommand c) {
  switch (c) {
  case IrCommand::ColorRed:
    return "Red Color Mode";
  case IrCommand::ColorBlue:
    return "Blue Color Mode";
  case IrCommand::ColorGreen:
    return "Green Color Mode";
  case IrCommand::ColorYellow:
    return "Yellow Color Mode";
  case IrCommand::Face:
    return "Face Tracking Mode";
  case IrCommand::Gesture:
    return "Gesture Mode";
  case IrCommand::Object:
    return "Object Recognition";
  case IrCommand::Plate:
    return "License Plate Mode";
  case IrCommand::Rps:
    return "RPS Game Mode";
  case IrCommand::Presentation:
    return "Presentation Mode";
  case IrCommand::AiToggle:
    return "AI Toggle";
  case IrCommand::StopAll:
    return "Stop All";
  case IrCommand::Exit:
    return "Exit App";
  default:
    return "Unknown";
  }
}

IrCommandMap::IrCommandMap(const marich::core::IrCodes& k)
    : codes_{ k.red,  k.blue, k.green, k.yellow,       k.face,     k.gesture, k.object,
              k.plate, k.rps, k.presentation, k.aiToggle, k.stopAll, k.exit } {}

std::optional<IrCommand> IrCommandMap::lookup(std::uint8_t code) const {
  for (std::size_t i = 0; i < codes_.size(); ++i)
    if (codes_[i] == code)
      return static_cast<IrCommand>(i);
  return std::nullopt;
}

std::string IrCommandMap::helpText() const {
  std::string out = "\n=== IR COMMAND MAP ===\n";
  for (std::size_t i = 0; i < codes_.size(); ++i)
    out += fmt::format("{:<20}: 0x{:02X}\n", toString(static_cast<IrCommand>(i)), codes_[i]);
  out += "======================\n";
  return out;
}
