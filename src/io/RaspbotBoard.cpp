/* @file RaspbotBoard.cpp
 * @brief Raspbot expansion board commands over i2c-dev
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

// Marich headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/RaspbotBoard.hpp"

using namespace marich::io;
using marich::core::Emotion;
using marich::core::HardwareError;

const char* marich::io::toString(LedColor c) {
  switch (c) {
  case LedColor::Red:
    return "red";
  case LedColor::Green:
    return "green";
  case LedColor::Blue:
    return "blue";
  case LedColor::Yellow:
    return "yellow";
  case LedColor::Purple:
    return "purple";
  case LedColor::Cyan:
    return "cyan";
  case LedColor::White:
    return "white";
  case LedColor::Off:
    return "off";
  default:
    return "unknown";
  }
}

LedColor marich::io::ledForEmotion(Emotion e) {
  switch (e) {
  case Emotion::Happy:
    return LedColor::Green;
  case Emotion::Angry:
  case Emotion::Scared:
    return LedColor::Red;
  case Emotion::Shy:
    return LedColor::Purple;
  case Emotion::Confused:
    return LedColor::Yellow;
  case Emotion::Neutral:
  default:
    return LedColor::Blue;
  }
}

LedColor marich::io::ledForTrackedColor(std::string_view colorName) {
  std::string lower(colorName);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lower == "red")
    return LedColor::Red;
  if (lower == "green")
    return LedColor::Green;
  if (lower == "blue")
    return LedColor::Blue;
  if (lower == "yellow")
    return LedColor::Yellow;
  return LedColor::White;
}

RaspbotBoard::RaspbotBoard(std::unique_ptr<I2cBus> bus) : bus_(std::move(bus)) {
  if (!bus_)
    throw std::invalid_argument("[RaspbotBoard] bus is nullptr");
}

bool RaspbotBoard::open(const std::string& dev, std::uint8_t address) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!bus_->open(dev, address)) {
    marich::core::logging::get("hardware")
        ->error("[RaspbotBoard] board not reachable on {} @0x{:02X}", dev, address);
    return false;
  }
  marich::core::logging::get("hardware")->info("[RaspbotBoard] opened {} @0x{:02X}", dev, address);
  return true;
}

void RaspbotBoard::setIRReceiver(bool enabled) {
  write(kRegIrSwitch, { static_cast<std::uint8_t>(enabled ? 1 : 0) }, "IR switch");
}

std::optional<std::uint8_t> RaspbotBoard::readIRRegister() {
  std::lock_guard<std::mutex> lock(mtx_);
  auto bytes = bus_->readRegister(kRegIrCode, 1);
  if (!bytes || bytes->empty())
    return std::nullopt;
  return bytes->front();
}

void RaspbotBoard::motorStop() {
  for (std::uint8_t id = 0; id < 4; ++id)
    setMotor(id, 0);
}

void RaspbotBoard::setWheels(int fl, int fr, int rl, int rr) {
  setMotor(0, fl);
  setMotor(1, rl);
  setMotor(2, fr);
  setMotor(3, rr);
}

void RaspbotBoard::setLED(LedColor color) {
  if (color == LedColor::Off)
    write(kRegLedAll, { 0, 0 }, "LED off");
  else
    write(kRegLedAll, { 1, static_cast<std::uint8_t>(color) }, "LED colour");
}

void RaspbotBoard::beep() {
  write(kRegBuzzer, { 1 }, "buzzer on");
  std::this_thread::sleep_for(kBeepLength);
  write(kRegBuzzer, { 0 }, "buzzer off");
}

void RaspbotBoard::setUltrasonic(bool enabled) {
  write(kRegUltrasonic, { static_cast<std::uint8_t>(enabled ? 1 : 0) }, "ultrasonic switch");
}

void RaspbotBoard::write(std::uint8_t reg, std::vector<std::uint8_t> data, const char* what) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!bus_->writeRegister(reg, data))
    throw HardwareError(std::string("[RaspbotBoard] ") + what + " command failed");
}

void RaspbotBoard::setMotor(std::uint8_t id, int speed) {
  // firmware: dir 0 = forward, 1 = reverse; magnitude clamped to one byte
  const auto dir = static_cast<std::uint8_t>(speed < 0 ? 1 : 0);
  const auto mag = static_cast<std::uint8_t>(std::min(std::abs(speed), 255));
  write(kRegMotor, { id, dir, mag }, "motor");
}
