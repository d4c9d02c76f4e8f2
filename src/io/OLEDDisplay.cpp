/* @file OLEDDisplay.cpp
 * @brief SSD1306 frame-buffer + I2C transfer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdlib>
#include <vector>

// Marich headers
#include "core/Logger.hpp"
#include "io/OLEDDisplay.hpp"

using namespace marich::io;

namespace {

  constexpr std::uint8_t kControlCommand = 0x00;
  constexpr std::uint8_t kControlData = 0x40;
  constexpr std::size_t kDataChunk = 16; // bytes per data transfer

} // namespace

OLEDDisplay::OLEDDisplay(std::unique_ptr<I2cBus> bus) : bus_(std::move(bus)) {}

OLEDDisplay::~OLEDDisplay() { close(); }

bool OLEDDisplay::init(const std::string& devPath, std::uint8_t address) {
  auto log = marich::core::logging::get("ui");
  if (!bus_ || !bus_->open(devPath, address)) {
    log->warn("[OLED] no panel at {} 0x{:02X}", devPath, address);
    return false;
  }

  // SSD1306 power-up: 128x64, charge pump on, horizontal addressing, 180° mount
  ready_ = command({ 0xAE, 0xD5, 0x80, 0xA8, 0x3F, 0xD3, 0x00, 0x40, 0x8D, 0x14, 0x20, 0x00,
                     0xA1, 0xC8, 0xDA, 0x12, 0x81, 0xCF, 0xD9, 0xF1, 0xDB, 0x40, 0xA4, 0xA6,
                     0xAF });
  if (!ready_) {
    log->warn("[OLED] init sequence rejected by {}", devPath);
    return false;
  }

  clear();
  return flush();
}

void OLEDDisplay::clear() {
  std::fill(std::begin(buffer_), std::end(buffer_), 0);
  dirty_ = true;
}

void OLEDDisplay::setPixel(int x, int y, bool on) {
  if (x < 0 || y < 0 || x >= kWidth || y >= kHeight)
    return;
  auto& byte = buffer_[x + (y / 8) * kWidth];
  const auto bit = static_cast<std::uint8_t>(1u << (y % 8));
  byte = on ? static_cast<std::uint8_t>(byte | bit) : static_cast<std::uint8_t>(byte & ~bit);
  dirty_ = true;
}

bool OLEDDisplay::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= kWidth || y >= kHeight)
    return false;
  return (buffer_[x + (y / 8) * kWidth] >> (y % 8)) & 1u;
}

void OLEDDisplay::fillRect(int x, int y, int w, int h, bool on) {
  for (int yy = std::max(0, y); yy < std::min(kHeight, y + h); ++yy)
    for (int xx = std::max(0, x); xx < std::min(kWidth, x + w); ++xx)
      setPixel(xx, yy, on);
}

void OLEDDisplay::fillEllipse(int cx, int cy, int rx, int ry, bool on) {
  if (rx <= 0 || ry <= 0)
    return;
  const long rx2 = static_cast<long>(rx) * rx;
  const long ry2 = static_cast<long>(ry) * ry;
  for (int dy = -ry; dy <= ry; ++dy)
    for (int dx = -rx; dx <= rx; ++dx)
      if (dx * dx * ry2 + dy * dy * rx2 <= rx2 * ry2)
        setPixel(cx + dx, cy + dy, on);
}

void OLEDDisplay::drawLine(int x0, int y0, int x1, int y1, bool on) {
  // Bresenham
  const int dx = std::abs(x1 - x0);
  const int dy = -std::abs(y1 - y0);
  const int sx = x0 < x1 ? 1 : -1;
  const int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  for (;;) {
    setPixel(x0, y0, on);
    if (x0 == x1 && y0 == y1)
      break;
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

bool OLEDDisplay::flush() {
  if (!ready_)
    return false;
  if (!dirty_)
    return true;

  // full-screen window: columns 0..127, pages 0..7
  if (!command({ 0x21, 0x00, kWidth - 1, 0x22, 0x00, kHeight / 8 - 1 }))
    return false;

  std::vector<std::uint8_t> chunk;
  chunk.reserve(kDataChunk + 1);
  for (std::size_t off = 0; off < sizeof(buffer_); off += kDataChunk) {
    chunk.assign(1, kControlData);
    chunk.insert(chunk.end(), buffer_ + off, buffer_ + off + kDataChunk);
    if (!bus_->writeRaw(chunk)) {
      marich::core::logging::get("ui")->warn("[OLED] frame transfer failed at byte {}", off);
      return false;
    }
  }
  dirty_ = false;
  return true;
}

bool OLEDDisplay::setPower(bool on) {
  if (!ready_)
    return false;
  return command({ static_cast<std::uint8_t>(on ? 0xAF : 0xAE) });
}

void OLEDDisplay::close() {
  if (ready_)
    command({ 0xAE });
  ready_ = false;
  if (bus_)
    bus_->close();
}

bool OLEDDisplay::command(std::initializer_list<std::uint8_t> bytes) {
  std::vector<std::uint8_t> frame;
  frame.reserve(bytes.size() + 1);
  frame.push_back(kControlCommand);
  frame.insert(frame.end(), bytes.begin(), bytes.end());
  return bus_->writeRaw(frame);
}
