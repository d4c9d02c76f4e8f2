#pragma once
/** @file  OLEDDisplay.hpp
 *  @brief SSD1306 128×64 monochrome OLED on an I²C bus.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

#include "io/I2cBus.hpp"

namespace marich {
  namespace io {

    /**
 * @class OLEDDisplay
 * @brief Convenience API for primitive drawing; hides the SSD1306 command set.
 *
 *  * Keeps an off-screen frame-buffer (page-major, 8 rows per byte); `flush()` pushes
 *    it only when something changed.
 *  * Drawing is clipped to the panel; it never touches the bus.
 */
    class OLEDDisplay {
    public:
      static constexpr int kWidth = 128;
      static constexpr int kHeight = 64;
      static constexpr std::uint8_t kDefaultAddress = 0x3C;

      explicit OLEDDisplay(std::unique_ptr<I2cBus> bus = std::make_unique<I2cBus>());
      ~OLEDDisplay(); ///< panel off, bus closed

      //---public API---------------------------------------------------------
      /// Open the bus and run the SSD1306 power-up sequence. @returns false on bus failure.
      bool init(const std::string& devPath = "/dev/i2c-1", std::uint8_t address = kDefaultAddress);

      /* Drawing helpers ------------------------------------------------------ */
      void clear();
      void setPixel(int x, int y, bool on = true);
      bool pixel(int x, int y) const;
      void fillRect(int x, int y, int w, int h, bool on = true);
      void fillEllipse(int cx, int cy, int rx, int ry, bool on = true);
      void drawLine(int x0, int y0, int x1, int y1, bool on = true);

      bool flush();               ///< push buffer to panel if dirty
      bool setPower(bool on);     ///< display on / sleep
      bool ready() const { return ready_; }
      void close();

      /* non-copyable ------------------------------------------------------- */
      OLEDDisplay(const OLEDDisplay&) = delete;
      OLEDDisplay& operator=(const OLEDDisplay&) = delete;

    private:
      bool command(std::initializer_list<std::uint8_t> bytes);

      std::unique_ptr<I2cBus> bus_;
      bool ready_{ false };
      bool dirty_{ false };
      std::uint8_t buffer_[kWidth * kHeight / 8]{}; ///< 128×64 / 8 bits per byte
    };

  } // namespace io
} // namespace marich
