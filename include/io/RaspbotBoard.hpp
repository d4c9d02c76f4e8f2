#pragma once
/** @file  RaspbotBoard.hpp
 *  @brief HardwareHandle for the Raspbot expansion board (I²C slave 0x2B).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "io/HardwareHandle.hpp"
#include "io/I2cBus.hpp"

namespace marich {
  namespace io {

    /**
 * @class RaspbotBoard
 * @brief Register map of the board firmware:
 *
 *  | reg  | payload                     | meaning            |
 *  |------|-----------------------------|--------------------|
 *  | 0x01 | motor id, dir, speed        | one wheel          |
 *  | 0x03 | on/off, colour index        | whole LED bar      |
 *  | 0x05 | on/off                      | IR receiver        |
 *  | 0x06 | on/off                      | buzzer             |
 *  | 0x07 | on/off                      | ultrasonic sensor  |
 *  | 0x0C | (read 1 byte)               | last IR code       |
 *
 *  * One mutex serialises bus transfers (IR thread vs. UI thread vs. workers).
 */
    class RaspbotBoard : public HardwareHandle {
    public:
      static constexpr std::uint8_t kDefaultAddress = 0x2B;

      /// Takes an unopened bus; `open()` binds it.
      explicit RaspbotBoard(std::unique_ptr<I2cBus> bus = std::make_unique<I2cBus>());

      /// @returns false when the adapter or slave cannot be reached.
      bool open(const std::string& dev = "/dev/i2c-1", std::uint8_t address = kDefaultAddress);

      void setIRReceiver(bool enabled) override;
      std::optional<std::uint8_t> readIRRegister() override;
      void motorStop() override;
      void setWheels(int fl, int fr, int rl, int rr) override;
      void setLED(LedColor color) override;
      void beep() override;
      void setUltrasonic(bool enabled) override;

    private:
      static constexpr std::uint8_t kRegMotor = 0x01;
      static constexpr std::uint8_t kRegLedAll = 0x03;
      static constexpr std::uint8_t kRegIrSwitch = 0x05;
      static constexpr std::uint8_t kRegBuzzer = 0x06;
      static constexpr std::uint8_t kRegUltrasonic = 0x07;
      static constexpr std::uint8_t kRegIrCode = 0x0C;
      static constexpr std::chrono::milliseconds kBeepLength{ 50 };

      void write(std::uint8_t reg, std::vector<std::uint8_t> data, const char* what);
      void setMotor(std::uint8_t id, int speed);

      std::unique_ptr<I2cBus> bus_;
      std::mutex mtx_;
    };

  } // namespace io
} // namespace marich
