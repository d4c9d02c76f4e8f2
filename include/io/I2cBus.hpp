#pragma once
/** @file  I2cBus.hpp
 *  @brief Register-level I/O wrapper for one slave on a Linux /dev/i2c-* adapter.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace marich {
  namespace io {

    /**
 * @class I2cBus
 * @brief RAII wrapper around a single /dev/i2c-* file descriptor bound to one slave.
 *
 *  * Register writes are framed as `[reg, data...]` in one write() (SMBus block style).
 *  * Reads write the register index then read the requested byte count.
 *  * *Non-copyable*, but move-constructible.
 */

    class I2cBus {

    public:
      //---ctr / dtr--------------------------------------------
      I2cBus() = default;
      virtual ~I2cBus(); // close the /dev/i2c fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, std::uint8_t address);
      virtual bool writeRegister(std::uint8_t reg, const std::vector<std::uint8_t>& data);
      virtual std::optional<std::vector<std::uint8_t>> readRegister(std::uint8_t reg,
                                                                    std::size_t count);
      /// Raw write without register prefix (display command / data streams).
      virtual bool writeRaw(const std::vector<std::uint8_t>& bytes);
      bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      I2cBus(const I2cBus&) = delete;
      I2cBus& operator=(const I2cBus&) = delete;

      //---mv and mv assign-------------------------------------
      I2cBus(I2cBus&& other) noexcept;
      I2cBus& operator=(I2cBus&& other) noexcept;

    private:
      bool writeAll(const std::uint8_t* data, std::size_t len);

      int fd_{ -1 }; ///< POSIX fd (-1==closed)
      std::string dev_{};
    };
  } // namespace io
} // namespace marich
