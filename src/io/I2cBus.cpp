/* @file I2cBus.cpp
 * @brief IO abstraction layer that wraps /dev/i2c-N - handles file descriptor, slave select, register io and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstring> // for strerror

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <linux/i2c-dev.h> // I2C_SLAVE
#include <sys/ioctl.h>
#include <unistd.h> // write(), read(), close()

// Marich headers
#include "core/Logger.hpp"
#include "io/I2cBus.hpp"

using namespace marich::io;

I2cBus::~I2cBus() { close(); }

I2cBus::I2cBus(I2cBus&& other) noexcept : fd_(other.fd_), dev_(std::move(other.dev_)) {
  other.fd_ = -1;
}

I2cBus& I2cBus::operator=(I2cBus&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    dev_ = std::move(other.dev_);
    other.fd_ = -1;
  }
  return *this;
}

bool I2cBus::open(const std::string& dev, std::uint8_t address) {
  auto log = marich::core::logging::get("hardware");
  close();

  fd_ = ::open(dev.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    log->error("Error {} from open {}: {}", errno, dev, strerror(errno));
    return false;
  }

  // bind every following read()/write() to the slave address
  if (::ioctl(fd_, I2C_SLAVE, static_cast<long>(address)) < 0) {
    log->error("Error {} from ioctl(I2C_SLAVE, 0x{:02X}): {}", errno, address, strerror(errno));
    close();
    return false;
  }

  dev_ = dev;
  return true;
}

bool I2cBus::writeRegister(std::uint8_t reg, const std::vector<std::uint8_t>& data) {
  if (fd_ < 0)
    return false;

  std::vector<std::uint8_t> frame;
  frame.reserve(data.size() + 1);
  frame.push_back(reg);
  frame.insert(frame.end(), data.begin(), data.end());
  return writeAll(frame.data(), frame.size());
}

bool I2cBus::writeRaw(const std::vector<std::uint8_t>& bytes) {
  if (fd_ < 0)
    return false;
  return writeAll(bytes.data(), bytes.size());
}

std::optional<std::vector<std::uint8_t>> I2cBus::readRegister(std::uint8_t reg,
                                                              std::size_t count) {
  if (fd_ < 0)
    return std::nullopt;

  if (!writeAll(&reg, 1))
    return std::nullopt;

  std::vector<std::uint8_t> out(count);
  std::size_t total = 0;
  while (total < count) {
    ssize_t n = ::read(fd_, out.data() + total, count - total);
    if (n > 0) {
      total += static_cast<std::size_t>(n);
    } else if (n == -1 && errno == EINTR) {
      continue; // interrupted → retry
    } else {
      marich::core::logging::get("hardware")
          ->debug("read {} reg 0x{:02X}: {}", dev_, reg, n == 0 ? "short read" : strerror(errno));
      return std::nullopt;
    }
  }
  return out;
}

void I2cBus::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

bool I2cBus::writeAll(const std::uint8_t* data, std::size_t len) {
  // Good Pattern for POSIX write loop (i2c-dev transfers are all-or-nothing, EINTR aside)
  std::size_t total = 0;
  while (total < len) {
    ssize_t written = ::write(fd_, data + total, len - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else {
      marich::core::logging::get("hardware")
          ->debug("write {}: {}", dev_, written == 0 ? "no progress" : strerror(errno));
      return false;
    }
  }
  return true;
}
