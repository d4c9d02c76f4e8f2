#pragma once
/** @file  Errors.hpp
 *  @brief Exception types raised by hardware, camera, config and service layers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <vector>

namespace marich {
  namespace core {

    /// Camera device cannot be opened (missing node, busy, driver error).
    class CameraUnavailable : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// One or more model / label / font files required by a detector are absent.
    class AssetMissing : public std::runtime_error {
    public:
      AssetMissing(const std::string& what, std::vector<std::string> missing)
          : std::runtime_error(what), missing_(std::move(missing)) {}

      const std::vector<std::string>& missing() const noexcept { return missing_; }

    private:
      std::vector<std::string> missing_;
    };

    /// LED / motor / IR / buzzer command failed on the board bus.
    class HardwareError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Conversational backend could not produce a reply.
    class ConversationUnavailable : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Configuration file unreadable or malformed.
    class ConfigError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

  } // namespace core
} // namespace marich
