#pragma once
/** @file  IrCommandMap.hpp
 *  @brief IR byte code → robot command lookup table.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "core/RobotConfig.hpp"

namespace marich::input {

  enum class IrCommand : std::uint8_t {
    ColorRed,
    ColorBlue,
    ColorGreen,
    ColorYellow,
    Face,
    Gesture,
    Object,
    Plate,
    Rps,
    Presentation,
    AiToggle,
    StopAll,
    Exit,
    Count
  };
  static_assert(static_cast<std::uint8_t>(IrCommand::Count) == 13,
                "IrCommand count changed please update code that depends on it");

  /// Label used in the help table ("Red Color Mode", "AI Toggle", …).
  const char* toString(IrCommand c);

  class IrCommandMap {
  public:
    explicit IrCommandMap(const core::IrCodes& codes = {});

    std::optional<IrCommand> lookup(std::uint8_t code) const;
    std::uint8_t codeFor(IrCommand c) const { return codes_[static_cast<std::size_t>(c)]; }

    /// The "=== IR COMMAND MAP ===" table printed at start-up and after every stop.
    std::string helpText() const;

  private:
    std::array<std::uint8_t, static_cast<std::size_t>(IrCommand::Count)> codes_{};
  };

} // namespace marich::input
