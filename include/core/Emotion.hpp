#pragma once
/** @file  Emotion.hpp
 *  @brief Face emotions shared by the presentation layer, LEDs and services.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace marich::core {

  enum class Emotion : std::uint8_t { Neutral, Happy, Angry, Shy, Confused, Scared, Count };
  static_assert(static_cast<std::uint8_t>(Emotion::Count) == 6,
                "Emotion count changed please update code that depends on it");

  inline const char* toString(Emotion e) {
    switch (e) {
    case Emotion::Neutral:
      return "neutral";
    case Emotion::Happy:
      return "happy";
    case Emotion::Angry:
      return "angry";
    case Emotion::Shy:
      return "shy";
    case Emotion::Confused:
      return "confused";
    case Emotion::Scared:
      return "scared";
    default:
      return "unknown";
    }
  }

  /// Case-sensitive lookup of the lower-case names above.
  inline std::optional<Emotion> emotionFromString(std::string_view s) {
    for (auto i = 0; i < static_cast<int>(Emotion::Count); ++i) {
      auto e = static_cast<Emotion>(i);
      if (s == toString(e))
        return e;
    }
    return std::nullopt;
  }

} // namespace marich::core
