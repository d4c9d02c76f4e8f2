#pragma once
/** @file  Mode.hpp
 *  @brief Operating modes of the robot and the coordinator's owned state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

namespace marich::core {

  /// AI chat is not a ModeKind; it is the orthogonal `aiEnabled` flag.
  enum class ModeKind : std::uint8_t { Idle, Color, Face, Gesture, Object, Plate, Rps, Presentation, Count };
  static_assert(static_cast<std::uint8_t>(ModeKind::Count) == 8,
                "ModeKind count changed please update code that depends on it");

  const char* toString(ModeKind k);

  /// Color, Face, Gesture, Object, Plate
  bool isCameraMode(ModeKind k);

  /// Rps, Presentation (each backed by a Worker)
  bool isWorkerMode(ModeKind k);

  struct Mode {
    ModeKind kind{ ModeKind::Idle };
    std::string color{};        ///< lower-case colour name, Color only
    bool actionsEnabled{ true }; ///< Gesture only

    static Mode idle() { return {}; }
    static Mode of(ModeKind k) { return Mode{ k, {}, true }; }
    static Mode colorTracking(const std::string& colorName);

    bool operator==(const Mode&) const = default;
  };

  /// "color(red)", "gesture", "rps" …
  std::string describe(const Mode& m);

  /**
 * @struct CoordinatorState
 * @brief Everything "what is the robot doing right now" consists of.
 *
 * Owned by ModeCoordinator, mutated only under its mutex.
 */
  struct CoordinatorState {
    Mode active{};
    bool aiEnabled{ false };
    bool hasGreetedBefore{ false };  ///< chatbot greets on its first AI session only
    bool animationsStarted{ false }; ///< monotone once set
  };

  /// "AIChat" while AI is on, otherwise describe(active).
  std::string effectiveModeName(const CoordinatorState& s);

} // namespace marich::core
