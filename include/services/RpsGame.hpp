#pragma once
/** @file  RpsGame.hpp
 *  @brief Rock-Paper-Scissors against the camera's hand-gesture detector.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "core/Emotion.hpp"
#include "core/RobotConfig.hpp"
#include "services/Service.hpp"

namespace marich {
  namespace camera {
    class GestureSource;
  } // namespace camera
  namespace io {
    class HardwareHandle;
  } // namespace io
  namespace ui {
    class FacePresenter;
  } // namespace ui

  namespace services {

    class Voice;

    enum class RpsMove { Rock, Paper, Scissors };
    enum class RoundResult { Draw, PlayerWins, MarichWins };

    const char* toString(RpsMove m);
    const char* toString(RoundResult r);

    /// Paper beats rock, rock beats scissors, scissors beats paper.
    RoundResult determineWinner(RpsMove player, RpsMove robot);

    /// Finger-count gesture → move: Zero/One rock, Four/Five paper, Two/Three scissors.
    std::optional<RpsMove> gestureToMove(std::string_view gesture);

    /**
 * @class RpsGame
 * @brief Plays rounds until cancelled, then says goodbye and cleans up.
 *
 *  Round: pick a move, shout "shoot", read the player's gesture for the capture
 *  window, reveal the move image, react (dance + party lights on a win, angry
 *  wiggle + red on a loss), comment, and invite the next round.
 */
    class RpsGame : public Service {
    public:
      RpsGame(ui::FacePresenter& face, const camera::GestureSource& gestures, io::HardwareHandle& hw,
              std::shared_ptr<Voice> voice, core::RpsSettings settings,
              std::mt19937::result_type seed = std::random_device{}());

      void run(const core::CancelSignal& cancel) override;

      /// Plays one round. @returns the result (`Draw` also when no hand was seen).
      RoundResult playRound(const core::CancelSignal& cancel);

    private:
      std::optional<RpsMove> capturePlayerMove(const core::CancelSignal& cancel);
      const std::string& imageFor(RpsMove m) const;
      void say(const std::string& text, core::Emotion emotion, const core::CancelSignal& cancel);
      void resetHardware();
      template <std::size_t N> const char* pick(const char* const (&lines)[N]);

      ui::FacePresenter& face_;
      const camera::GestureSource& gestures_;
      io::HardwareHandle& hw_;
      std::shared_ptr<Voice> voice_;
      core::RpsSettings settings_;
      std::mt19937 rng_;
    };

  } // namespace services
} // namespace marich
