/* @file RpsGame.cpp
 * @brief rock-paper-scissors rounds
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// Marich headers
#include "camera/CameraManager.hpp"
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/HardwareHandle.hpp"
#include "services/Routines.hpp"
#include "services/RpsGame.hpp"
#include "services/Voice.hpp"
#include "ui/FacePresenter.hpp"

using namespace marich::services;
using marich::core::Emotion;

namespace {

  constexpr const char* kStartLines[] = {
    "Challenge accepted! Let's play rock paper scissors!",
    "Ready to lose to a machine? Let the battle begin!",
    "I hope you brought your best strategy. First match starts now.",
  };
  constexpr const char* kShootLines[] = {
    "Rock, Paper, Scissors, shoot!",
    "On the count of three... Rock, Paper, Scissors, go!",
    "Ready? Rock, Paper, Scissors, now!",
  };
  constexpr const char* kWinLines[] = {
    "Yes! I win again! Victory is mine!",
    "Beep boop, my programming prevails! Better luck next time, human.",
    "Another flawless victory for the Marich operating system!",
  };
  constexpr const char* kLoseLines[] = {
    "What?! I mean, you won! Ah, frustration!",
    "A temporary setback. I let you win that one, I promise.",
    "Curse this fleshy adversary! You got lucky, I'll admit it.",
  };
  constexpr const char* kDrawLines[] = {
    "A draw! Great minds think alike, but next time I'll crush you!",
    "Stalemate! Let's try to break the deadlock.",
    "We tied! Time for a rematch.",
  };
  constexpr const char* kNextLines[] = {
    "Again! I'll win next time!",
    "One more round, I need to redeem myself.",
    "Your luck won't last. Let's go again.",
  };
  constexpr const char* kEndLines[] = {
    "Thanks for the game! I enjoyed our battle of wits... and hands.",
    "Game over. Come back when you're ready for a rematch!",
    "Exiting game mode. See you next time!",
  };
  constexpr const char* kUnseen = "I couldn't quite see your hand! Let's call that a draw.";

  constexpr std::chrono::milliseconds kGesturePoll{ 50 };

} // namespace

const char* marich::services::toString(RpsMove m) {
  switch (m) {
  case RpsMove::Rock:
    return "Rock";
  case RpsMove::Paper:
    return "Paper";
  case RpsMove::Scissors:
    return "Scissors";
  }
  return "unknown";
}

const char* marich::services::toString(RoundResult r) {
  switch (r) {
  case RoundResult::Draw:
    return "draw";
  case RoundResult::PlayerWins:
    return "player wins";
  case RoundResult::MarichWins:
    return "Marich wins";
  }
  return "unknown";
}

RoundResult marich::services::determineWinner(RpsMove player, RpsMove robot) {
  if (player == robot)
    return RoundResult::Draw;
  const bool playerWins = (player == RpsMove::Paper && robot == RpsMove::Rock) ||
                          (player == RpsMove::Rock && robot == RpsMove::Scissors) ||
                          (player == RpsMove::Scissors && robot == RpsMove::Paper);
  return playerWins ? RoundResult::PlayerWins : RoundResult::MarichWins;
}

std::optional<RpsMove> marich::services::gestureToMove(std::string_view gesture) {
  if (gesture == "Zero" || gesture == "One")
    return RpsMove::Rock;
  if (gesture == "Four" || gesture == "Five")
    return RpsMove::Paper;
  if (gesture == "Two" || gesture == "Three")
    return RpsMove::Scissors;
  return std::nullopt;
}

template <std::size_t N> const char* RpsGame::pick(const char* const (&lines)[N]) {
  return lines[std::uniform_int_distribution<std::size_t>(0, N - 1)(rng_)];
}

RpsGame::RpsGame(ui::FacePresenter& face, const camera::GestureSource& gestures, io::HardwareHandle& hw,
                 std::shared_ptr<Voice> voice, core::RpsSettings settings,
                 std::mt19937::result_type seed)
    : face_(face), gestures_(gestures), hw_(hw), voice_(std::move(voice)),
      settings_(std::move(settings)), rng_(seed) {}

void RpsGame::run(const core::CancelSignal& cancel) {
  auto log = marich::core::logging::get("rps");

  try {
    resetHardware();
  } catch (const core::HardwareError& e) {
    log->warn("[RPS] hardware reset failed: {}", e.what());
  }
  face_.setEmotion(Emotion::Happy);
  say(pick(kStartLines), Emotion::Neutral, cancel);
  cancel.sleepFor(std::chrono::seconds{ 1 });

  while (!cancel.requested()) {
    try {
      playRound(cancel);
    } catch (const core::HardwareError& e) {
      log->warn("[RPS] hardware command failed: {}", e.what());
    }
    if (cancel.requested())
      break;
    say(pick(kNextLines), Emotion::Neutral, cancel);
    cancel.sleepFor(std::chrono::seconds{ 1 });
  }

  // a cancelled signal only logs the farewell; speaking it would outlast the join grace
  say(pick(kEndLines), Emotion::Neutral, cancel);
  face_.clearGameImage();
  try {
    resetHardware();
  } catch (const core::HardwareError& e) {
    log->warn("[RPS] hardware reset failed: {}", e.what());
  }
  log->info("[RPS] Rock Paper Scissors game thread exiting.");
}

RoundResult RpsGame::playRound(const core::CancelSignal& cancel) {
  auto log = marich::core::logging::get("rps");

  const auto mine = static_cast<RpsMove>(std::uniform_int_distribution<int>(0, 2)(rng_));
  log->info("[RPS] Marich chose: {}", toString(mine));

  say(pick(kShootLines), Emotion::Neutral, cancel);
  cancel.sleepFor(std::chrono::milliseconds{ 300 });

  const auto player = capturePlayerMove(cancel);
  if (player) {
    log->info("[RPS] Player detected move: {}", toString(*player));
  } else {
    log->info("[RPS] No clear move detected.");
    face_.setEmotion(Emotion::Confused);
  }

  face_.displayGameImage(imageFor(mine));
  cancel.sleepFor(std::chrono::seconds{ 1 });

  RoundResult result = RoundResult::Draw;
  std::string line = kUnseen;
  Emotion mood = player ? Emotion::Neutral : Emotion::Confused;

  if (player) {
    result = determineWinner(*player, mine);
    log->info("[RPS] Result: {}", toString(result));
    switch (result) {
    case RoundResult::MarichWins:
      line = pick(kWinLines);
      mood = Emotion::Happy;
      face_.setEmotion(mood);
      danceRoutine(hw_, cancel);
      winLedSequence(hw_, cancel, rng_);
      break;
    case RoundResult::PlayerWins:
      line = pick(kLoseLines);
      mood = Emotion::Angry;
      face_.setEmotion(mood);
      angryMovement(hw_, cancel);
      loseLedSequence(hw_, cancel);
      break;
    case RoundResult::Draw:
      line = pick(kDrawLines);
      face_.setEmotion(mood);
      break;
    }
  }

  say(line, mood, cancel);
  cancel.sleepFor(std::chrono::seconds{ 2 });

  face_.clearGameImage();
  resetHardware();
  face_.setEmotion(Emotion::Neutral);
  return result;
}

std::optional<RpsMove> RpsGame::capturePlayerMove(const core::CancelSignal& cancel) {
  auto log = marich::core::logging::get("rps");
  log->info("[RPS] Listening for player's gesture...");

  const auto deadline = std::chrono::steady_clock::now() + settings_.captureWindow;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto g = gestures_.latestGesture())
      if (auto move = gestureToMove(*g))
        return move;
    if (!cancel.sleepFor(kGesturePoll))
      break;
  }
  return std::nullopt;
}

const std::string& RpsGame::imageFor(RpsMove m) const {
  switch (m) {
  case RpsMove::Rock:
    return settings_.rockImage;
  case RpsMove::Paper:
    return settings_.paperImage;
  case RpsMove::Scissors:
    break;
  }
  return settings_.scissorsImage;
}

void RpsGame::say(const std::string& text, Emotion emotion, const core::CancelSignal& cancel) {
  speakAndAnimate(face_, hw_, *voice_, text, emotion, cancel, *marich::core::logging::get("rps"));
}

void RpsGame::resetHardware() {
  hw_.motorStop();
  hw_.setLED(io::LedColor::Off);
}
