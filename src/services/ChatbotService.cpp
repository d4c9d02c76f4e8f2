/* @file ChatbotService.cpp
 * @brief listen → command / chat → speak loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/HardwareHandle.hpp"
#include "services/ChatbotService.hpp"
#include "services/Conversation.hpp"
#include "services/Routines.hpp"
#include "services/Voice.hpp"
#include "ui/FacePresenter.hpp"

using namespace marich::services;
using marich::core::Emotion;
using marich::io::HardwareHandle;

namespace {

  struct MovePhrase {
    const char* phrase;
    void (*motion)(HardwareHandle&, int);
  };

  // longer phrases first so "move back left" is not taken for "move back"
  constexpr std::array<MovePhrase, 11> kMovePhrases{ {
      { "move front left", marich::io::diagonalLeftFront },
      { "move front right", marich::io::diagonalRightFront },
      { "move back left", marich::io::diagonalLeftBack },
      { "move back right", marich::io::diagonalRightBack },
      { "move backward", marich::io::moveBackward },
      { "move back", marich::io::moveBackward },
      { "move forward", marich::io::moveForward },
      { "move right", marich::io::strafeRight },
      { "move left", marich::io::strafeLeft },
      { "turn right", marich::io::rotateRight },
      { "turn left", marich::io::rotateLeft },
  } };

  constexpr std::array<const char*, 5> kFarewells{ "goodbye", "bye", "by", "exit", "quit" };

  constexpr const char* kHelpText =
      "You can ask me to go forward, back, left, or right. You can also say turn left or turn right.";

  bool contains(const std::string& s, const char* word) { return s.find(word) != std::string::npos; }

} // namespace

ParsedUtterance marich::services::parseUtterance(const std::string& utterance) {
  std::string cmd = utterance;
  std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (contains(cmd, "dance") || contains(cmd, "party"))
    return { ChatIntent::Dance, {} };
  if (contains(cmd, "move square") || contains(cmd, "car patrol"))
    return { ChatIntent::Patrol, {} };
  if (contains(cmd, "stop"))
    return { ChatIntent::Stop, {} };
  if (contains(cmd, "help") || contains(cmd, "options"))
    return { ChatIntent::Help, {} };
  for (const auto& m : kMovePhrases)
    if (contains(cmd, m.phrase))
      return { ChatIntent::Move, m.phrase };
  if (std::find_if(kFarewells.begin(), kFarewells.end(), [&](const char* w) { return cmd == w; }) !=
      kFarewells.end())
    return { ChatIntent::Goodbye, {} };
  return { ChatIntent::Chat, {} };
}

ChatbotService::ChatbotService(ui::FacePresenter& face, io::HardwareHandle& hw,
                               std::shared_ptr<Voice> voice, std::shared_ptr<SpeechInput> speech,
                               std::shared_ptr<ConversationBackend> backend, bool suppressGreeting)
    : face_(face), hw_(hw), voice_(std::move(voice)), speech_(std::move(speech)),
      backend_(std::move(backend)), suppressGreeting_(suppressGreeting) {}

void ChatbotService::run(const core::CancelSignal& cancel) {
  auto log = marich::core::logging::get("chatbot");
  setUltrasonic(true);

  if (cancel.sleepFor(std::chrono::seconds{ 1 })) {
    if (!suppressGreeting_)
      say("Hello! My name is Marich.", Emotion::Happy, cancel);
    else
      log->info("[AI] Greeting suppressed (reactivation).");
  }

  while (!cancel.requested()) {
    const auto mood = face_.currentEmotion();
    if (mood != Emotion::Shy && mood != Emotion::Scared)
      face_.setEmotion(Emotion::Neutral);

    log->info("[AI] Listening...");
    std::optional<std::string> heard;
    try {
      heard = speech_->listen(cancel);
    } catch (const core::ConversationUnavailable& e) {
      log->error("[AI] speech recognition unavailable: {}", e.what());
      break;
    }
    if (!heard)
      break; // cancelled
    if (heard->empty())
      continue;

    log->info("You: {}", *heard);
    try {
      if (!handle(*heard, cancel))
        break;
    } catch (const core::HardwareError& e) {
      log->warn("[AI] hardware command failed: {}", e.what());
    }
  }

  setUltrasonic(false);
  log->info("[AI] Chatbot thread exiting.");
}

bool ChatbotService::handle(const std::string& text, const core::CancelSignal& cancel) {
  const auto parsed = parseUtterance(text);

  switch (parsed.intent) {
  case ChatIntent::Dance:
    say("Okay, time to party!", Emotion::Happy, cancel);
    danceRoutine(hw_, cancel);
    return true;

  case ChatIntent::Patrol:
    say("moving in a square", Emotion::Happy, cancel);
    carPatrol(hw_, cancel);
    return true;

  case ChatIntent::Stop:
    stopCar();
    say("Stopping.", Emotion::Neutral, cancel);
    return true;

  case ChatIntent::Help:
    say(kHelpText, Emotion::Neutral, cancel);
    return true;

  case ChatIntent::Move: {
    const auto it = std::find_if(kMovePhrases.begin(), kMovePhrases.end(),
                                 [&](const MovePhrase& m) { return parsed.movement == m.phrase; });
    hw_.setLED(io::LedColor::Yellow);
    it->motion(hw_, kMoveSpeed);
    say("Okay, " + parsed.movement + ".", Emotion::Neutral, cancel);
    cancel.sleepFor(std::chrono::milliseconds{ 500 });
    stopCar();
    return true;
  }

  case ChatIntent::Goodbye:
    stopCar();
    say("Goodbye!", Emotion::Happy, cancel);
    cancel.sleepFor(std::chrono::seconds{ 2 });
    return false;

  case ChatIntent::Chat:
    break;
  }

  auto log = marich::core::logging::get("chatbot");
  log->info("Marich is thinking...");
  Reply reply;
  try {
    reply = backend_->reply(text, cancel);
  } catch (const core::ConversationUnavailable& e) {
    log->warn("[AI] chat model unavailable: {}", e.what());
    reply = Reply{ "Chat model not installed.", Emotion::Angry };
  }
  if (!cancel.requested())
    say(reply.text, reply.emotion, cancel);
  return true;
}

void ChatbotService::say(const std::string& text, Emotion emotion, const core::CancelSignal& cancel) {
  speakAndAnimate(face_, hw_, *voice_, text, emotion, cancel, *marich::core::logging::get("chatbot"));
}

void ChatbotService::stopCar() {
  hw_.motorStop();
  hw_.setLED(io::ledForEmotion(Emotion::Neutral));
}

void ChatbotService::setUltrasonic(bool on) {
  try {
    hw_.setUltrasonic(on);
  } catch (const core::HardwareError& e) {
    marich::core::logging::get("chatbot")->warn("[AI] ultrasonic {} failed: {}", on ? "on" : "off",
                                                e.what());
  }
}
