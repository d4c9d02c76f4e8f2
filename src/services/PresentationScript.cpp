/* @file PresentationScript.cpp
 * @brief presentation script parsing and playback
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <fstream>
#include <string_view>
#include <utility>

// nlohmann headers
#include <nlohmann/json.hpp>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "services/PresentationScript.hpp"
#include "services/Routines.hpp"
#include "services/Voice.hpp"
#include "ui/FacePresenter.hpp"

using namespace marich::services;
using marich::core::ConfigError;
using marich::core::Emotion;
using marich::io::LedColor;
using nlohmann::json;

namespace {

  template <typename T> struct Named {
    std::string_view name;
    T value;
  };

  constexpr std::array<Named<LedColor>, 8> kLeds{ { { "red", LedColor::Red },
                                                    { "green", LedColor::Green },
                                                    { "blue", LedColor::Blue },
                                                    { "yellow", LedColor::Yellow },
                                                    { "purple", LedColor::Purple },
                                                    { "cyan", LedColor::Cyan },
                                                    { "white", LedColor::White },
                                                    { "off", LedColor::Off } } };

  constexpr std::array<Named<StageMove>, 9> kMoves{ { { "forward", StageMove::Forward },
                                                      { "backward", StageMove::Backward },
                                                      { "left", StageMove::Left },
                                                      { "right", StageMove::Right },
                                                      { "rotate_left", StageMove::RotateLeft },
                                                      { "rotate_right", StageMove::RotateRight },
                                                      { "stop", StageMove::Stop },
                                                      { "dance", StageMove::Dance },
                                                      { "patrol", StageMove::Patrol } } };

  template <typename T, std::size_t N>
  T lookup(const std::array<Named<T>, N>& table, const std::string& name, const char* what,
           std::size_t index) {
    for (const auto& entry : table)
      if (entry.name == name)
        return entry.value;
    throw ConfigError("presentation step " + std::to_string(index) + ": unknown " + what + " '" +
                      name + "'");
  }

  PresentationStep parseStep(const json& j, std::size_t index) {
    if (!j.is_object())
      throw ConfigError("presentation step " + std::to_string(index) + " is not an object");

    PresentationStep step;
    step.say = j.value("say", std::string{});
    if (auto it = j.find("emotion"); it != j.end()) {
      auto e = marich::core::emotionFromString(it->get<std::string>());
      if (!e)
        throw ConfigError("presentation step " + std::to_string(index) + ": unknown emotion '" +
                          it->get<std::string>() + "'");
      step.emotion = e;
    }
    if (auto it = j.find("led"); it != j.end())
      step.led = lookup(kLeds, it->get<std::string>(), "led colour", index);
    if (auto it = j.find("move"); it != j.end())
      step.move = lookup(kMoves, it->get<std::string>(), "move", index);
    step.speed = j.value("speed", step.speed);
    const auto ms = j.value("duration_ms", std::int64_t{ 0 });
    if (ms < 0 || step.speed < 0 || step.speed > 255)
      throw ConfigError("presentation step " + std::to_string(index) + ": value out of range");
    step.duration = std::chrono::milliseconds{ ms };
    return step;
  }

  PresentationStep line(const char* text, std::optional<Emotion> e = std::nullopt,
                        std::optional<LedColor> led = std::nullopt) {
    PresentationStep s;
    s.say = text;
    s.emotion = e;
    s.led = led;
    return s;
  }

  PresentationStep motion(StageMove m, int speed, std::chrono::milliseconds hold) {
    PresentationStep s;
    s.move = m;
    s.speed = speed;
    s.duration = hold;
    return s;
  }

} // namespace

std::vector<PresentationStep> marich::services::parsePresentation(const json& doc) {
  const json* steps = &doc;
  if (doc.is_object()) {
    auto it = doc.find("steps");
    if (it == doc.end())
      throw ConfigError("presentation script has no \"steps\" array");
    steps = &*it;
  }
  if (!steps->is_array())
    throw ConfigError("presentation steps must be an array");

  std::vector<PresentationStep> out;
  out.reserve(steps->size());
  try {
    for (std::size_t i = 0; i < steps->size(); ++i)
      out.push_back(parseStep((*steps)[i], i));
  } catch (const json::exception& e) {
    throw ConfigError(std::string("presentation script: ") + e.what());
  }
  return out;
}

std::vector<PresentationStep> marich::services::loadPresentation(const std::string& path) {
  std::ifstream file(path);
  if (!file)
    throw ConfigError("cannot open presentation script " + path);

  json doc = json::parse(file, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded())
    throw ConfigError("presentation script " + path + " is not valid JSON");
  return parsePresentation(doc);
}

std::vector<PresentationStep> marich::services::builtinIntroduction() {
  using namespace std::chrono_literals;
  return {
    line("Hello everyone! My name is Marich.", Emotion::Happy, LedColor::Green),
    line("I am a small robot with four mecanum wheels, a camera, and a voice.", Emotion::Neutral),
    motion(StageMove::RotateLeft, 60, 800ms),
    motion(StageMove::RotateRight, 60, 800ms),
    line("My camera lets me follow colours, faces and hand gestures.", Emotion::Neutral, LedColor::Cyan),
    line("I can also read objects and licence plates.", Emotion::Confused),
    line("If you are brave, challenge me to rock paper scissors!", Emotion::Happy, LedColor::Purple),
    motion(StageMove::Dance, 80, 0ms),
    line("And when my chat mode is on, you can simply talk to me.", Emotion::Shy),
    line("Thank you for listening!", Emotion::Happy, LedColor::Green),
  };
}

PresentationScript::PresentationScript(ui::FacePresenter& face, io::HardwareHandle& hw,
                                       std::shared_ptr<Voice> voice, std::vector<PresentationStep> steps)
    : face_(face), hw_(hw), voice_(std::move(voice)), steps_(std::move(steps)) {}

void PresentationScript::run(const core::CancelSignal& cancel) {
  auto log = marich::core::logging::get("presentation");
  log->info("[Presentation] starting ({} steps)", steps_.size());

  for (const auto& step : steps_) {
    if (cancel.requested())
      break;
    try {
      play(step, cancel);
    } catch (const core::HardwareError& e) {
      log->warn("[Presentation] hardware command failed: {}", e.what());
    }
  }

  try {
    hw_.motorStop();
    hw_.setLED(LedColor::Off);
  } catch (const core::HardwareError& e) {
    log->warn("[Presentation] cleanup failed: {}", e.what());
  }
  face_.setEmotion(Emotion::Neutral);
  log->info("[Presentation] {}", cancel.requested() ? "stopped" : "finished");
}

void PresentationScript::play(const PresentationStep& step, const core::CancelSignal& cancel) {
  if (step.emotion)
    face_.setEmotion(*step.emotion);
  if (step.led)
    hw_.setLED(*step.led);

  switch (step.move) {
  case StageMove::None:
    break;
  case StageMove::Forward:
    io::moveForward(hw_, step.speed);
    break;
  case StageMove::Backward:
    io::moveBackward(hw_, step.speed);
    break;
  case StageMove::Left:
    io::strafeLeft(hw_, step.speed);
    break;
  case StageMove::Right:
    io::strafeRight(hw_, step.speed);
    break;
  case StageMove::RotateLeft:
    io::rotateLeft(hw_, step.speed);
    break;
  case StageMove::RotateRight:
    io::rotateRight(hw_, step.speed);
    break;
  case StageMove::Stop:
    hw_.motorStop();
    break;
  case StageMove::Dance:
    danceRoutine(hw_, cancel);
    break;
  case StageMove::Patrol:
    carPatrol(hw_, cancel);
    break;
  }

  if (!step.say.empty()) {
    const auto mood = step.emotion.value_or(face_.currentEmotion());
    // an explicit led wins over the emotion colour speakAndAnimate would set
    speakAndAnimate(face_, hw_, *voice_, step.say, mood, cancel,
                    *marich::core::logging::get("presentation"));
    if (step.led)
      hw_.setLED(*step.led);
  }

  cancel.sleepFor(step.duration);
  if (step.move != StageMove::None && step.move != StageMove::Dance && step.move != StageMove::Patrol)
    hw_.motorStop();
}
