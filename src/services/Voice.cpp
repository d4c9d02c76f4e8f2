/* @file Voice.cpp
 * @brief piper + aplay speech output
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <utility>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/HardwareHandle.hpp"
#include "services/Voice.hpp"
#include "ui/FacePresenter.hpp"
#include "util/Subprocess.hpp"

using namespace marich::services;
using marich::util::Subprocess;

PiperVoice::PiperVoice(core::VoiceSettings settings) : settings_(std::move(settings)) {}

bool PiperVoice::speak(const std::string& text, const core::CancelSignal& cancel,
                       const std::function<void()>& onPlayback) {
  if (cancel.requested())
    return false;

  auto log = marich::core::logging::get("app");
  const auto& s = settings_;

  auto synth = Subprocess::run({ s.piperBinary, "-m", s.model, "-c", s.modelConfig, "--output_file",
                                 s.tempWav },
                               text, cancel, s.synthTimeout);

  bool ok = synth.ok();
  if (!ok) {
    log->warn("[AI] speech synthesis {} (exit {})", util::toString(synth.status), synth.exitCode);
  } else {
    if (onPlayback)
      onPlayback();
    auto play = Subprocess::run({ s.player, "-D", s.audioDevice, s.tempWav }, {}, cancel,
                                std::chrono::milliseconds{ 0 });
    ok = play.ok();
    if (!ok)
      log->warn("[AI] playback {} (exit {})", util::toString(play.status), play.exitCode);
  }

  std::error_code ec;
  std::filesystem::remove(s.tempWav, ec);
  return ok;
}

bool marich::services::speakAndAnimate(ui::FacePresenter& face, io::HardwareHandle& hw, Voice& voice,
                                       const std::string& text, core::Emotion emotion,
                                       const core::CancelSignal& cancel, spdlog::logger& log) {
  log.info("Marich: '{}' ({})", text, core::toString(emotion));
  face.setEmotion(emotion);

  // the scared sequence drives the LEDs itself
  if (emotion != core::Emotion::Scared) {
    try {
      hw.setLED(io::ledForEmotion(emotion));
    } catch (const core::HardwareError& e) {
      log.warn("LED update failed: {}", e.what());
    }
  }

  const bool spoken = voice.speak(text, cancel, [&face] { face.startTalking(); });
  face.stopTalking();
  return spoken;
}
