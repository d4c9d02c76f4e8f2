#pragma once
/** @file  Voice.hpp
 *  @brief Text-to-speech capability plus the shared "speak with a moving face" helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

#include <spdlog/logger.h>

#include "core/Emotion.hpp"
#include "core/RobotConfig.hpp"

namespace marich {
  namespace core {
    class CancelSignal;
  } // namespace core
  namespace io {
    class HardwareHandle;
  } // namespace io
  namespace ui {
    class FacePresenter;
  } // namespace ui

  namespace services {

    /// Speech output. Implementations must return promptly once \p cancel is requested.
    class Voice {
    public:
      virtual ~Voice() = default;

      /** Synthesise and play \p text. \p onPlayback fires once audio is about to start.
       *  @returns false if synthesis or playback failed or was cancelled. */
      virtual bool speak(const std::string& text, const core::CancelSignal& cancel,
                         const std::function<void()>& onPlayback) = 0;
    };

    /**
 * @class PiperVoice
 * @brief `piper` renders a wav from stdin text, `aplay -D <device>` plays it.
 *
 *  * The temp wav is removed after every utterance, success or not.
 *  * Both children are killed on cancellation (see util::Subprocess).
 */
    class PiperVoice : public Voice {
    public:
      explicit PiperVoice(core::VoiceSettings settings);

      bool speak(const std::string& text, const core::CancelSignal& cancel,
                 const std::function<void()>& onPlayback) override;

    private:
      core::VoiceSettings settings_;
    };

    /** Face emotion + LED (kept as-is for `Scared`), speak with the talking mouth,
     *  mouth closed again afterwards. LED failures are logged, never thrown. */
    bool speakAndAnimate(ui::FacePresenter& face, io::HardwareHandle& hw, Voice& voice,
                         const std::string& text, core::Emotion emotion,
                         const core::CancelSignal& cancel, spdlog::logger& log);

  } // namespace services
} // namespace marich
