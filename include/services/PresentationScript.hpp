#pragma once
/** @file  PresentationScript.hpp
 *  @brief Scripted self-introduction: speech, expressions, lights and moves played once.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/Emotion.hpp"
#include "io/HardwareHandle.hpp"
#include "services/Service.hpp"

namespace marich {
  namespace ui {
    class FacePresenter;
  } // namespace ui

  namespace services {

    class Voice;

    enum class StageMove { None, Forward, Backward, Left, Right, RotateLeft, RotateRight, Stop, Dance, Patrol };

    /// One beat of the show; every field is optional.
    struct PresentationStep {
      std::string say{};
      std::optional<core::Emotion> emotion{};
      std::optional<io::LedColor> led{};
      StageMove move{ StageMove::None };
      int speed{ 60 };
      std::chrono::milliseconds duration{ 0 }; ///< hold after the step; wheels stop afterwards
    };

    /** Accepts `{"steps": [...]}` or a bare array of
     *  `{"say", "emotion", "led", "move", "speed", "duration_ms"}` objects.
     *  Throws core::ConfigError on unknown names or wrong types. */
    std::vector<PresentationStep> parsePresentation(const nlohmann::json& doc);

    /// Reads and parses \p path. Throws core::ConfigError.
    std::vector<PresentationStep> loadPresentation(const std::string& path);

    /// Default show used when no script file is configured.
    std::vector<PresentationStep> builtinIntroduction();

    /**
 * @class PresentationScript
 * @brief Plays the steps once and returns (self-terminating worker).
 *
 *  Motors stopped, LEDs off and face neutral when finished or cancelled.
 */
    class PresentationScript : public Service {
    public:
      PresentationScript(ui::FacePresenter& face, io::HardwareHandle& hw, std::shared_ptr<Voice> voice,
                         std::vector<PresentationStep> steps);

      void run(const core::CancelSignal& cancel) override;

      std::size_t stepCount() const { return steps_.size(); }

    private:
      void play(const PresentationStep& step, const core::CancelSignal& cancel);

      ui::FacePresenter& face_;
      io::HardwareHandle& hw_;
      std::shared_ptr<Voice> voice_;
      std::vector<PresentationStep> steps_;
    };

  } // namespace services
} // namespace marich
