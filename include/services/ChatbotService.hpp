#pragma once
/** @file  ChatbotService.hpp
 *  @brief Voice assistant worker: listen, obey keyword commands, otherwise chat.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <string>

#include "core/Emotion.hpp"
#include "services/Service.hpp"

namespace marich {
  namespace io {
    class HardwareHandle;
  } // namespace io
  namespace ui {
    class FacePresenter;
  } // namespace ui

  namespace services {

    class ConversationBackend;
    class SpeechInput;
    class Voice;

    /// What a recognised phrase asks for, in the order the phrases are checked.
    enum class ChatIntent { Dance, Patrol, Stop, Help, Move, Goodbye, Chat };

    struct ParsedUtterance {
      ChatIntent intent{ ChatIntent::Chat };
      std::string movement{}; ///< matched phrase when intent == Move
    };

    /// Keyword matching on the lower-cased utterance; pure.
    ParsedUtterance parseUtterance(const std::string& utterance);

    /**
 * @class ChatbotService
 * @brief One chat session; returns after "goodbye", on cancellation, or when the
 *        recogniser cannot run.
 *
 *  * Ultrasonic sensor on for the session, off afterwards.
 *  * Movement phrases drive the wheels at speed 50 and stop 0.5 s after the
 *    spoken confirmation.
 *  * A missing conversational model degrades to a fixed apology.
 */
    class ChatbotService : public Service {
    public:
      static constexpr int kMoveSpeed = 50;

      ChatbotService(ui::FacePresenter& face, io::HardwareHandle& hw, std::shared_ptr<Voice> voice,
                     std::shared_ptr<SpeechInput> speech, std::shared_ptr<ConversationBackend> backend,
                     bool suppressGreeting);

      void run(const core::CancelSignal& cancel) override;

    private:
      /// @returns false when the session should end.
      bool handle(const std::string& text, const core::CancelSignal& cancel);
      void say(const std::string& text, core::Emotion emotion, const core::CancelSignal& cancel);
      void stopCar();
      void setUltrasonic(bool on);

      ui::FacePresenter& face_;
      io::HardwareHandle& hw_;
      std::shared_ptr<Voice> voice_;
      std::shared_ptr<SpeechInput> speech_;
      std::shared_ptr<ConversationBackend> backend_;
      bool suppressGreeting_;
    };

  } // namespace services
} // namespace marich
