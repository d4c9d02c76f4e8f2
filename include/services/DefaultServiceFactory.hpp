#pragma once
/** @file  DefaultServiceFactory.hpp
 *  @brief Production ServiceFactory: piper voice, command-line recogniser and LLM.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "core/RobotConfig.hpp"
#include "core/ServiceFactory.hpp"

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

    /**
 * @class DefaultServiceFactory
 * @brief Wires services to the (UI-marshalled) face, the board and the voice pipeline.
 *
 *  * The conversation backend is shared across chat sessions so its history survives
 *    an AI off/on cycle.
 *  * `makePresentation()` loads the configured script each time (edits apply on the
 *    next run) and throws core::ConfigError when it is broken.
 */
    class DefaultServiceFactory : public core::ServiceFactory {
    public:
      DefaultServiceFactory(ui::FacePresenter& face, io::HardwareHandle& hw, const core::RobotConfig& config);

      /// Test seam: inject the voice / speech / conversation backends.
      DefaultServiceFactory(ui::FacePresenter& face, io::HardwareHandle& hw, const core::RobotConfig& config,
                            std::shared_ptr<Voice> voice, std::shared_ptr<SpeechInput> speech,
                            std::shared_ptr<ConversationBackend> conversation);

      void preloadConversation(const core::CancelSignal& cancel) override;
      std::unique_ptr<Service> makeChatbot(bool suppressGreeting) override;
      std::unique_ptr<Service> makeRpsGame(const camera::GestureSource& gestures) override;
      std::unique_ptr<Service> makePresentation() override;

    private:
      ui::FacePresenter& face_;
      io::HardwareHandle& hw_;
      core::RpsSettings rps_;
      core::PresentationSettings presentation_;
      std::shared_ptr<Voice> voice_;
      std::shared_ptr<SpeechInput> speech_;
      std::shared_ptr<ConversationBackend> conversation_;
    };

  } // namespace services
} // namespace marich
