/* @file DefaultServiceFactory.cpp
 * @brief builds worker bodies for the coordinator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Logger.hpp"
#include "services/ChatbotService.hpp"
#include "services/Conversation.hpp"
#include "services/DefaultServiceFactory.hpp"
#include "services/PresentationScript.hpp"
#include "services/RpsGame.hpp"
#include "services/Voice.hpp"

using namespace marich::services;

DefaultServiceFactory::DefaultServiceFactory(ui::FacePresenter& face, io::HardwareHandle& hw,
                                             const core::RobotConfig& config)
    : DefaultServiceFactory(face, hw, config, std::make_shared<PiperVoice>(config.voice),
                            std::make_shared<CommandSpeechInput>(config.chatbot),
                            std::make_shared<CommandConversation>(config.chatbot)) {}

DefaultServiceFactory::DefaultServiceFactory(ui::FacePresenter& face, io::HardwareHandle& hw,
                                             const core::RobotConfig& config, std::shared_ptr<Voice> voice,
                                             std::shared_ptr<SpeechInput> speech,
                                             std::shared_ptr<ConversationBackend> conversation)
    : face_(face), hw_(hw), rps_(config.rps), presentation_(config.presentation), voice_(std::move(voice)),
      speech_(std::move(speech)), conversation_(std::move(conversation)) {}

void DefaultServiceFactory::preloadConversation(const core::CancelSignal& cancel) {
  conversation_->preload(cancel);
}

std::unique_ptr<Service> DefaultServiceFactory::makeChatbot(bool suppressGreeting) {
  return std::make_unique<ChatbotService>(face_, hw_, voice_, speech_, conversation_, suppressGreeting);
}

std::unique_ptr<Service> DefaultServiceFactory::makeRpsGame(const camera::GestureSource& gestures) {
  return std::make_unique<RpsGame>(face_, gestures, hw_, voice_, rps_);
}

std::unique_ptr<Service> DefaultServiceFactory::makePresentation() {
  if (presentation_.scriptPath.empty()) {
    marich::core::logging::get("presentation")->info("[Presentation] no script configured, using built-in");
    return std::make_unique<PresentationScript>(face_, hw_, voice_, builtinIntroduction());
  }
  return std::make_unique<PresentationScript>(face_, hw_, voice_, loadPresentation(presentation_.scriptPath));
}
