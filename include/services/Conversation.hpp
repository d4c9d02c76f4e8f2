#pragma once
/** @file  Conversation.hpp
 *  @brief Speech recognition and LLM reply backends for the chatbot worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Emotion.hpp"
#include "core/RobotConfig.hpp"

namespace marich {
  namespace core {
    class CancelSignal;
  } // namespace core

  namespace services {

    /// One utterance from the microphone.
    class SpeechInput {
    public:
      virtual ~SpeechInput() = default;

      /** Blocks (bounded) until something was said. Empty string = silence,
       *  `nullopt` = cancelled. Throws core::ConversationUnavailable when the
       *  recogniser cannot run at all. */
      virtual std::optional<std::string> listen(const core::CancelSignal& cancel) = 0;
    };

    struct Reply {
      std::string text{};
      core::Emotion emotion{ core::Emotion::Neutral };
    };

    /// Conversational model. Keeps the dialogue history across chat sessions.
    class ConversationBackend {
    public:
      virtual ~ConversationBackend() = default;

      /// Best-effort warm-up; may throw core::ConversationUnavailable.
      virtual void preload(const core::CancelSignal& cancel) = 0;

      /// Throws core::ConversationUnavailable when no model can be reached.
      virtual Reply reply(const std::string& userText, const core::CancelSignal& cancel) = 0;
    };

    /**
 * @class CommandSpeechInput
 * @brief Runs the configured recogniser command; its first stdout line is the utterance.
 */
    class CommandSpeechInput : public SpeechInput {
    public:
      explicit CommandSpeechInput(core::ChatbotSettings settings);

      std::optional<std::string> listen(const core::CancelSignal& cancel) override;

    private:
      core::ChatbotSettings settings_;
    };

    /**
 * @class CommandConversation
 * @brief Pipes the JSON history (`[{role, content}, …]`) into the configured LLM command
 *        and parses `{"text": …, "emotion": …}` from its stdout.
 *
 *  * History = system prompt + the last `historyLimit - 1` messages.
 *  * A reply that is not valid JSON becomes a fixed "wires crossed" answer.
 *  * Unknown emotions fall back to neutral.
 *  * Thread-safe; preload and reply both run on the chatbot worker thread.
 */
    class CommandConversation : public ConversationBackend {
    public:
      static constexpr const char* kSystemPrompt =
          "You are Marich, an AI assistant. Your response MUST be valid JSON, with keys 'text' and "
          "'emotion'. Rules for 'text': must be a single, short sentence. Plain words only. Rules for "
          "'emotion': must be one of 'neutral', 'happy', or 'angry'. Act emotional - if insulted, "
          "respond with anger; if someone laughs, be happy.";
      static constexpr const char* kWiresCrossed = "I seem to have gotten my wires crossed.";

      explicit CommandConversation(core::ChatbotSettings settings);

      void preload(const core::CancelSignal& cancel) override;
      Reply reply(const std::string& userText, const core::CancelSignal& cancel) override;

      bool preloaded() const;
      nlohmann::json history() const;

      /// `nullopt` unless \p raw is a JSON object; missing text / bad emotion get defaults.
      static std::optional<Reply> parseReply(const std::string& raw);

    private:
      std::string ask(const nlohmann::json& messages, const core::CancelSignal& cancel);
      void trimHistory();

      core::ChatbotSettings settings_;
      nlohmann::json history_;
      bool preloaded_{ false };
      mutable std::mutex mtx_;
    };

  } // namespace services
} // namespace marich
