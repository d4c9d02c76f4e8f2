/* @file Conversation.cpp
 * @brief recogniser / LLM command backends
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <utility>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "services/Conversation.hpp"
#include "util/Subprocess.hpp"

using namespace marich::services;
using marich::core::ConversationUnavailable;
using marich::util::ExitStatus;
using marich::util::Subprocess;
using nlohmann::json;

namespace {

  std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); });
    if (first >= last.base())
      return {};
    return std::string(first, last.base());
  }

  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  json message(const char* role, const std::string& content) {
    return json{ { "role", role }, { "content", content } };
  }

} // namespace

//---CommandSpeechInput--------------------------------------------------------

CommandSpeechInput::CommandSpeechInput(core::ChatbotSettings settings) : settings_(std::move(settings)) {}

std::optional<std::string> CommandSpeechInput::listen(const core::CancelSignal& cancel) {
  auto r = Subprocess::run(settings_.recognizerCommand, {}, cancel, settings_.listenTimeout);

  switch (r.status) {
  case ExitStatus::Cancelled:
    return std::nullopt;
  case ExitStatus::TimedOut:
    return std::string{};
  case ExitStatus::SpawnFailed:
    throw ConversationUnavailable("speech recogniser could not be started");
  case ExitStatus::Exited:
    break;
  }

  if (r.exitCode != 0)
    throw ConversationUnavailable("speech recogniser exited with " + std::to_string(r.exitCode));

  auto line = r.output.substr(0, r.output.find('\n'));
  return trim(line);
}

//---CommandConversation-------------------------------------------------------

CommandConversation::CommandConversation(core::ChatbotSettings settings)
    : settings_(std::move(settings)), history_(json::array({ message("system", kSystemPrompt) })) {}

void CommandConversation::preload(const core::CancelSignal& cancel) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (preloaded_)
      return;
  }

  auto log = marich::core::logging::get("chatbot");
  log->info("[AI] Pre-loading model for faster responses...");
  json warmup = json::array(
      { message("system", R"(You are an AI. Respond with just {"text": "ready", "emotion": "neutral"})"),
        message("user", "hello") });
  ask(warmup, cancel);

  std::lock_guard<std::mutex> lock(mtx_);
  preloaded_ = true;
  log->info("[AI] Model pre-loaded successfully");
}

Reply CommandConversation::reply(const std::string& userText, const core::CancelSignal& cancel) {
  json messages;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    history_.push_back(message("user", userText));
    messages = history_;
  }

  std::string raw;
  try {
    raw = ask(messages, cancel);
  } catch (const ConversationUnavailable&) {
    std::lock_guard<std::mutex> lock(mtx_);
    history_.push_back(message("assistant", json{ { "text", "Chat model not installed." },
                                                  { "emotion", "angry" } }
                                                .dump()));
    trimHistory();
    throw;
  }

  auto parsed = parseReply(raw);
  std::lock_guard<std::mutex> lock(mtx_);
  if (parsed) {
    history_.push_back(message("assistant", raw));
  } else {
    marich::core::logging::get("chatbot")->warn("[AI] unparseable reply: {}", raw);
    parsed = Reply{ kWiresCrossed, core::Emotion::Angry };
    history_.push_back(
        message("assistant", json{ { "text", kWiresCrossed }, { "emotion", "angry" } }.dump()));
  }
  trimHistory();
  return *parsed;
}

bool CommandConversation::preloaded() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return preloaded_;
}

json CommandConversation::history() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return history_;
}

std::optional<Reply> CommandConversation::parseReply(const std::string& raw) {
  auto doc = json::parse(trim(raw), nullptr, /*allow_exceptions=*/false);
  if (!doc.is_object())
    return std::nullopt;

  Reply r;
  r.text = "I'm not sure how to respond.";
  if (auto it = doc.find("text"); it != doc.end() && it->is_string())
    r.text = it->get<std::string>();
  if (auto it = doc.find("emotion"); it != doc.end() && it->is_string())
    r.emotion = core::emotionFromString(lower(it->get<std::string>())).value_or(core::Emotion::Neutral);
  return r;
}

std::string CommandConversation::ask(const json& messages, const core::CancelSignal& cancel) {
  auto r = Subprocess::run(settings_.llmCommand, messages.dump() + "\n", cancel, settings_.replyTimeout);
  if (r.status == ExitStatus::SpawnFailed)
    throw ConversationUnavailable("chat model command could not be started");
  if (r.status != ExitStatus::Exited)
    throw ConversationUnavailable(std::string("chat model ") + util::toString(r.status));
  // 127 = exec failed inside the child
  if (r.exitCode != 0)
    throw ConversationUnavailable("chat model exited with " + std::to_string(r.exitCode));
  return r.output;
}

// caller holds mtx_
void CommandConversation::trimHistory() {
  const auto limit = std::max<std::size_t>(settings_.historyLimit, 2);
  if (history_.size() <= limit)
    return;
  json trimmed = json::array({ history_.front() });
  for (auto i = history_.size() - (limit - 1); i < history_.size(); ++i)
    trimmed.push_back(history_[i]);
  history_ = std::move(trimmed);
}
