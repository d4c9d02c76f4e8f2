/* @file ConfigLoader.cpp
 * @brief JSON → RobotConfig mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Marich headers
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

using namespace marich::core;
using nlohmann::json;

namespace {

  const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || it->is_null())
      return empty;
    if (!it->is_object())
      throw ConfigError(std::string("[CONFIG] section '") + name + "' must be an object");
    return *it;
  }

  template <typename T>
  void read(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null())
      out = it->get<T>();
  }

  void readMs(const json& obj, const char* key, std::chrono::milliseconds& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;
    const auto v = it->get<long long>();
    if (v < 0)
      throw ConfigError(std::string("[CONFIG] ") + key + " must not be negative");
    out = std::chrono::milliseconds{ v };
  }

  // accepts 26, "26", "0x1A"
  void readByte(const json& obj, const char* key, std::uint8_t& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
      return;

    long value = -1;
    if (it->is_number_integer()) {
      value = it->get<long>();
    } else if (it->is_string()) {
      const auto text = it->get<std::string>();
      try {
        std::size_t used = 0;
        value = std::stol(text, &used, 0);
        if (used != text.size())
          value = -1;
      } catch (const std::exception&) {
        value = -1;
      }
    }
    if (value < 0 || value > 0xFF)
      throw ConfigError(std::string("[CONFIG] ") + key + " is not a byte value");
    out = static_cast<std::uint8_t>(value);
  }

  void readIr(const json& doc, IrSettings& ir) {
    const auto& s = section(doc, "ir");
    readMs(s, "debounce_ms", ir.debounce);
    readMs(s, "poll_interval_ms", ir.pollInterval);
    read(s, "debug", ir.debug);

    const auto& c = section(s, "codes");
    auto& k = ir.codes;
    const std::pair<const char*, std::uint8_t*> fields[] = {
      { "red", &k.red },       { "blue", &k.blue },         { "green", &k.green },
      { "yellow", &k.yellow }, { "face", &k.face },         { "gesture", &k.gesture },
      { "object", &k.object }, { "plate", &k.plate },       { "rps", &k.rps },
      { "presentation", &k.presentation },                  { "ai_toggle", &k.aiToggle },
      { "stop_all", &k.stopAll },                           { "exit", &k.exit },
    };

    std::set<std::uint8_t> seen;
    for (const auto& [name, dst] : fields) {
      readByte(c, name, *dst);
      if (*dst == ir.noCode || *dst == ir.invalidCode)
        throw ConfigError(std::string("[CONFIG] ir.codes.") + name + " uses a reserved sentinel value");
      if (!seen.insert(*dst).second)
        throw ConfigError(std::string("[CONFIG] ir.codes.") + name + " duplicates another command");
    }
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw ConfigError("[CONFIG] cannot open " + path_);

  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("[CONFIG] " + path_ + ": " + e.what());
  }
}

RobotConfig ConfigLoader::loadRobotConfig() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    logging::get("app")->warn("[CONFIG] {} not found; using built-in defaults", path_);
    return RobotConfig{};
  }
  return fromJson(load());
}

RobotConfig ConfigLoader::fromJson(const json& doc) {
  if (!doc.is_object())
    throw ConfigError("[CONFIG] top level must be a JSON object");

  RobotConfig cfg;
  try {
    readIr(doc, cfg.ir);

    const auto& cam = section(doc, "camera");
    read(cam, "device", cfg.camera.device);
    read(cam, "width", cfg.camera.width);
    read(cam, "height", cfg.camera.height);
    read(cam, "fourcc", cfg.camera.fourcc);
    read(cam, "face_cascade", cfg.camera.faceCascade);

    const auto& assets = section(doc, "assets");
    read(assets, "object_model", cfg.assets.objectModel);
    read(assets, "object_labels", cfg.assets.objectLabels);
    read(assets, "plate_font", cfg.assets.plateFont);
    read(assets, "plate_sensitivity", cfg.assets.plateSensitivity);

    readMs(section(doc, "workers"), "join_grace_ms", cfg.workerGrace);

    const auto& hw = section(doc, "hardware");
    read(hw, "bus", cfg.hardware.device);
    readByte(hw, "address", cfg.hardware.address);

    const auto& disp = section(doc, "display");
    read(disp, "enabled", cfg.display.enabled);
    read(disp, "bus", cfg.display.device);
    readByte(disp, "address", cfg.display.address);

    const auto& voice = section(doc, "voice");
    read(voice, "piper", cfg.voice.piperBinary);
    read(voice, "model", cfg.voice.model);
    read(voice, "model_config", cfg.voice.modelConfig);
    read(voice, "player", cfg.voice.player);
    read(voice, "audio_device", cfg.voice.audioDevice);
    read(voice, "temp_wav", cfg.voice.tempWav);
    readMs(voice, "synth_timeout_ms", cfg.voice.synthTimeout);

    const auto& chat = section(doc, "chatbot");
    read(chat, "recognizer_command", cfg.chatbot.recognizerCommand);
    read(chat, "llm_command", cfg.chatbot.llmCommand);
    readMs(chat, "listen_timeout_ms", cfg.chatbot.listenTimeout);
    readMs(chat, "reply_timeout_ms", cfg.chatbot.replyTimeout);
    read(chat, "history_limit", cfg.chatbot.historyLimit);

    const auto& rps = section(doc, "rps");
    read(rps, "rock_image", cfg.rps.rockImage);
    read(rps, "paper_image", cfg.rps.paperImage);
    read(rps, "scissors_image", cfg.rps.scissorsImage);
    readMs(rps, "capture_window_ms", cfg.rps.captureWindow);

    read(section(doc, "presentation"), "script", cfg.presentation.scriptPath);

    const auto& log = section(doc, "logging");
    read(log, "level", cfg.logging.level);
    read(log, "file", cfg.logging.file);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("[CONFIG] ") + e.what());
  }

  if (cfg.camera.width <= 0 || cfg.camera.height <= 0)
    throw ConfigError("[CONFIG] camera.width / camera.height must be positive");
  if (!cfg.camera.fourcc.empty() && cfg.camera.fourcc.size() != 4)
    throw ConfigError("[CONFIG] camera.fourcc must be four characters (e.g. YUYV, MJPG)");
  if (cfg.ir.pollInterval.count() == 0)
    throw ConfigError("[CONFIG] ir.poll_interval_ms must be positive");
  return cfg;
}
