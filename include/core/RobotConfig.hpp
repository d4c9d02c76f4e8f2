#pragma once
/** @file  RobotConfig.hpp
 *  @brief Typed run-time configuration; every field has a working default.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Marich headers
#include "camera/CameraManager.hpp"
#include "io/V4l2Camera.hpp"

namespace marich::core {

  /// IR remote byte codes (0x00 and 0xFF are reserved sentinels).
  struct IrCodes {
    std::uint8_t red{ 0x01 };
    std::uint8_t blue{ 0x04 };
    std::uint8_t green{ 0x06 };
    std::uint8_t yellow{ 0x09 };
    std::uint8_t face{ 0x10 };
    std::uint8_t gesture{ 0x11 };
    std::uint8_t object{ 0x12 };
    std::uint8_t plate{ 0x14 };
    std::uint8_t rps{ 0x19 };
    std::uint8_t presentation{ 0x15 };
    std::uint8_t aiToggle{ 0x02 };
    std::uint8_t stopAll{ 0x05 };
    std::uint8_t exit{ 0x1A };
  };

  struct IrSettings {
    IrCodes codes{};
    std::chrono::milliseconds debounce{ 400 };
    std::chrono::milliseconds pollInterval{ 50 };
    bool debug{ false }; ///< log unmapped codes, bypass debounce
    std::uint8_t noCode{ 0x00 };
    std::uint8_t invalidCode{ 0xFF };
  };

  struct BusSettings {
    std::string device{ "/dev/i2c-1" };
    std::uint8_t address{ 0x2B };
  };

  struct DisplaySettings {
    bool enabled{ true };
    std::string device{ "/dev/i2c-1" };
    std::uint8_t address{ 0x3C };
  };

  struct VoiceSettings {
    std::string piperBinary{ "piper/piper" };
    std::string model{ "piper/en_US-amy-medium.onnx" };
    std::string modelConfig{ "piper/en_US-amy-medium.onnx.json" };
    std::string player{ "aplay" };
    std::string audioDevice{ "default" };
    std::string tempWav{ "/tmp/marich_tts.wav" };
    std::chrono::milliseconds synthTimeout{ 15000 };
  };

  struct ChatbotSettings {
    /// Prints one recognised utterance on stdout, empty line on silence.
    std::vector<std::string> recognizerCommand{ "marich-listen", "--model",
                                                "vosk-model-small-en-us-0.15" };
    /// Reads the JSON history on stdin, prints {"text": …, "emotion": …}.
    std::vector<std::string> llmCommand{ "marich-llm", "--model", "gemma2:2b" };
    std::chrono::milliseconds listenTimeout{ 10000 };
    std::chrono::milliseconds replyTimeout{ 30000 };
    std::size_t historyLimit{ 7 }; ///< system prompt + last six turns
  };

  struct RpsSettings {
    std::string rockImage{ "images/rock.png" };
    std::string paperImage{ "images/paper.png" };
    std::string scissorsImage{ "images/scissors.png" };
    std::chrono::milliseconds captureWindow{ 2000 };
  };

  struct PresentationSettings {
    std::string scriptPath{}; ///< empty → built-in self-introduction
  };

  struct LoggingSettings {
    std::string level{ "info" };
    std::string file{};
  };

  /**
 * @struct RobotConfig
 * @brief One section per subsystem; mapped from JSON by ConfigLoader.
 */
  struct RobotConfig {
    IrSettings ir{};
    io::CameraSettings camera{};
    camera::DetectorAssets assets{
      "CameraLib/04.Tensorflow_object_recognition/ssdlite_mobilenet_v2_coco_2018_05_09/"
      "frozen_inference_graph.pb",
      "CameraLib/04.Tensorflow_object_recognition/data/mscoco_label_map.pbtxt",
      "CameraLib/07.Camera-Based_License_plate_recognition/platech.ttf", "low"
    };
    std::chrono::milliseconds workerGrace{ 2000 };
    BusSettings hardware{};
    DisplaySettings display{};
    VoiceSettings voice{};
    ChatbotSettings chatbot{};
    RpsSettings rps{};
    PresentationSettings presentation{};
    LoggingSettings logging{};

    /// Piper binary / model / model config paths that do not exist.
    std::vector<std::string> missingVoiceAssets() const;
  };

} // namespace marich::core
