/* @file RobotConfig.cpp
 * @brief start-up asset checks
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>

#include "core/RobotConfig.hpp"

using namespace marich::core;

std::vector<std::string> RobotConfig::missingVoiceAssets() const {
  std::vector<std::string> missing;
  std::error_code ec;

  // a bare command name is resolved through PATH at spawn time
  if (voice.piperBinary.find('/') != std::string::npos &&
      !std::filesystem::exists(voice.piperBinary, ec))
    missing.push_back(voice.piperBinary);

  for (const auto* path : { &voice.model, &voice.modelConfig })
    if (path->empty() || !std::filesystem::exists(*path, ec))
      missing.push_back(*path);

  return missing;
}
