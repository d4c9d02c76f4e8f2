#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/RobotConfig.hpp"

namespace marich::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto RobotConfig.
 *
 *  * No caching: every call re-reads the file.
 *  * Unknown keys are ignored; missing keys keep their defaults.
 */
  class ConfigLoader {
  public:
    static constexpr const char* kDefaultPath = "config/marich.json";

    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath = kDefaultPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigError`.
    nlohmann::json load() const;

    /** Missing file → defaults (logged); unreadable, malformed or mistyped → `ConfigError`. */
    RobotConfig loadRobotConfig() const;

    /// Map an already-parsed document; throws `ConfigError` on a type mismatch.
    static RobotConfig fromJson(const nlohmann::json& doc);

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace marich::core
