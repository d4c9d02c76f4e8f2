/* @file main.cpp
 * @brief marich entry point: `marich [config.json]`
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <string>

// Marich headers
#include "app/Application.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"

int main(int argc, char** argv) {
  const std::string configPath = argc > 1 ? argv[1] : marich::core::ConfigLoader::kDefaultPath;

  try {
    marich::app::Application app(configPath);
    return app.run();
  } catch (const std::exception& e) {
    marich::core::logging::get("app")->critical("[SYS] fatal: {}", e.what());
    return 1;
  }
}
