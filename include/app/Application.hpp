#pragma once

/** @file  Application.hpp
 *  @brief Process wiring: config → hardware → camera → face → coordinator → IR router.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "core/RobotConfig.hpp"
#include "ui/UiLoop.hpp"

namespace marich {
  namespace camera {
    class CameraManager;
  } // namespace camera
  namespace core {
    class ErrorMonitor;
    class ModeCoordinator;
  } // namespace core
  namespace input {
    class InputRouter;
  } // namespace input
  namespace io {
    class OLEDDisplay;
    class RaspbotBoard;
  } // namespace io
  namespace services {
    class DefaultServiceFactory;
  } // namespace services
  namespace ui {
    class MarshalledFace;
    class OledFace;
  } // namespace ui

  namespace app {

    /**
 * @class Application
 * @brief Owns every long-lived object; the UI loop runs on the thread that calls `run()`.
 *
 *  * `run()` returns 0 after a clean shutdown and 1 when start-up failed.
 *  * `shutdown()` is idempotent and may be reached from the exit IR code, the
 *    camera window's 'q' key, SIGINT/SIGTERM, or the end of `run()`.
 */
    class Application {
    public:
      static constexpr std::chrono::milliseconds kActivePoll{ 50 };
      static constexpr std::chrono::milliseconds kIdlePoll{ 300 };

      explicit Application(std::string configPath);
      ~Application();

      int run();
      void shutdown();

      /// Async-signal-safe: only raises a flag the UI loop polls.
      static void requestShutdownFromSignal();

      Application(const Application&) = delete;
      Application& operator=(const Application&) = delete;

    private:
      bool initialize();
      void scheduleTick();
      void tick();
      void printHelp() const;

      std::string configPath_;
      core::RobotConfig config_{};
      std::shared_ptr<core::ErrorMonitor> monitor_;

      std::unique_ptr<io::RaspbotBoard> board_;
      std::unique_ptr<io::OLEDDisplay> display_;
      std::unique_ptr<ui::OledFace> face_;
      ui::UiLoop loop_;
      std::unique_ptr<ui::MarshalledFace> serviceFace_;
      std::unique_ptr<camera::CameraManager> camera_;
      std::unique_ptr<services::DefaultServiceFactory> services_;
      std::unique_ptr<core::ModeCoordinator> coordinator_;
      std::unique_ptr<input::InputRouter> router_;

      std::chrono::steady_clock::time_point lastFrame_{};
      std::atomic<bool> shutdownDone_{ false };

      static std::atomic<bool> signalled_;
    };

  } // namespace app
} // namespace marich
