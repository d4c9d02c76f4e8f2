/* @file Application.cpp
 * @brief start-up wiring, UI-thread ticks and the orderly shutdown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <utility>

// Linux headers
#include <signal.h>

// spdlog headers
#include <spdlog/common.h>

// Marich headers
#include "app/Application.hpp"
#include "camera/CameraManager.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ModeCoordinator.hpp"
#include "input/InputRouter.hpp"
#include "io/OLEDDisplay.hpp"
#include "io/RaspbotBoard.hpp"
#include "io/V4l2Camera.hpp"
#include "services/DefaultServiceFactory.hpp"
#include "ui/MarshalledFace.hpp"
#include "ui/OledFace.hpp"

using namespace marich::app;

std::atomic<bool> Application::signalled_{ false };

namespace {

  void onSignal(int) { Application::requestShutdownFromSignal(); }

} // namespace

Application::Application(std::string configPath)
    : configPath_(std::move(configPath)), monitor_(std::make_shared<core::ErrorMonitor>()) {}

Application::~Application() { shutdown(); }

void Application::requestShutdownFromSignal() { signalled_ = true; }

int Application::run() {
  auto log = marich::core::logging::get("app");

  if (!initialize())
    return 1;

  struct sigaction sa {};
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);

  try {
    board_->setIRReceiver(true);
  } catch (const core::HardwareError& e) {
    log->critical("[SYS] cannot enable the IR receiver: {}", e.what());
    shutdown();
    return 1;
  }

  printHelp();
  router_->start();
  log->info("[SYS] Marich ready, waiting for IR commands");

  scheduleTick();
  loop_.run();

  shutdown();
  log->info("[SYS] bye");
  return 0;
}

bool Application::initialize() {
  auto log = marich::core::logging::get("app");

  try {
    config_ = core::ConfigLoader(configPath_).loadRobotConfig();
  } catch (const core::ConfigError& e) {
    log->critical("[SYS] {}", e.what());
    return false;
  }

  try {
    core::logging::configure(spdlog::level::from_str(config_.logging.level), config_.logging.file);
  } catch (const spdlog::spdlog_ex& e) {
    log->critical("[SYS] cannot open log file {}: {}", config_.logging.file, e.what());
    return false;
  }

  for (const auto& path : config_.missingVoiceAssets())
    log->warn("[SYS] voice asset missing: {} (speech will be silent)", path);

  monitor_->registerEscalation(
      [](const std::string& msg) { marich::core::logging::get("app")->critical("[SYS] fault: {}", msg); });

  board_ = std::make_unique<io::RaspbotBoard>();
  if (!board_->open(config_.hardware.device, config_.hardware.address)) {
    log->critical("[SYS] Raspbot board not reachable on {} 0x{:02X}", config_.hardware.device,
                  config_.hardware.address);
    return false;
  }

  display_ = std::make_unique<io::OLEDDisplay>();
  if (config_.display.enabled && !display_->init(config_.display.device, config_.display.address))
    log->warn("[SYS] face display unavailable, continuing without it");
  face_ = std::make_unique<ui::OledFace>(*display_);
  serviceFace_ = std::make_unique<ui::MarshalledFace>(*face_, loop_);

  camera_ = std::make_unique<camera::CameraManager>(
      [this]() -> std::unique_ptr<io::CameraBackend> {
        auto cam = std::make_unique<io::V4l2Camera>(config_.camera, *board_);
        cam->open();
        return cam;
      },
      config_.assets);

  services_ = std::make_unique<services::DefaultServiceFactory>(*serviceFace_, *board_, config_);

  coordinator_ = std::make_unique<core::ModeCoordinator>(*board_, *camera_, *face_, loop_, *services_,
                                                         monitor_, config_.workerGrace);
  coordinator_->setShutdownHandler([this] { loop_.post([this] { shutdown(); }); });
  coordinator_->setStoppedHandler([this] { printHelp(); });

  router_ = std::make_unique<input::InputRouter>(*board_, *coordinator_, loop_, config_.ir,
                                                 [this] { loop_.post([this] { shutdown(); }); });
  return true;
}

void Application::scheduleTick() {
  const auto now = std::chrono::steady_clock::now();
  const bool active = now - lastFrame_ < std::chrono::seconds{ 1 };
  loop_.postDelayed(active ? kActivePoll : kIdlePoll, [this] { tick(); });
}

void Application::tick() {
  if (shutdownDone_)
    return;
  if (signalled_) {
    marich::core::logging::get("app")->info("[SYS] signal received - shutting down");
    shutdown();
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  if (coordinator_->pollDisplay().kind != io::FrameEvent::Kind::Idle)
    lastFrame_ = now;
  face_->tick(now);

  scheduleTick();
}

void Application::shutdown() {
  if (shutdownDone_.exchange(true))
    return;

  auto log = marich::core::logging::get("app");
  log->info("[SYS] shutting down");

  if (router_) {
    router_->requestStop();
    router_->join();
  }
  if (coordinator_)
    coordinator_->shutdown();

  // let the face calls the shutdown posted reach the panel before the loop stops
  loop_.runPending();
  loop_.quit();
  if (display_)
    display_->close();
}

void Application::printHelp() const {
  if (router_)
    marich::core::logging::get("app")->info("{}", router_->commands().helpText());
}
