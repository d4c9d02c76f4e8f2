/* @file InputRouter.cpp
 * @brief IR poll loop, debounce and command dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// Marich headers
#include "core/IsolatedSteps.hpp"
#include "core/Logger.hpp"
#include "core/ModeCoordinator.hpp"
#include "input/InputRouter.hpp"
#include "io/HardwareHandle.hpp"
#include "ui/Executor.hpp"

using namespace marich::input;
using marich::core::Mode;
using marich::core::ModeKind;

InputRouter::InputRouter(io::HardwareHandle& hardware, core::ModeCoordinator& coordinator,
                         ui::Executor& ui, const core::IrSettings& settings,
                         std::function<void()> onExit)
    : hardware_(hardware), coordinator_(coordinator), ui_(ui), settings_(settings),
      map_(settings.codes), debouncer_(settings.debounce, settings.debug),
      onExit_(std::move(onExit)) {}

InputRouter::~InputRouter() {
  requestStop();
  join();
}

void InputRouter::start() {
  if (thread_.joinable())
    return;
  stop_ = false;
  thread_ = std::thread([this] { loop(); });
}

void InputRouter::join() {
  if (!thread_.joinable() || thread_.get_id() == std::this_thread::get_id())
    return;
  thread_.join();
}

bool InputRouter::pollOnce(Clock::time_point now) {
  const auto code = hardware_.readIRRegister();
  if (!code || *code == settings_.noCode || *code == settings_.invalidCode)
    return false;

  if (!debouncer_.accept(*code, now))
    return false;

  core::logging::get("input")->info("[IR] Code: 0x{:02X}", *code);
  dispatch(*code);
  return true;
}

void InputRouter::dispatch(std::uint8_t code) {
  auto log = core::logging::get("input");
  const auto cmd = map_.lookup(code);

  if (cmd || settings_.debug)
    core::runIsolated({ { "IR beep", [this] { hardware_.beep(); } } }, *log);

  if (!cmd) {
    if (settings_.debug)
      log->info("[IR] Unmapped code: 0x{:02X}", code);
    return;
  }

  switch (*cmd) {
  case IrCommand::ColorRed:
    coordinator_.requestMode(Mode::colorTracking("red"));
    break;
  case IrCommand::ColorBlue:
    coordinator_.requestMode(Mode::colorTracking("blue"));
    break;
  case IrCommand::ColorGreen:
    coordinator_.requestMode(Mode::colorTracking("green"));
    break;
  case IrCommand::ColorYellow:
    coordinator_.requestMode(Mode::colorTracking("yellow"));
    break;
  case IrCommand::Face:
    coordinator_.requestMode(Mode::of(ModeKind::Face));
    break;
  case IrCommand::Gesture:
    coordinator_.requestMode(Mode::of(ModeKind::Gesture));
    break;
  case IrCommand::Object:
    coordinator_.requestMode(Mode::of(ModeKind::Object));
    break;
  case IrCommand::Plate:
    coordinator_.requestMode(Mode::of(ModeKind::Plate));
    break;

  // these touch the face: run them on the UI thread
  case IrCommand::Rps:
    ui_.post([this] { coordinator_.requestMode(Mode::of(ModeKind::Rps)); });
    break;
  case IrCommand::Presentation:
    ui_.post([this] { coordinator_.requestMode(Mode::of(ModeKind::Presentation)); });
    break;
  case IrCommand::AiToggle:
    ui_.post([this] { coordinator_.toggleAI(); });
    break;
  case IrCommand::StopAll:
    ui_.postDelayed(std::chrono::milliseconds{ 10 },
                    [this] { coordinator_.releaseCameraCompletely(); });
    break;

  case IrCommand::Exit:
    log->info("[IR] Exit command received.");
    if (onExit_)
      onExit_();
    break;
  default:
    break;
  }
}

void InputRouter::loop() {
  auto log = core::logging::get("input");
  log->info("[IR] Listening for IR codes...");

  while (!stop_) {
    try {
      pollOnce(Clock::now());
      std::this_thread::sleep_for(settings_.pollInterval);
    } catch (const std::exception& e) {
      log->warn("[IR] poll failed: {}", e.what());
      std::this_thread::sleep_for(2 * settings_.pollInterval);
    }
  }
  log->info("[IR] Listener stopped.");
}
