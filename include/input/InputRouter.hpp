#pragma once
/** @file  InputRouter.hpp
 *  @brief IR receiver polling thread that turns remote presses into coordinator calls.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

// Marich headers
#include "core/RobotConfig.hpp"
#include "input/IrCommandMap.hpp"
#include "input/IrDebouncer.hpp"

namespace marich {
  namespace core {
    class ModeCoordinator;
  } // namespace core
  namespace io {
    class HardwareHandle;
  } // namespace io
  namespace ui {
    class Executor;
  } // namespace ui

  namespace input {

    /**
 * @class InputRouter
 * @brief Owns the IR poll thread and the debounce state.
 *
 *  * Camera modes are requested directly from the poll thread.
 *  * RPS, presentation, AI toggle and stop-all touch the face, so they are posted to
 *    the UI executor instead.
 *  * Exit invokes the application's shutdown callback.
 */
    class InputRouter {
    public:
      using Clock = IrDebouncer::Clock;

      InputRouter(io::HardwareHandle& hardware, core::ModeCoordinator& coordinator,
                  ui::Executor& ui, const core::IrSettings& settings,
                  std::function<void()> onExit);
      ~InputRouter(); ///< requestStop() + join()

      //---public API------------------------------------------------------
      void start(); ///< spawn the poll thread (no-op if running)

      /** One loop iteration: read the register, drop sentinels / bus errors /
       *  debounced repeats, dispatch.  @returns true if a code was dispatched. */
      bool pollOnce(Clock::time_point now);

      /// Beep (unless unmapped with debug off), then run the mapped command.
      void dispatch(std::uint8_t code);

      /// Set the stop flag without joining; safe from the poll thread itself.
      void requestStop() { stop_ = true; }

      /// Wait for the poll thread; no-op when called from it or when not started.
      void join();

      bool stopRequested() const { return stop_; }
      const IrCommandMap& commands() const { return map_; }

      //---non-copyable-----------------------------------------------------
      InputRouter(const InputRouter&) = delete;
      InputRouter& operator=(const InputRouter&) = delete;

    private:
      void loop();

      io::HardwareHandle& hardware_;
      core::ModeCoordinator& coordinator_;
      ui::Executor& ui_;
      core::IrSettings settings_;
      IrCommandMap map_;
      IrDebouncer debouncer_;
      std::function<void()> onExit_;

      std::thread thread_;
      std::atomic<bool> stop_{ false };
    };

  } // namespace input
} // namespace marich
