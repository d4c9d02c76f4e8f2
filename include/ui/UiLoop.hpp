#pragma once
/** @file  UiLoop.hpp
 *  @brief Main-thread task loop: the only context allowed to touch the face and display.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <thread>

#include "ui/Executor.hpp"

namespace marich {
  namespace ui {

    /**
 * @class UiLoop
 * @brief Timer-ordered task queue drained by whichever thread calls `run()`.
 *
 * * Tasks with the same due time run in posting order.
 * * A task that throws is logged; the loop keeps going.
 * * `quit()` may be called from any thread (signal handler path included via post()).
 */
    class UiLoop : public Executor {

    public:
      using Clock = std::chrono::steady_clock;

      UiLoop() = default;
      ~UiLoop() override = default;

      // ---- public API ----------------------------------------------------------
      void post(Task task) override;
      void postDelayed(std::chrono::milliseconds delay, Task task) override;

      /// Block the calling thread running tasks until quit().
      void run();

      /// Run every task already due, without blocking. @returns tasks executed.
      std::size_t runPending();

      void quit();

      bool isUiThread() const;
      std::size_t pendingTasks() const;

      UiLoop(const UiLoop&) = delete;
      UiLoop& operator=(const UiLoop&) = delete;

    private:
      void execute(Task& task);

      std::multimap<Clock::time_point, Task> queue_;
      bool quit_{ false };
      std::thread::id uiThread_{};
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace ui
} // namespace marich
