#pragma once
/** @file  CancelSignal.hpp
 *  @brief Shared cooperative cancellation flag with interruptible sleeps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace marich::core {

  /**
 * @class CancelSignal
 * @brief Copies share one flag. The owning Worker calls `request()`; the service loop
 *        polls `requested()` at every blocking point or sleeps through `sleepFor()`,
 *        which wakes immediately on cancellation.
 */
  class CancelSignal {
  public:
    CancelSignal() : state_(std::make_shared<State>()) {}

    void request() const {
      {
        std::lock_guard<std::mutex> lock(state_->mtx);
        state_->cancelled = true;
      }
      state_->cv.notify_all();
    }

    bool requested() const {
      std::lock_guard<std::mutex> lock(state_->mtx);
      return state_->cancelled;
    }

    /// Sleeps up to \p d. @returns false if cancelled before or during the wait.
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> d) const {
      std::unique_lock<std::mutex> lock(state_->mtx);
      return !state_->cv.wait_for(lock, d, [this] { return state_->cancelled; });
    }

  private:
    struct State {
      std::mutex mtx;
      std::condition_variable cv;
      bool cancelled{ false };
    };

    std::shared_ptr<State> state_;
  };

} // namespace marich::core
