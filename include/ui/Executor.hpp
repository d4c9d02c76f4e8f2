#pragma once
/** @file  Executor.hpp
 *  @brief Task queue of the UI-owning thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>

namespace marich::ui {

  /**
 * @class Executor
 * @brief Anything that touches the face or the camera display is posted here
 *        instead of being called from the IR or worker threads.
 *
 *  * `post()` / `postDelayed()` are thread-safe and never run the task inline.
 */
  class Executor {
  public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    virtual void post(Task task) = 0;
    virtual void postDelayed(std::chrono::milliseconds delay, Task task) = 0;
  };

} // namespace marich::ui
