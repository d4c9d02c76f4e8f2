#pragma once
/** @file  Worker.hpp
 *  @brief Start/stop lifecycle of one cancellable background service thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Marich headers
#include "core/CancelSignal.hpp"

namespace marich {
  namespace services {
    class Service;
  } // namespace services

  namespace core {

    /// Outcome of Worker::stop(). `Leaked` = grace period expired, thread detached.
    enum class StopResult { NotRunning, Joined, Leaked };

    const char* toString(StopResult r);

    /**
 * @class Worker
 * @brief Owns at most one running service task plus its cancel signal.
 *
 *  * `start()` is a no-op while a task is recorded; refuses while a previously
 *    leaked task is still alive.
 *  * `stop()` requests cancellation, waits up to the grace period, then clears the
 *    record whether or not the join succeeded.
 *  * Thread-safe; non-copyable, non-movable (the thread captures shared state only).
 */
    class Worker {
    public:
      static constexpr std::chrono::milliseconds kDefaultGrace{ 2000 };

      explicit Worker(std::string name, std::chrono::milliseconds grace = kDefaultGrace);
      ~Worker(); ///< stop() with the same bounded grace period

      //---public API------------------------------------------------------
      /** @returns true when a task is running afterwards (new or pre-existing),
       *  false when refused because a leaked task is still alive. */
      bool start(std::unique_ptr<services::Service> service);

      StopResult stop();

      /// A task is recorded (started and not yet stopped or reaped).
      bool running() const;

      /// The recorded task returned on its own (self-terminated, not yet reaped).
      bool finished() const;

      /** Observe a self-terminated task: join it and reset the record.
       *  @returns true if a finished task was reaped. */
      bool reap();

      /// A task detached by a timed-out stop() has not exited yet.
      bool leakedTaskAlive() const;

      const std::string& name() const { return name_; }

      //---non-copyable / non-movable---------------------------------------
      Worker(const Worker&) = delete;
      Worker& operator=(const Worker&) = delete;
      Worker(Worker&&) = delete;
      Worker& operator=(Worker&&) = delete;

    private:
      struct Task {
        std::thread thread;
        std::shared_future<void> done;
        CancelSignal cancel;
      };

      bool leakedAliveLocked() const;

      std::string name_;
      std::chrono::milliseconds grace_;
      std::optional<Task> task_;       ///< the Worker Record
      std::shared_future<void> leaked_; ///< completion of the last leaked task
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace marich
