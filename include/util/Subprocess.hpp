#pragma once
/** @file  Subprocess.hpp
 *  @brief fork/exec child with stdin/stdout pipes and cancellable, bounded waits.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace marich {
  namespace core {
    class CancelSignal;
  } // namespace core

  namespace util {

    /// How a wait() ended.
    enum class ExitStatus { Exited, Cancelled, TimedOut, SpawnFailed };

    const char* toString(ExitStatus s);

    struct RunResult {
      ExitStatus status{ ExitStatus::SpawnFailed };
      int exitCode{ -1 };    ///< valid when status == Exited
      std::string output{};  ///< everything the child wrote to stdout

      bool ok() const { return status == ExitStatus::Exited && exitCode == 0; }
    };

    /**
 * @class Subprocess
 * @brief One child process; argv[0] is resolved through PATH.
 *
 *  * `start()` forks, wires the child's stdin/stdout to pipes, and execs.
 *  * `wait()` polls every 50 ms; on cancel or timeout the child gets SIGTERM,
 *    then SIGKILL if it is still alive after a short grace.
 *  * The destructor kills and reaps a child that is still running.
 *  * *Non-copyable*, but move-constructible.
 */
    class Subprocess {
    public:
      static constexpr std::chrono::milliseconds kPollInterval{ 50 };
      static constexpr std::chrono::milliseconds kTermGrace{ 300 };

      explicit Subprocess(std::vector<std::string> argv);
      ~Subprocess();

      //---public API-------------------------------------------
      /// @returns false if the pipes or fork failed, or argv is empty.
      bool start();

      /// Write \p input to the child's stdin and close it.
      bool writeInput(const std::string& input);

      /** Wait for exit, collecting stdout. Returns Cancelled / TimedOut after killing
       *  the child. A zero \p timeout means no deadline. */
      RunResult wait(const core::CancelSignal& cancel,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds{ 0 });

      bool running() const { return pid_ > 0; }
      pid_t pid() const { return pid_; }

      /// start() + writeInput() + wait() in one call.
      static RunResult run(std::vector<std::string> argv, const std::string& input,
                           const core::CancelSignal& cancel, std::chrono::milliseconds timeout);

      //---non-copyable-----------------------------------------
      Subprocess(const Subprocess&) = delete;
      Subprocess& operator=(const Subprocess&) = delete;

      //---mv---------------------------------------------------
      Subprocess(Subprocess&& other) noexcept;
      Subprocess& operator=(Subprocess&&) = delete;

    private:
      void drainOutput();
      void terminate();
      void closeFd(int& fd);
      std::optional<int> tryReap();

      std::vector<std::string> argv_;
      pid_t pid_{ -1 };
      int stdinFd_{ -1 };
      int stdoutFd_{ -1 };
      std::string output_{};
    };

  } // namespace util
} // namespace marich
