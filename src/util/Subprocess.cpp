/* @file Subprocess.cpp
 * @brief POSIX fork/exec with pipes - SIGTERM / SIGKILL on cancel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// Marich headers
#include "core/CancelSignal.hpp"
#include "core/Logger.hpp"
#include "util/Subprocess.hpp"

using namespace marich::util;

const char* marich::util::toString(ExitStatus s) {
  switch (s) {
  case ExitStatus::Exited:
    return "exited";
  case ExitStatus::Cancelled:
    return "cancelled";
  case ExitStatus::TimedOut:
    return "timed out";
  case ExitStatus::SpawnFailed:
    return "spawn failed";
  }
  return "unknown";
}

Subprocess::Subprocess(std::vector<std::string> argv) : argv_(std::move(argv)) {}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : argv_(std::move(other.argv_)), pid_(other.pid_), stdinFd_(other.stdinFd_),
      stdoutFd_(other.stdoutFd_), output_(std::move(other.output_)) {
  other.pid_ = -1;
  other.stdinFd_ = -1;
  other.stdoutFd_ = -1;
}

Subprocess::~Subprocess() {
  if (pid_ > 0)
    terminate();
  closeFd(stdinFd_);
  closeFd(stdoutFd_);
}

bool Subprocess::start() {
  auto log = marich::core::logging::get("app");
  if (argv_.empty() || pid_ > 0)
    return false;

  int in[2]{ -1, -1 };
  int out[2]{ -1, -1 };
  if (::pipe2(in, O_CLOEXEC) < 0 || ::pipe2(out, O_CLOEXEC) < 0) {
    log->error("Error {} from pipe2: {}", errno, strerror(errno));
    closeFd(in[0]);
    closeFd(in[1]);
    return false;
  }

  // argv must be prepared before fork: only async-signal-safe calls in the child
  std::vector<char*> args;
  args.reserve(argv_.size() + 1);
  for (auto& a : argv_)
    args.push_back(a.data());
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    log->error("Error {} from fork: {}", errno, strerror(errno));
    for (int fd : { in[0], in[1], out[0], out[1] })
      ::close(fd);
    return false;
  }

  if (pid == 0) {
    ::dup2(in[0], STDIN_FILENO);
    ::dup2(out[1], STDOUT_FILENO);
    ::execvp(args[0], args.data());
    ::_exit(127);
  }

  ::close(in[0]);
  ::close(out[1]);
  pid_ = pid;
  stdinFd_ = in[1];
  stdoutFd_ = out[0];
  ::fcntl(stdoutFd_, F_SETFL, ::fcntl(stdoutFd_, F_GETFL) | O_NONBLOCK);
  output_.clear();
  return true;
}

bool Subprocess::writeInput(const std::string& input) {
  if (stdinFd_ < 0)
    return false;

  // a child that ignores stdin must not kill us with SIGPIPE
  struct sigaction ignore {};
  struct sigaction previous {};
  ignore.sa_handler = SIG_IGN;
  ::sigaction(SIGPIPE, &ignore, &previous);

  bool ok = true;
  std::size_t total = 0;
  while (total < input.size()) {
    ssize_t n = ::write(stdinFd_, input.data() + total, input.size() - total);
    if (n > 0) {
      total += static_cast<std::size_t>(n);
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      ok = false;
      break;
    }
  }

  ::sigaction(SIGPIPE, &previous, nullptr);
  closeFd(stdinFd_);
  return ok;
}

RunResult Subprocess::wait(const marich::core::CancelSignal& cancel,
                           std::chrono::milliseconds timeout) {
  RunResult result;
  if (pid_ <= 0)
    return result;

  closeFd(stdinFd_); // EOF for children that read until end of input
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    drainOutput();
    if (auto code = tryReap()) {
      drainOutput();
      result.status = ExitStatus::Exited;
      result.exitCode = *code;
      break;
    }
    if (cancel.requested()) {
      terminate();
      result.status = ExitStatus::Cancelled;
      break;
    }
    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
      terminate();
      result.status = ExitStatus::TimedOut;
      break;
    }
    cancel.sleepFor(kPollInterval);
  }

  closeFd(stdoutFd_);
  result.output = std::move(output_);
  output_.clear();
  return result;
}

RunResult Subprocess::run(std::vector<std::string> argv, const std::string& input,
                          const marich::core::CancelSignal& cancel,
                          std::chrono::milliseconds timeout) {
  Subprocess proc(std::move(argv));
  if (!proc.start())
    return {};
  if (!input.empty())
    proc.writeInput(input);
  return proc.wait(cancel, timeout);
}

void Subprocess::drainOutput() {
  if (stdoutFd_ < 0)
    return;
  char buf[512];
  for (;;) {
    ssize_t n = ::read(stdoutFd_, buf, sizeof(buf));
    if (n > 0) {
      output_.append(buf, static_cast<std::size_t>(n));
    } else if (n == -1 && errno == EINTR) {
      continue;
    } else {
      break; // EAGAIN (nothing yet) or EOF
    }
  }
}

void Subprocess::terminate() {
  if (pid_ <= 0)
    return;

  ::kill(pid_, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (tryReap())
      return;
    ::usleep(10'000);
  }

  marich::core::logging::get("app")->warn("[SYS] '{}' ignored SIGTERM, killing", argv_.front());
  ::kill(pid_, SIGKILL);
  ::waitpid(pid_, nullptr, 0);
  pid_ = -1;
}

std::optional<int> Subprocess::tryReap() {
  int status = 0;
  const pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == 0)
    return std::nullopt;

  pid_ = -1;
  if (r < 0)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return 128 + WTERMSIG(status);
}

void Subprocess::closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}
