/* @file UiLoop.cpp
 * @brief main-thread task queue
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <utility>

// Marich headers
#include "core/Logger.hpp"
#include "ui/UiLoop.hpp"

using namespace marich::ui;

void UiLoop::post(Task task) { postDelayed(std::chrono::milliseconds{ 0 }, std::move(task)); }

void UiLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
  if (!task)
    return;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.emplace(Clock::now() + delay, std::move(task));
  }
  cv_.notify_one();
}

void UiLoop::run() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    uiThread_ = std::this_thread::get_id();
    quit_ = false;
  }

  std::unique_lock<std::mutex> lock(mtx_);
  while (!quit_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this] { return quit_ || !queue_.empty(); });
      continue;
    }

    auto due = queue_.begin()->first;
    if (due > Clock::now()) {
      // wakes early on quit() or on a task posted with an earlier due time
      cv_.wait_until(lock, due);
      continue;
    }

    auto task = std::move(queue_.begin()->second);
    queue_.erase(queue_.begin());
    lock.unlock();
    execute(task);
    lock.lock();
  }
}

std::size_t UiLoop::runPending() {
  std::size_t ran = 0;
  const auto now = Clock::now();
  for (;;) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (queue_.empty() || queue_.begin()->first > now)
        break;
      task = std::move(queue_.begin()->second);
      queue_.erase(queue_.begin());
    }
    execute(task);
    ++ran;
  }
  return ran;
}

void UiLoop::quit() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    quit_ = true;
  }
  cv_.notify_all();
}

bool UiLoop::isUiThread() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return uiThread_ == std::this_thread::get_id();
}

std::size_t UiLoop::pendingTasks() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

void UiLoop::execute(Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    marich::core::logging::get("ui")->error("[UI] task failed: {}", e.what());
  }
}
