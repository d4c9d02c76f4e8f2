/* @file Worker.cpp
 * @brief bounded-join worker threads for the chatbot, RPS game and presentation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>

// Marich headers
#include "core/Logger.hpp"
#include "core/Worker.hpp"
#include "services/Service.hpp"

using namespace marich::core;

const char* marich::core::toString(StopResult r) {
  switch (r) {
  case StopResult::NotRunning:
    return "NotRunning";
  case StopResult::Joined:
    return "Joined";
  case StopResult::Leaked:
    return "Leaked";
  default:
    return "Unknown";
  }
}

Worker::Worker(std::string name, std::chrono::milliseconds grace)
    : name_(std::move(name)), grace_(grace) {}

Worker::~Worker() { stop(); }

bool Worker::start(std::unique_ptr<services::Service> service) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto log = logging::get("worker");

  if (task_)
    return true;

  if (leakedAliveLocked()) {
    log->warn("[{}] refusing start: previous task leaked by a timed-out stop is still alive",
              name_);
    return false;
  }
  if (!service)
    throw std::invalid_argument("[Worker] " + name_ + ": null service");

  std::promise<void> exited;
  Task task;
  task.done = exited.get_future().share();

  // the thread owns the service and a copy of the signal; nothing else of ours
  task.thread = std::thread([svc = std::move(service), cancel = task.cancel,
                             exited = std::move(exited), name = name_, log]() mutable {
    try {
      svc->run(cancel);
    } catch (const std::exception& e) {
      log->error("[{}] service loop terminated by exception: {}", name, e.what());
    }
    svc.reset();
    exited.set_value();
  });

  task_ = std::move(task);
  log->info("[{}] task launched", name_);
  return true;
}

StopResult Worker::stop() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!task_)
    return StopResult::NotRunning;

  auto log = logging::get("worker");
  log->info("[{}] stopping task...", name_);
  task_->cancel.request();

  StopResult result;
  if (task_->done.wait_for(grace_) == std::future_status::ready) {
    task_->thread.join();
    result = StopResult::Joined;
    log->info("[{}] task stopped", name_);
  } else {
    task_->thread.detach();
    leaked_ = task_->done;
    result = StopResult::Leaked;
    log->warn("[{}] task did not exit within {} ms; leaving it to finish on its own", name_,
              grace_.count());
  }

  task_.reset();
  return result;
}

bool Worker::running() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return task_.has_value();
}

bool Worker::finished() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return task_ && task_->done.wait_for(std::chrono::seconds{ 0 }) == std::future_status::ready;
}

bool Worker::reap() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!task_ || task_->done.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready)
    return false;

  task_->thread.join();
  task_.reset();
  logging::get("worker")->info("[{}] task finished on its own", name_);
  return true;
}

bool Worker::leakedTaskAlive() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return leakedAliveLocked();
}

bool Worker::leakedAliveLocked() const {
  return leaked_.valid() &&
         leaked_.wait_for(std::chrono::seconds{ 0 }) != std::future_status::ready;
}
