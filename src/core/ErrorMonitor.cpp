/* @file ErrorMonitor.cpp
 * @brief De-duplicating fault sink; escalates each distinct failure once.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Marich headers
#include "core/ErrorMonitor.hpp"

using namespace marich::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++total_;
    if (!rememberIfNew(message))
      return;
    cb = escalation_;
  }
  // invoke outside the lock so the callback may report further failures
  if (cb)
    cb(message);
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return total_;
}

std::vector<std::string> ErrorMonitor::distinctFailures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

bool ErrorMonitor::rememberIfNew(const std::string& message) {
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
