#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace marich::core {

  /**
 * @class ErrorMonitor
 * @brief Coordinator, camera and worker code call `notifyFailure()` for every failure
 *        they downgrade to a log line; the registered escalation callback sees each
 *        distinct message exactly once.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a flapping LED bus doesn't spam the escalation path.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a new fault (Application logs it as critical).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback once.
    virtual void notifyFailure(const std::string& message);

    /// Total failures reported, duplicates included.
    std::size_t failureCount() const;

    /// Distinct failure messages seen so far.
    std::vector<std::string> distinctFailures() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t total_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace marich::core
