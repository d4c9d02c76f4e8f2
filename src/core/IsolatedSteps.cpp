/* @file IsolatedSteps.cpp
 * @brief isolated-step combinator used by every stop / release / shutdown path
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>

#include <spdlog/logger.h>

#include "core/IsolatedSteps.hpp"

namespace marich::core {

  std::vector<StepFailure> runIsolated(const std::vector<Step>& steps, spdlog::logger& log) {
    std::vector<StepFailure> failures;
    for (const auto& step : steps) {
      if (!step.action)
        continue;
      try {
        step.action();
      } catch (const std::exception& e) {
        log.warn("{} failed: {}", step.name, e.what());
        failures.push_back({ step.name, e.what() });
      }
    }
    return failures;
  }

} // namespace marich::core
