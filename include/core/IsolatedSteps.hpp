#pragma once
/** @file  IsolatedSteps.hpp
 *  @brief Run N independent fallible cleanup steps; collect failures, never short-circuit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>
#include <vector>

namespace spdlog {
  class logger;
} // namespace spdlog

namespace marich::core {

  struct Step {
    std::string name;
    std::function<void()> action;
  };

  struct StepFailure {
    std::string step;
    std::string what;
  };

  /**
   * Executes every step in order. A step that throws is logged as a warning on
   * \p log and recorded; the remaining steps still run.
   *
   * @returns one entry per failed step (empty when everything succeeded).
   */
  std::vector<StepFailure> runIsolated(const std::vector<Step>& steps, spdlog::logger& log);

} // namespace marich::core
