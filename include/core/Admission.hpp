#pragma once
/** @file  Admission.hpp
 *  @brief Pure admission decision for a requested mode transition.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Mode.hpp"

namespace marich::core {

  enum class Admission { Accept, AlreadyActive, RejectAiEnabled, RejectWorkerConflict };

  const char* toString(Admission a);

  /// Worker observations the decision depends on.
  struct WorkerView {
    bool rpsRunning{ false };
    bool presentationRunning{ false };
  };

  /**
   * Rules, first match wins:
   *  1. AI enabled and target is a camera / RPS / Presentation mode → RejectAiEnabled
   *  2. RPS while the presentation runs, Presentation while RPS runs, or a camera
   *     mode while the presentation runs → RejectWorkerConflict
   *  3. target equals the active mode, parameters included → AlreadyActive
   *  4. otherwise → Accept
   */
  Admission decideAdmission(const CoordinatorState& state, const WorkerView& workers,
                            const Mode& target);

} // namespace marich::core
