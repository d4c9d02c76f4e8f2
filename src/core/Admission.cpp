/* @file Admission.cpp
 * @brief ordered admission rules
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Admission.hpp"

using namespace marich::core;

const char* marich::core::toString(Admission a) {
  switch (a) {
  case Admission::Accept:
    return "Accept";
  case Admission::AlreadyActive:
    return "AlreadyActive";
  case Admission::RejectAiEnabled:
    return "RejectAiEnabled";
  case Admission::RejectWorkerConflict:
    return "RejectWorkerConflict";
  default:
    return "Unknown";
  }
}

Admission marich::core::decideAdmission(const CoordinatorState& state, const WorkerView& workers,
                                        const Mode& target) {
  const bool hardwareMode = isCameraMode(target.kind) || isWorkerMode(target.kind);

  if (state.aiEnabled && hardwareMode)
    return Admission::RejectAiEnabled;

  if (target.kind == ModeKind::Rps && workers.presentationRunning)
    return Admission::RejectWorkerConflict;
  if (target.kind == ModeKind::Presentation && workers.rpsRunning)
    return Admission::RejectWorkerConflict;
  if (isCameraMode(target.kind) && workers.presentationRunning)
    return Admission::RejectWorkerConflict;

  if (target == state.active)
    return Admission::AlreadyActive;

  return Admission::Accept;
}
