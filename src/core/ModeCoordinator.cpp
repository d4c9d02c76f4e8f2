/* @file ModeCoordinator.cpp
 * @brief mode admission, stop-before-start transitions, AI toggle and teardown
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <memory>
#include <stdexcept>

// Marich headers
#include "camera/CameraManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/CancelSignal.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/ModeCoordinator.hpp"
#include "core/ServiceFactory.hpp"
#include "io/HardwareHandle.hpp"
#include "services/Service.hpp"

using namespace marich::core;
using marich::camera::DetectorRequest;
using marich::io::DetectorKind;
using marich::io::LedColor;

namespace {

  DetectorKind detectorFor(ModeKind k) {
    switch (k) {
    case ModeKind::Color:
      return DetectorKind::Color;
    case ModeKind::Face:
      return DetectorKind::Face;
    case ModeKind::Gesture:
      return DetectorKind::Gesture;
    case ModeKind::Object:
      return DetectorKind::Object;
    case ModeKind::Plate:
      return DetectorKind::Plate;
    default:
      return DetectorKind::None;
    }
  }

  // LED colour shown while a camera mode runs
  LedColor ledFor(const Mode& m) {
    switch (m.kind) {
    case ModeKind::Color:
      return marich::io::ledForTrackedColor(m.color);
    case ModeKind::Face:
    case ModeKind::Gesture:
      return marich::io::ledForEmotion(Emotion::Happy);
    default:
      return marich::io::ledForEmotion(Emotion::Neutral);
    }
  }

  Emotion emotionFor(const Mode& m) {
    return (m.kind == ModeKind::Object || m.kind == ModeKind::Plate) ? Emotion::Neutral
                                                                     : Emotion::Happy;
  }

  // Warms the conversation backend on the chatbot thread, then hands over to the chatbot loop.
  class PreloadingChatbot : public marich::services::Service {
  public:
    PreloadingChatbot(ServiceFactory& services, std::unique_ptr<marich::services::Service> chatbot,
                      std::shared_ptr<ErrorMonitor> monitor)
        : services_(services), chatbot_(std::move(chatbot)), monitor_(std::move(monitor)) {
      if (!chatbot_)
        throw std::invalid_argument("[AI] service factory returned no chatbot");
    }

    void run(const CancelSignal& cancel) override {
      auto log = logging::get("chatbot");
      const auto failures = runIsolated(
          { { "conversation preload", [&] { services_.preloadConversation(cancel); } } }, *log);
      if (monitor_)
        for (const auto& f : failures)
          monitor_->notifyFailure(f.step + ": " + f.what);

      if (!cancel.requested())
        chatbot_->run(cancel);
    }

  private:
    ServiceFactory& services_;
    std::unique_ptr<marich::services::Service> chatbot_;
    std::shared_ptr<ErrorMonitor> monitor_;
  };

} // namespace

const char* marich::core::toString(RequestOutcome o) {
  switch (o) {
  case RequestOutcome::Entered:
    return "Entered";
  case RequestOutcome::AlreadyActive:
    return "AlreadyActive";
  case RequestOutcome::Refused:
    return "Refused";
  case RequestOutcome::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

ModeCoordinator::ModeCoordinator(io::HardwareHandle& hardware, camera::CameraManager& camera,
                                 ui::FacePresenter& face, ui::Executor& ui,
                                 ServiceFactory& services, std::shared_ptr<ErrorMonitor> errMonitor,
                                 std::chrono::milliseconds workerGrace)
    : hardware_(hardware), camera_(camera), ui_(ui), face_(face, ui), services_(services),
      errorMonitor_(std::move(errMonitor)), chatbot_("chatbot", workerGrace),
      rps_("rps", workerGrace), presentation_("presentation", workerGrace) {}

ModeCoordinator::~ModeCoordinator() { shutdown(); }

//---public API-----------------------------------------------------------

RequestOutcome ModeCoordinator::requestMode(const Mode& target) {
  auto log = logging::get("coordinator");
  if (shutdown_) {
    log->warn("[MODE] Ignoring {} request: shutting down", describe(target));
    return RequestOutcome::Refused;
  }

  std::lock_guard<std::mutex> lock(mtx_);
  reapFinishedLocked();

  switch (decideAdmission(state_, workerViewLocked(), target)) {
  case Admission::RejectAiEnabled:
    log->warn("[MODE] Cannot start {} while AI is enabled. Disable AI first.", describe(target));
    return RequestOutcome::Refused;
  case Admission::RejectWorkerConflict:
    log->warn("[MODE] Cannot start {} while {} is running.", describe(target),
              presentation_.running() ? "the presentation" : "the RPS game");
    return RequestOutcome::Refused;
  case Admission::AlreadyActive:
    log->info("[MODE] {} already active", describe(target));
    return RequestOutcome::AlreadyActive;
  case Admission::Accept:
    break;
  }

  stopCurrentModeLocked();
  if (target.kind == ModeKind::Idle)
    return RequestOutcome::Entered;

  log->info("[MODE] Starting {}", describe(target));
  if (!enterModeLocked(target)) {
    // a partial start may have left a detector running or the face up
    stopCurrentModeLocked();
    return RequestOutcome::Failed;
  }

  state_.active = target;
  return RequestOutcome::Entered;
}

void ModeCoordinator::stopCurrentMode() {
  std::lock_guard<std::mutex> lock(mtx_);
  reapFinishedLocked();
  stopCurrentModeLocked();
}

bool ModeCoordinator::toggleAI() {
  auto log = logging::get("coordinator");
  if (shutdown_)
    return false;

  std::lock_guard<std::mutex> lock(mtx_);
  reapFinishedLocked();

  if (!state_.aiEnabled) {
    log->info("[AI] Enabling AI - releasing camera if active and starting face/chatbot...");
    // drain while aiEnabled is still false so no hardware mode is ever seen next to AI
    stopCurrentModeLocked();
    state_.aiEnabled = true;

    if (camera_.acquired())
      ui_.postDelayed(std::chrono::milliseconds{ 10 }, [this] { releaseCameraCompletely(); });
    else
      startAiComponentsLocked();
    return true;
  }

  log->info("[AI] Disabling AI - stopping face/chatbot only...");
  stopWorkerLocked(chatbot_);
  state_.aiEnabled = false;
  reportAll(runIsolated({ { "face suspend", [this] { face_.suspend(); } },
                          { "face neutral", [this] { face_.setEmotion(Emotion::Neutral); } },
                          { "LED off", [this] { hardware_.setLED(LedColor::Off); } } },
                        *log));
  return false;
}

void ModeCoordinator::releaseCameraCompletely() {
  auto log = logging::get("coordinator");
  if (shutdown_)
    return;

  std::lock_guard<std::mutex> lock(mtx_);
  reapFinishedLocked();

  log->info("[CAMERA] Releasing camera completely...");
  stopCurrentModeLocked();
  releaseDeviceLocked();
  log->info("[CAMERA] Camera completely released.");

  if (state_.aiEnabled)
    startAiComponentsLocked();
}

void ModeCoordinator::shutdown() {
  bool expected = false;
  if (!shutdown_.compare_exchange_strong(expected, true))
    return;

  auto log = logging::get("coordinator");
  log->info("[SYS] Shutting down...");
  try {
    std::lock_guard<std::mutex> lock(mtx_);

    reportAll(runIsolated({ { "IR receiver off", [this] { hardware_.setIRReceiver(false); } } },
                          *log));
    stopWorkerLocked(chatbot_);
    stopWorkerLocked(presentation_);
    stopWorkerLocked(rps_);
    releaseDeviceLocked();

    reportAll(runIsolated({ { "motor stop", [this] { hardware_.motorStop(); } },
                            { "LED off", [this] { hardware_.setLED(LedColor::Off); } },
                            { "face suspend", [this] { face_.suspend(); } } },
                          *log));
    state_.active = Mode::idle();
    state_.aiEnabled = false;
    log->info("[SYS] Shutdown complete.");
  } catch (const std::exception& e) {
    log->critical("[SYS] Shutdown teardown failed: {}", e.what());
  }
}

marich::io::FrameEvent ModeCoordinator::pollDisplay() {
  if (cameraShuttingDown_ || shutdown_)
    return io::FrameEvent::idle();

  {
    // never wait behind a transition running on the IR thread
    std::unique_lock<std::mutex> lock(mtx_, std::try_to_lock);
    if (lock.owns_lock())
      reapFinishedLocked();
  }

  auto ev = camera_.pollFrame();
  if (ev.kind == io::FrameEvent::Kind::Key && ev.key == 'q') {
    logging::get("coordinator")->info("[KEY] q pressed - shutting down");
    if (shutdownHandler_)
      shutdownHandler_();
  }
  return ev;
}

void ModeCoordinator::reapFinished() {
  std::lock_guard<std::mutex> lock(mtx_);
  reapFinishedLocked();
}

CoordinatorSnapshot ModeCoordinator::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  CoordinatorSnapshot snap;
  snap.state = state_;
  snap.chatbotRunning = chatbot_.running();
  snap.rpsRunning = rps_.running();
  snap.presentationRunning = presentation_.running();
  snap.cameraAcquired = camera_.acquired();
  snap.detector = camera_.activeDetector();
  snap.shuttingDown = shutdown_;
  return snap;
}

//---internals (mtx_ held)------------------------------------------------

WorkerView ModeCoordinator::workerViewLocked() const {
  return WorkerView{ rps_.running(), presentation_.running() };
}

void ModeCoordinator::reapFinishedLocked() {
  auto log = logging::get("coordinator");

  if (chatbot_.reap())
    log->info("[AI] Chatbot session ended; toggle AI to start a new one.");

  bool fallBack = false;
  for (auto* w : { &rps_, &presentation_ }) {
    if (!w->reap())
      continue;
    log->info("[MODE] {} finished on its own", w->name());
    if ((w == &rps_ && state_.active.kind == ModeKind::Rps) ||
        (w == &presentation_ && state_.active.kind == ModeKind::Presentation))
      fallBack = true;
  }
  if (fallBack)
    stopCurrentModeLocked();
}

void ModeCoordinator::stopCurrentModeLocked() {
  auto log = logging::get("coordinator");
  log->info("[MODE] Stopping all camera modes...");

  stopWorkerLocked(rps_);
  stopWorkerLocked(presentation_);

  const bool ai = state_.aiEnabled;
  reportAll(runIsolated({ { "camera detectors stop", [this] { camera_.stopAll(); } },
                          { "motor stop", [this] { hardware_.motorStop(); } },
                          { "LED off", [this] { hardware_.setLED(LedColor::Off); } },
                          { ai ? "face neutral" : "face suspend",
                            [this, ai] {
                              if (ai)
                                face_.setEmotion(Emotion::Neutral);
                              else
                                face_.suspend();
                            } } },
                        *log));

  state_.active = Mode::idle();
  log->info("[MODE] All camera modes stopped.");
  if (stoppedHandler_)
    stoppedHandler_();
}

void ModeCoordinator::stopWorkerLocked(Worker& worker) {
  const auto result = worker.stop();
  if (result == StopResult::NotRunning)
    return;

  auto log = logging::get("coordinator");
  if (result == StopResult::Leaked) {
    log->warn("[MODE] {} did not exit within the grace period; continuing without it",
              worker.name());
    report(worker.name() + " worker leaked after join timeout");
  } else {
    log->info("[MODE] {} stopped", worker.name());
  }
}

bool ModeCoordinator::enterModeLocked(const Mode& target) {
  auto log = logging::get("coordinator");
  try {
    if (isCameraMode(target.kind)) {
      enterCameraModeLocked(target);
      return true;
    }
    if (target.kind == ModeKind::Rps)
      return enterRpsLocked();
    if (target.kind == ModeKind::Presentation)
      return enterPresentationLocked();

    log->error("[MODE] No start sequence for {}", describe(target));
    return false;
  } catch (const CameraUnavailable& e) {
    log->error("[ERROR] Camera unavailable: {}", e.what());
    report(e.what());
  } catch (const AssetMissing& e) {
    log->error("{}", e.what());
    report(e.what());
  } catch (const std::exception& e) {
    log->error("[ERROR] Could not start {}: {}", describe(target), e.what());
    report(e.what());
  }
  return false;
}

void ModeCoordinator::enterCameraModeLocked(const Mode& target) {
  DetectorRequest request{ detectorFor(target.kind), target.color, target.actionsEnabled };

  // refuse before touching the device
  camera_.requireAssets(request);
  camera_.acquire();
  camera_.startDetector(request);

  auto log = logging::get("coordinator");
  if (state_.aiEnabled)
    face_.setEmotion(emotionFor(target));
  reportAll(runIsolated(
      { { "mode LED", [this, &target] { hardware_.setLED(ledFor(target)); } } }, *log));
}

bool ModeCoordinator::enterRpsLocked() {
  auto log = logging::get("rps");
  try {
    camera_.acquire();
  } catch (const CameraUnavailable& e) {
    log->error("[RPS] Cannot start game - camera unavailable: {}", e.what());
    report(e.what());
    return false;
  }

  // gesture detection without robot movement
  try {
    camera_.startDetector(DetectorRequest{ DetectorKind::Gesture, {}, false });
  } catch (const std::exception& e) {
    log->warn("[RPS] Could not start gesture following: {}", e.what());
  }

  ensureAnimationsLocked();
  face_.resume();

  if (!rps_.start(services_.makeRpsGame(camera_))) {
    log->error("[RPS] Previous game task is still alive; not starting another");
    return false;
  }
  log->info("[RPS] Rock Paper Scissors game thread launched.");
  return true;
}

bool ModeCoordinator::enterPresentationLocked() {
  auto log = logging::get("presentation");

  ensureAnimationsLocked();
  face_.resume();

  if (!presentation_.start(services_.makePresentation())) {
    log->error("[Presentation] Previous presentation task is still alive; not starting another");
    return false;
  }
  log->info("[Presentation] Presentation thread launched.");
  return true;
}

void ModeCoordinator::startAiComponentsLocked() {
  auto log = logging::get("chatbot");
  log->info("[AI] Starting AI components...");

  if (!chatbot_.running()) {
    const bool suppressGreeting = state_.hasGreetedBefore;
    try {
      auto chatbot = std::make_unique<PreloadingChatbot>(
          services_, services_.makeChatbot(suppressGreeting), errorMonitor_);
      if (chatbot_.start(std::move(chatbot))) {
        state_.hasGreetedBefore = true;
        log->info("[AI] Chatbot thread launched.");
      } else {
        log->error("[AI] Previous chatbot task is still alive; not starting another");
      }
    } catch (const std::exception& e) {
      log->error("[AI] Could not start chatbot: {}", e.what());
      report(e.what());
    }
  }

  ensureAnimationsLocked();
  reportAll(runIsolated(
      { { "face resume", [this] { face_.resume(); } },
        { "face happy", [this] { face_.setEmotion(Emotion::Happy); } },
        { "AI LED", [this] { hardware_.setLED(io::ledForEmotion(Emotion::Happy)); } } },
      *log));
}

void ModeCoordinator::ensureAnimationsLocked() {
  if (state_.animationsStarted)
    return;
  face_.startAnimationLoops();
  state_.animationsStarted = true;
  logging::get("coordinator")->info("[LAZY] Face animations started.");
}

void ModeCoordinator::releaseDeviceLocked() {
  cameraShuttingDown_ = true;
  camera_.release();
  cameraShuttingDown_ = false;
}

void ModeCoordinator::report(const std::string& what) {
  if (errorMonitor_)
    errorMonitor_->notifyFailure(what);
}

void ModeCoordinator::reportAll(const std::vector<StepFailure>& failures) {
  for (const auto& f : failures)
    report(f.step + ": " + f.what);
}
