#pragma once

/** @file  ModeCoordinator.hpp
 *  @brief Public API for marich::core::ModeCoordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Marich headers
#include "core/Admission.hpp"
#include "core/IsolatedSteps.hpp"
#include "core/Mode.hpp"
#include "core/Worker.hpp"
#include "io/CameraBackend.hpp"
#include "ui/MarshalledFace.hpp"

namespace marich {
  namespace camera {
    class CameraManager;
  } // namespace camera
  namespace io {
    class HardwareHandle;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class ServiceFactory;

    enum class RequestOutcome { Entered, AlreadyActive, Refused, Failed };

    const char* toString(RequestOutcome o);

    /// Copy of the coordinator state plus what its collaborators report.
    struct CoordinatorSnapshot {
      CoordinatorState state{};
      bool chatbotRunning{ false };
      bool rpsRunning{ false };
      bool presentationRunning{ false };
      bool cameraAcquired{ false };
      io::DetectorKind detector{ io::DetectorKind::None };
      bool shuttingDown{ false };
    };

    /**
 * @class ModeCoordinator
 * @brief Sole owner of "what the robot is doing right now".
 *
 *  * Every entry point serialises on one mutex; the IR thread (camera modes) and the
 *    UI thread (RPS, presentation, AI toggle, stop-all) may call concurrently.
 *  * A new mode's start sequence only runs after the previous mode is fully stopped.
 *  * Start failures are refusals (return value + log); stop paths never throw.
 *  * Face calls are posted to the UI executor through a MarshalledFace.
 */
    class ModeCoordinator {

    public:
      ModeCoordinator(io::HardwareHandle& hardware, camera::CameraManager& camera,
                      ui::FacePresenter& face, ui::Executor& ui, ServiceFactory& services,
                      std::shared_ptr<ErrorMonitor> errMonitor,
                      std::chrono::milliseconds workerGrace = Worker::kDefaultGrace);
      ~ModeCoordinator();

      //---public API------------------------------------------------------
      /// Admission check, stop the current mode, start \p target.
      RequestOutcome requestMode(const Mode& target);

      /// Idempotent: workers stopped, detectors stopped, motors stopped, LEDs off.
      void stopCurrentMode();

      /** Flip AI on/off. On: drains the current mode first, then releases the camera
       *  via the UI executor (if held) or starts the AI components directly.
       *  @returns the new aiEnabled value. */
      bool toggleAI();

      /// stopCurrentMode() plus device teardown; chains into AI start when AI is on.
      void releaseCameraCompletely();

      /// Idempotent terminal transition; never throws.
      void shutdown();

      /// One UI-thread display poll; `Idle` while the camera is being torn down.
      io::FrameEvent pollDisplay();

      /// Observe workers that ended on their own and fall back to Idle.
      void reapFinished();

      CoordinatorSnapshot snapshot() const;

      /// Invoked when the camera window asks to quit ('q').
      void setShutdownHandler(std::function<void()> cb) { shutdownHandler_ = std::move(cb); }

      /// Invoked after every stopCurrentMode() (Application prints the IR help there).
      void setStoppedHandler(std::function<void()> cb) { stoppedHandler_ = std::move(cb); }

      //---non-copyable-----------------------------------------------------
      ModeCoordinator(const ModeCoordinator&) = delete;
      ModeCoordinator& operator=(const ModeCoordinator&) = delete;

    private:
      WorkerView workerViewLocked() const;
      void reapFinishedLocked();

      void stopCurrentModeLocked();
      void stopWorkerLocked(Worker& worker);
      bool enterModeLocked(const Mode& target);
      void enterCameraModeLocked(const Mode& target);
      bool enterRpsLocked();
      bool enterPresentationLocked();
      void startAiComponentsLocked();
      void ensureAnimationsLocked();
      void releaseDeviceLocked();

      void report(const std::string& what);
      void reportAll(const std::vector<StepFailure>& failures);

      io::HardwareHandle& hardware_;
      camera::CameraManager& camera_;
      ui::Executor& ui_;
      ui::MarshalledFace face_;
      ServiceFactory& services_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      Worker chatbot_;
      Worker rps_;
      Worker presentation_;

      CoordinatorState state_{};
      std::atomic<bool> cameraShuttingDown_{ false };
      std::atomic<bool> shutdown_{ false };

      std::function<void()> shutdownHandler_{};
      std::function<void()> stoppedHandler_{};

      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace marich
