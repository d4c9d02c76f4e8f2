#pragma once
/** @file  CameraManager.hpp
 *  @brief Lazy owner of the shared camera device and its detection sub-modes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Marich headers
#include "io/CameraBackend.hpp"

namespace marich {
  namespace camera {

    /// Model / font files the object and plate detectors load.
    struct DetectorAssets {
      std::string objectModel{};
      std::string objectLabels{};
      std::string plateFont{};
      std::string plateSensitivity{ "low" };
    };

    struct DetectorRequest {
      io::DetectorKind kind{ io::DetectorKind::None };
      std::string color{};          ///< Color only
      bool actionsEnabled{ true };  ///< Gesture only (false while the RPS game reads gestures)
    };

    /// Read-only camera capability handed to the RPS game.
    class GestureSource {
    public:
      virtual ~GestureSource() = default;
      virtual std::optional<std::string> latestGesture() const = 0;
    };

    /**
 * @class CameraManager
 * @brief Creates the backend on `acquire()`, destroys it on `release()`.
 *
 *  * One mutex guards the backend; `pollFrame()` only try-locks so the UI thread never
 *    waits behind a detector start on the IR thread.
 *  * Stop paths are isolated per detector; start paths throw
 *    (`core::CameraUnavailable`, `core::AssetMissing`, backend errors).
 *  * Only the ModeCoordinator holds a CameraManager.
 */
    class CameraManager : public GestureSource {
    public:
      /// Opens a device and returns its backend; throws core::CameraUnavailable.
      using BackendFactory = std::function<std::unique_ptr<io::CameraBackend>()>;

      CameraManager(BackendFactory factory, DetectorAssets assets);
      ~CameraManager() override; ///< release()

      //---public API------------------------------------------------------
      /** Open the device if not already held. On failure the manager stays
       *  uninitialised (a later call retries) and the exception propagates. */
      void acquire();

      /// Start exactly one detector. Requires acquire(); validates assets first.
      void startDetector(const DetectorRequest& request);

      /// Absolute paths of the asset files \p request needs but the filesystem lacks.
      std::vector<std::string> missingAssets(const DetectorRequest& request) const;

      /// Throws core::AssetMissing (with remediation text) when missingAssets() is non-empty.
      void requireAssets(const DetectorRequest& request) const;

      /// Stop every detector; one failing stop never blocks the others.
      void stopAll();

      /// stopAll() then drop the device. No-op if never acquired.
      void release();

      /// Non-blocking; `Idle` when no device, a release is running, or the lock is busy.
      io::FrameEvent pollFrame();

      bool acquired() const;
      io::DetectorKind activeDetector() const;
      std::optional<std::string> latestGesture() const override;

      const DetectorAssets& assets() const { return assets_; }

      //---non-copyable-----------------------------------------------------
      CameraManager(const CameraManager&) = delete;
      CameraManager& operator=(const CameraManager&) = delete;

    private:
      void stopAllLocked();
      std::string remediation(const DetectorRequest& request,
                              const std::vector<std::string>& missing) const;

      BackendFactory factory_;
      DetectorAssets assets_;
      std::unique_ptr<io::CameraBackend> backend_;
      io::DetectorKind active_{ io::DetectorKind::None };
      std::atomic<bool> releasing_{ false };
      mutable std::mutex mtx_;
    };

  } // namespace camera
} // namespace marich
