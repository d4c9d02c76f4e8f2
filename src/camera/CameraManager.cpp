/* @file CameraManager.cpp
 * @brief camera device lifetime + detector demultiplexing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>

// Marich headers
#include "camera/CameraManager.hpp"
#include "core/Errors.hpp"
#include "core/IsolatedSteps.hpp"
#include "core/Logger.hpp"

namespace fs = std::filesystem;

using namespace marich::camera;
using marich::io::DetectorKind;
using marich::io::FrameEvent;

CameraManager::CameraManager(BackendFactory factory, DetectorAssets assets)
    : factory_(std::move(factory)), assets_(std::move(assets)) {
  if (!factory_)
    throw std::invalid_argument("[CameraManager] backend factory is empty");
}

CameraManager::~CameraManager() { release(); }

void CameraManager::acquire() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (backend_)
    return;

  auto log = core::logging::get("camera");
  auto backend = factory_(); // throws CameraUnavailable, manager stays uninitialised
  if (!backend)
    throw core::CameraUnavailable("[CAMERA] backend factory returned no device");

  backend_ = std::move(backend);
  active_ = DetectorKind::None;
  log->info("[LAZY] Camera subsystem initialized.");
}

void CameraManager::startDetector(const DetectorRequest& request) {
  requireAssets(request);

  std::lock_guard<std::mutex> lock(mtx_);
  if (!backend_)
    throw core::CameraUnavailable("[CAMERA] startDetector before acquire()");

  switch (request.kind) {
  case DetectorKind::Color:
    backend_->startColorTracking(request.color);
    break;
  case DetectorKind::Face:
    backend_->startFaceTracking();
    break;
  case DetectorKind::Gesture:
    backend_->startGestureFollowing(request.actionsEnabled);
    break;
  case DetectorKind::Object:
    backend_->startObjectRecognition(assets_.objectModel, assets_.objectLabels);
    break;
  case DetectorKind::Plate:
    backend_->startLicensePlateRecognition(assets_.plateFont, assets_.plateSensitivity);
    break;
  default:
    throw std::invalid_argument("[CameraManager] no detector for kind " +
                                std::string(io::toString(request.kind)));
  }
  active_ = request.kind;
  core::logging::get("camera")->info("[CAMERA] {} detector started", io::toString(request.kind));
}

std::vector<std::string> CameraManager::missingAssets(const DetectorRequest& request) const {
  std::vector<std::string> required;
  if (request.kind == DetectorKind::Object)
    required = { assets_.objectModel, assets_.objectLabels };
  else if (request.kind == DetectorKind::Plate)
    required = { assets_.plateFont };

  std::vector<std::string> missing;
  for (const auto& path : required) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec))
      missing.push_back(path.empty() ? std::string("<unconfigured>")
                                     : fs::absolute(path, ec).string());
  }
  return missing;
}

void CameraManager::requireAssets(const DetectorRequest& request) const {
  if (auto missing = missingAssets(request); !missing.empty())
    throw core::AssetMissing(remediation(request, missing), std::move(missing));
}

void CameraManager::stopAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  stopAllLocked();
}

void CameraManager::release() {
  releasing_ = true;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (backend_) {
      auto log = core::logging::get("camera");
      log->info("[CAMERA] Releasing camera completely...");
      stopAllLocked();
      core::runIsolated({ { "camera release", [this] { backend_->releaseAll(); } } }, *log);
      backend_.reset();
      log->info("[CAMERA] Camera resources released");
    }
    active_ = DetectorKind::None;
  }
  releasing_ = false;
}

FrameEvent CameraManager::pollFrame() {
  if (releasing_)
    return FrameEvent::idle();

  std::unique_lock<std::mutex> lock(mtx_, std::try_to_lock);
  if (!lock.owns_lock() || !backend_)
    return FrameEvent::idle();

  try {
    return backend_->pollFrame();
  } catch (const std::exception& e) {
    core::logging::get("camera")->debug("[CAMERA] pollFrame: {}", e.what());
    return FrameEvent::idle();
  }
}

bool CameraManager::acquired() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return backend_ != nullptr;
}

DetectorKind CameraManager::activeDetector() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return active_;
}

std::optional<std::string> CameraManager::latestGesture() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!backend_)
    return std::nullopt;
  return backend_->latestGesture();
}

void CameraManager::stopAllLocked() {
  if (!backend_)
    return;

  auto* b = backend_.get();
  core::runIsolated({ { "color tracker stop", [b] { b->stopColorTracking(); } },
                      { "face tracker stop", [b] { b->stopFaceTracking(); } },
                      { "gesture tracker stop", [b] { b->stopGestureFollowing(); } },
                      { "object recognition stop", [b] { b->stopObjectRecognition(); } },
                      { "license plate stop", [b] { b->stopLicensePlateRecognition(); } } },
                    *core::logging::get("camera"));
  active_ = DetectorKind::None;
}

std::string CameraManager::remediation(const DetectorRequest& request,
                                       const std::vector<std::string>& missing) const {
  std::ostringstream os;
  os << "[CAMERA] " << io::toString(request.kind) << " detector resources missing:";
  for (const auto& m : missing)
    os << "\n  Missing: " << m;

  if (request.kind == DetectorKind::Object) {
    os << "\n  Expected directory layout:"
       << "\n    04.Tensorflow_object_recognition/"
       << "\n      ssdlite_mobilenet_v2_coco_2018_05_09/frozen_inference_graph.pb"
       << "\n      data/mscoco_label_map.pbtxt"
       << "\n  Download the COCO SSD Lite model from the TensorFlow 1 detection model zoo"
       << "\n  (heavy for a Raspberry Pi; consider skipping object mode).";
  } else if (request.kind == DetectorKind::Plate) {
    os << "\n  Expected: 07.Camera-Based_License_plate_recognition/platech.ttf"
       << "\n  (set assets.plate_font in the config to its location).";
  }
  return os.str();
}
