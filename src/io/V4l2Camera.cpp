/* @file V4l2Camera.cpp
 * @brief OpenCV V4L2 capture (open / FOURCC / frame size / waitAny) and detector dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <filesystem>

// Marich headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/V4l2Camera.hpp"

namespace fs = std::filesystem;

using namespace marich::io;
using marich::core::CameraUnavailable;

V4l2Camera::V4l2Camera(CameraSettings settings, HardwareHandle& hardware)
    : settings_(std::move(settings)) {
  registerBuiltinAnalyzers(analyzers_, hardware, settings_.faceCascade);
}

V4l2Camera::~V4l2Camera() { releaseAll(); }

void V4l2Camera::open() {
  auto log = marich::core::logging::get("camera");
  if (opened())
    return;

  std::error_code ec;
  if (!fs::exists(settings_.device, ec))
    throw CameraUnavailable("[CAMERA] device node " + settings_.device + " does not exist");

  cv::VideoCapture cap;
  try {
    cap.open(settings_.device, cv::CAP_V4L2);
  } catch (const cv::Exception& e) {
    throw CameraUnavailable("[CAMERA] cannot open " + settings_.device + ": " + e.what());
  }
  if (!cap.isOpened())
    throw CameraUnavailable("[CAMERA] cannot open " + settings_.device +
                            " (in use by another process or not a capture device)");

  if (settings_.fourcc.size() == 4) {
    const auto& f = settings_.fourcc;
    cap.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc(f[0], f[1], f[2], f[3]));
  }
  cap.set(cv::CAP_PROP_FRAME_WIDTH, settings_.width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, settings_.height);

  // a node that opens but never delivers is as good as missing
  cv::Mat first;
  if (!cap.read(first) || first.empty()) {
    cap.release();
    throw CameraUnavailable("[CAMERA] " + settings_.device + " delivers no frames");
  }

  streams_.clear();
  streams_.push_back(std::move(cap));
  sequence_ = 0;
  log->info("[CAMERA] {} streaming {}x{} ({})", settings_.device, first.cols, first.rows,
            settings_.fourcc);
}

void V4l2Camera::registerAnalyzer(DetectorKind kind, AnalyzerMaker maker) {
  analyzers_.registerAnalyzer(kind, std::move(maker));
}

void V4l2Camera::startColorTracking(const std::string& colorName) {
  DetectorParams params;
  params.color = colorName;
  start(DetectorKind::Color, params);
}

void V4l2Camera::startFaceTracking() { start(DetectorKind::Face, {}); }

void V4l2Camera::startGestureFollowing(bool actionsEnabled) {
  DetectorParams params;
  params.actionsEnabled = actionsEnabled;
  start(DetectorKind::Gesture, params);
}

void V4l2Camera::startObjectRecognition(const std::string& modelPath,
                                        const std::string& labelPath) {
  DetectorParams params;
  params.modelPath = modelPath;
  params.labelPath = labelPath;
  start(DetectorKind::Object, params);
}

void V4l2Camera::startLicensePlateRecognition(const std::string& fontPath,
                                              const std::string& sensitivity) {
  DetectorParams params;
  params.fontPath = fontPath;
  params.sensitivity = sensitivity;
  start(DetectorKind::Plate, params);
}

void V4l2Camera::releaseAll() {
  analyzers_.stopAll();
  if (streams_.empty())
    return;

  for (auto& s : streams_)
    s.release();
  streams_.clear();
  frame_.release();
  marich::core::logging::get("camera")->info("[CAMERA] {} released", settings_.device);
}

FrameEvent V4l2Camera::pollFrame() {
  if (!opened())
    return FrameEvent::idle();

  std::vector<int> ready;
  try {
    if (!cv::VideoCapture::waitAny(streams_, ready, kPollTimeoutNs) || ready.empty())
      return FrameEvent::idle();
    if (!streams_.front().retrieve(frame_) || frame_.empty())
      return FrameEvent::idle();
  } catch (const cv::Exception& e) {
    marich::core::logging::get("camera")->debug("[CAMERA] capture: {}", e.what());
    return FrameEvent::idle();
  }

  FrameEvent ev;
  ev.kind = FrameEvent::Kind::Frame;
  ev.sequence = ++sequence_;
  ev.width = frame_.cols;
  ev.height = frame_.rows;
  ev.detector = analyzers_.process(frame_);
  return ev;
}

std::optional<std::string> V4l2Camera::latestGesture() const {
  return analyzers_.label(DetectorKind::Gesture);
}

void V4l2Camera::start(DetectorKind kind, const DetectorParams& params) {
  if (!opened())
    throw CameraUnavailable("[CAMERA] device not open");
  analyzers_.start(kind, params);
}
