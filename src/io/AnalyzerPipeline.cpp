/* @file AnalyzerPipeline.cpp
 * @brief detector → analyzer bookkeeping and frame dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// Marich headers
#include "core/Logger.hpp"
#include "io/AnalyzerPipeline.hpp"
#include "io/ColorBlobAnalyzer.hpp"
#include "io/FaceAnalyzer.hpp"
#include "io/GestureAnalyzer.hpp"

using namespace marich::io;

void AnalyzerPipeline::registerAnalyzer(DetectorKind kind, AnalyzerMaker maker) {
  makers_[kind] = std::move(maker);
}

bool AnalyzerPipeline::hasAnalyzer(DetectorKind kind) const {
  auto it = makers_.find(kind);
  return it != makers_.end() && it->second;
}

void AnalyzerPipeline::start(DetectorKind kind, const DetectorParams& params) {
  stop(kind);

  std::unique_ptr<FrameAnalyzer> analyzer;
  if (hasAnalyzer(kind))
    analyzer = makers_[kind](params);
  if (!analyzer)
    marich::core::logging::get("camera")->warn(
        "[CAMERA] no {} analyzer registered; detector runs capture-only", toString(kind));
  running_[kind] = std::move(analyzer);
}

void AnalyzerPipeline::stop(DetectorKind kind) {
  auto it = running_.find(kind);
  if (it == running_.end())
    return;
  auto analyzer = std::move(it->second);
  running_.erase(it);
  if (analyzer)
    analyzer->reset();
}

void AnalyzerPipeline::stopAll() {
  auto log = marich::core::logging::get("camera");
  for (auto& [kind, analyzer] : running_) {
    if (!analyzer)
      continue;
    try {
      analyzer->reset();
    } catch (const std::exception& e) {
      log->warn("[CAMERA] {} reset: {}", toString(kind), e.what());
    }
  }
  running_.clear();
}

DetectorKind AnalyzerPipeline::process(const cv::Mat& bgr) {
  DetectorKind last = DetectorKind::None;
  for (auto& [kind, analyzer] : running_) {
    last = kind;
    if (!analyzer)
      continue;
    try {
      analyzer->analyze(bgr);
    } catch (const std::exception& e) {
      marich::core::logging::get("camera")->warn("[CAMERA] {} analyzer: {}", toString(kind),
                                                 e.what());
    }
  }
  return last;
}

std::optional<std::string> AnalyzerPipeline::label(DetectorKind kind) const {
  auto it = running_.find(kind);
  if (it == running_.end() || !it->second)
    return std::nullopt;
  return it->second->label();
}

void marich::io::registerBuiltinAnalyzers(AnalyzerPipeline& pipeline, HardwareHandle& hardware,
                                          const std::string& faceCascade) {
  pipeline.registerAnalyzer(DetectorKind::Color, [&hardware](const DetectorParams& p) {
    return std::make_unique<ColorBlobAnalyzer>(p.color, hardware);
  });
  pipeline.registerAnalyzer(DetectorKind::Face, [&hardware, faceCascade](const DetectorParams&) {
    return std::make_unique<FaceAnalyzer>(faceCascade, hardware);
  });
  pipeline.registerAnalyzer(DetectorKind::Gesture, [&hardware](const DetectorParams& p) {
    return std::make_unique<GestureAnalyzer>(p.actionsEnabled, hardware);
  });
}
