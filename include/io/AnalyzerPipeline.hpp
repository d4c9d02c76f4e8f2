#pragma once
/** @file  AnalyzerPipeline.hpp
 *  @brief Which FrameAnalyzer runs for which detector, and the per-frame dispatch.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "io/CameraBackend.hpp"
#include "io/FrameAnalyzer.hpp"

namespace marich::io {

  class HardwareHandle;

  /**
 * @class AnalyzerPipeline
 * @brief Makers are registered per DetectorKind; `start()` builds the analyzer from its
 *        maker, `stop()` resets and drops it.
 *
 *  * A detector with no registered maker still starts and reports itself active; it
 *    just captures frames.
 *  * One analyzer throwing in `process()` is logged and never stops the others.
 */
  class AnalyzerPipeline {
  public:
    using AnalyzerMaker = std::function<std::unique_ptr<FrameAnalyzer>(const DetectorParams&)>;

    /// Install (or replace) the factory used when \p kind starts.
    void registerAnalyzer(DetectorKind kind, AnalyzerMaker maker);
    bool hasAnalyzer(DetectorKind kind) const;

    /// Restarts \p kind if it already runs. Maker exceptions propagate.
    void start(DetectorKind kind, const DetectorParams& params);
    void stop(DetectorKind kind);
    void stopAll();

    bool running(DetectorKind kind) const { return running_.count(kind) != 0; }

    /// Feeds \p bgr to every running analyzer. @returns the detector that saw it last.
    DetectorKind process(const cv::Mat& bgr);

    std::optional<std::string> label(DetectorKind kind) const;

  private:
    std::map<DetectorKind, AnalyzerMaker> makers_;
    std::map<DetectorKind, std::unique_ptr<FrameAnalyzer>> running_;
  };

  /// Colour, face and gesture analyzers driving \p hardware.
  void registerBuiltinAnalyzers(AnalyzerPipeline& pipeline, HardwareHandle& hardware,
                                const std::string& faceCascade);

} // namespace marich::io
