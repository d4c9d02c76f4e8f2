#pragma once
/** @file  FacePresenter.hpp
 *  @brief Boundary of the face rendering / animation service.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/Emotion.hpp"

namespace marich::ui {

  /**
 * @class FacePresenter
 * @brief Operations the coordinator and services consume.
 *
 *  * Implementations are driven from the UI thread; wrap them in MarshalledFace
 *    before handing them to any other thread.
 *  * `currentEmotion()` is safe to read from any thread.
 */
  class FacePresenter {
  public:
    virtual ~FacePresenter() = default;

    virtual void resume() = 0;  ///< show the face
    virtual void suspend() = 0; ///< hide the face (panel off)

    virtual void setEmotion(core::Emotion e) = 0;
    virtual core::Emotion currentEmotion() const = 0;

    /// Idempotent.
    virtual void startAnimationLoops() = 0;

    virtual void displayGameImage(const std::string& path) = 0;
    virtual void clearGameImage() = 0;

    virtual void startTalking() = 0;
    virtual void stopTalking() = 0;
  };

} // namespace marich::ui
