#pragma once
/** @file  MarshalledFace.hpp
 *  @brief FacePresenter proxy that posts every mutation onto the UI executor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "ui/Executor.hpp"
#include "ui/FacePresenter.hpp"

namespace marich::ui {

  /**
 * @class MarshalledFace
 * @brief Fire-and-forget: a call returns before the change reaches the panel, so a
 *        `currentEmotion()` read straight after `setEmotion()` may still see the old value.
 *
 *  * Both referenced objects must outlive the proxy and every task it posted.
 */
  class MarshalledFace : public FacePresenter {
  public:
    MarshalledFace(FacePresenter& inner, Executor& executor) : inner_(inner), executor_(executor) {}

    void resume() override {
      executor_.post([this] { inner_.resume(); });
    }
    void suspend() override {
      executor_.post([this] { inner_.suspend(); });
    }
    void setEmotion(core::Emotion e) override {
      executor_.post([this, e] { inner_.setEmotion(e); });
    }
    core::Emotion currentEmotion() const override { return inner_.currentEmotion(); }

    void startAnimationLoops() override {
      executor_.post([this] { inner_.startAnimationLoops(); });
    }
    void displayGameImage(const std::string& path) override {
      executor_.post([this, path] { inner_.displayGameImage(path); });
    }
    void clearGameImage() override {
      executor_.post([this] { inner_.clearGameImage(); });
    }
    void startTalking() override {
      executor_.post([this] { inner_.startTalking(); });
    }
    void stopTalking() override {
      executor_.post([this] { inner_.stopTalking(); });
    }

  private:
    FacePresenter& inner_;
    Executor& executor_;
  };

} // namespace marich::ui
