#pragma once
/** @file  OledFace.hpp
 *  @brief FacePresenter that draws Marich's face on the SSD1306 panel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <string>

#include "ui/FacePresenter.hpp"

namespace marich {
  namespace io {
    class OLEDDisplay;
  } // namespace io

  namespace ui {

    /**
 * @class OledFace
 * @brief Eyes + mouth per emotion, blinking and a talking mouth driven by `tick()`.
 *
 *  * UI thread only, except `currentEmotion()`.
 *  * Suspended (panel off) until the first `resume()`.
 *  * A game image is shown as an icon chosen from the file name (rock / paper / scissors).
 */
    class OledFace : public FacePresenter {
    public:
      using Clock = std::chrono::steady_clock;

      static constexpr std::chrono::milliseconds kBlinkPeriod{ 4000 };
      static constexpr std::chrono::milliseconds kBlinkLength{ 150 };

      explicit OledFace(io::OLEDDisplay& display);

      void resume() override;
      void suspend() override;
      void setEmotion(core::Emotion e) override;
      core::Emotion currentEmotion() const override { return emotion_.load(); }
      void startAnimationLoops() override;
      void displayGameImage(const std::string& path) override;
      void clearGameImage() override;
      void startTalking() override;
      void stopTalking() override;

      /// Advance blink / mouth animation and redraw if visible.
      void tick(Clock::time_point now);

      bool visible() const { return visible_; }
      bool animating() const { return animating_; }
      bool talking() const { return talking_; }
      const std::string& gameImage() const { return gameImage_; }

    private:
      void redraw();
      void drawEyes(bool closed);
      void drawMouth();
      void drawGameIcon();

      io::OLEDDisplay& display_;
      std::atomic<core::Emotion> emotion_{ core::Emotion::Neutral };
      bool visible_{ false };
      bool animating_{ false };
      bool talking_{ false };
      bool blinking_{ false };
      int mouthPhase_{ 0 };
      std::string gameImage_{};
      Clock::time_point nextBlink_{};
    };

  } // namespace ui
} // namespace marich
