#pragma once
/** @file  FakeFace.hpp
 *  @brief FacePresenter that only records what it was asked to show.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "ui/FacePresenter.hpp"

namespace marich {
  namespace test {

    class FakeFace : public marich::ui::FacePresenter {
    public:
      using Emotion = marich::core::Emotion;

      void resume() override { record("resume", [this] { visible_ = true; }); }
      void suspend() override { record("suspend", [this] { visible_ = false; }); }

      void setEmotion(Emotion e) override {
        emotion_ = e;
        record(std::string("emotion ") + marich::core::toString(e), [] {});
      }
      Emotion currentEmotion() const override { return emotion_; }

      void startAnimationLoops() override { record("animations", [this] { ++animation_starts_; }); }

      void displayGameImage(const std::string& path) override {
        record("image " + path, [this, path] { image_ = path; });
      }
      void clearGameImage() override { record("clear image", [this] { image_.clear(); }); }

      void startTalking() override { record("talk", [this] { talking_ = true; }); }
      void stopTalking() override { record("quiet", [this] { talking_ = false; }); }

      //---test helpers-----------------------------------------------------
      std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_;
      }
      bool visible() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return visible_;
      }
      bool talking() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return talking_;
      }
      int animationStarts() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return animation_starts_;
      }
      std::string image() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return image_;
      }
      std::vector<Emotion> emotions() const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<Emotion> out;
        for (const auto& c : calls_)
          if (auto e = marich::core::emotionFromString(
                  c.rfind("emotion ", 0) == 0 ? c.substr(8) : std::string{}))
            out.push_back(*e);
        return out;
      }
      void clearCalls() {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.clear();
      }

    private:
      template <typename F>
      void record(std::string call, F&& apply) {
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.push_back(std::move(call));
        apply();
      }

      mutable std::mutex mtx_;
      std::vector<std::string> calls_;
      std::atomic<Emotion> emotion_{ Emotion::Neutral };
      bool visible_ = false;
      bool talking_ = false;
      int animation_starts_ = 0;
      std::string image_;
    };

  } // namespace test
} // namespace marich
