/* @file ui_test.cpp
 * @brief UI task loop, marshalled face proxy and the OLED face renderer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Marich headers
#include "io/OLEDDisplay.hpp"
#include "ui/MarshalledFace.hpp"
#include "ui/OledFace.hpp"
#include "ui/UiLoop.hpp"

#include "FakeFace.hpp"
#include "FakeI2cBus.hpp"
#include "ManualExecutor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace marich::ui;
using namespace marich::test;
using marich::core::Emotion;
using ::testing::ElementsAre;
using namespace std::chrono_literals;

//---UiLoop ------------------------------------------------------------------

TEST(ui_loop, run_pending_keeps_posting_order) {
  UiLoop loop;
  std::vector<int> order;
  loop.post([&] { order.push_back(1); });
  loop.post([&] { order.push_back(2); });
  loop.post([&] { order.push_back(3); });

  EXPECT_EQ(loop.runPending(), 3u);
  EXPECT_THAT(order, ElementsAre(1, 2, 3));
  EXPECT_EQ(loop.pendingTasks(), 0u);
}

TEST(ui_loop, delayed_tasks_wait_for_their_time) {
  UiLoop loop;
  int ran = 0;
  loop.postDelayed(10s, [&] { ++ran; });
  loop.post(nullptr);

  EXPECT_EQ(loop.runPending(), 0u);
  EXPECT_EQ(ran, 0);
  EXPECT_EQ(loop.pendingTasks(), 1u); // the empty task was dropped
}

TEST(ui_loop, run_orders_by_due_time_until_quit) {
  UiLoop loop;
  std::vector<int> order;
  bool onUiThread = false;

  loop.postDelayed(30ms, [&] { order.push_back(30); });
  loop.postDelayed(10ms, [&] { order.push_back(10); });
  loop.post([&] {
    order.push_back(0);
    onUiThread = loop.isUiThread();
  });
  loop.postDelayed(50ms, [&] { loop.quit(); });

  loop.run();
  EXPECT_THAT(order, ElementsAre(0, 10, 30));
  EXPECT_TRUE(onUiThread);
}

TEST(ui_loop, throwing_task_does_not_stop_the_loop) {
  UiLoop loop;
  int ran = 0;
  loop.post([] { throw std::runtime_error("boom"); });
  loop.post([&] { ++ran; });

  EXPECT_EQ(loop.runPending(), 2u);
  EXPECT_EQ(ran, 1);
}

TEST(ui_loop, quit_and_post_from_other_threads) {
  UiLoop loop;
  bool otherIsUi = true;
  int ran = 0;

  std::thread other([&] {
    std::this_thread::sleep_for(20ms);
    loop.post([&] { ++ran; });
    otherIsUi = loop.isUiThread();
    std::this_thread::sleep_for(20ms);
    loop.quit();
  });

  loop.run(); // idle until the other thread posts, then until it quits
  other.join();
  EXPECT_EQ(ran, 1);
  EXPECT_FALSE(otherIsUi);
}

//---MarshalledFace ----------------------------------------------------------

TEST(marshalled_face, mutations_run_on_the_executor) {
  FakeFace inner;
  ManualExecutor ui;
  MarshalledFace face(inner, ui);

  face.resume();
  face.setEmotion(Emotion::Angry);
  face.displayGameImage("images/rock.png");
  face.startTalking();
  face.stopTalking();
  face.clearGameImage();
  face.startAnimationLoops();
  face.suspend();

  EXPECT_TRUE(inner.calls().empty());
  EXPECT_EQ(face.currentEmotion(), Emotion::Neutral);
  EXPECT_EQ(ui.pending(), 8u);

  ui.runAll();
  EXPECT_THAT(inner.calls(), ElementsAre("resume", "emotion angry", "image images/rock.png", "talk",
                                         "quiet", "clear image", "animations", "suspend"));
  EXPECT_EQ(face.currentEmotion(), Emotion::Angry);
}

//---OledFace ----------------------------------------------------------------

class OledFaceTest : public ::testing::Test {
protected:
  using Bytes = std::vector<std::uint8_t>;

  void SetUp() override {
    auto owned = std::make_unique<FakeI2cBus>();
    bus = owned.get();
    display = std::make_unique<marich::io::OLEDDisplay>(std::move(owned));
    ASSERT_TRUE(display->init());
    face = std::make_unique<OledFace>(*display);
  }

  bool leftEyeCentre() const { return display->pixel(40, 24); }
  bool leftEyeTop() const { return display->pixel(40, 14); }

  FakeI2cBus* bus = nullptr;
  std::unique_ptr<marich::io::OLEDDisplay> display;
  std::unique_ptr<OledFace> face;
};

TEST_F(OledFaceTest, hidden_until_resumed) {
  face->setEmotion(Emotion::Happy);
  EXPECT_FALSE(face->visible());
  EXPECT_EQ(face->currentEmotion(), Emotion::Happy);
  EXPECT_FALSE(leftEyeCentre());

  face->resume();
  EXPECT_TRUE(face->visible());
  EXPECT_TRUE(display->pixel(40, 20));
}

TEST_F(OledFaceTest, resume_and_suspend_switch_the_panel) {
  face->resume();
  EXPECT_TRUE(leftEyeCentre());
  EXPECT_NE(std::find(bus->raw_writes.begin(), bus->raw_writes.end(), Bytes{ 0x00, 0xAF }),
            bus->raw_writes.end());

  face->suspend();
  EXPECT_FALSE(face->visible());
  EXPECT_FALSE(leftEyeCentre());
  EXPECT_EQ(bus->raw_writes.back(), (Bytes{ 0x00, 0xAE }));

  const auto writes = bus->raw_writes.size();
  face->suspend(); // already hidden
  EXPECT_EQ(bus->raw_writes.size(), writes);
}

TEST_F(OledFaceTest, emotions_change_the_eyes) {
  face->resume();
  EXPECT_TRUE(display->pixel(40, 30));

  face->setEmotion(Emotion::Happy);
  EXPECT_FALSE(display->pixel(40, 30)); // upturned arc is hollow underneath
  EXPECT_TRUE(display->pixel(40, 20));

  face->setEmotion(Emotion::Neutral);
  EXPECT_TRUE(display->pixel(40, 30));
}

TEST_F(OledFaceTest, tick_blinks_only_when_animating) {
  face->resume();
  face->tick(OledFace::Clock::now() + 1h);
  EXPECT_TRUE(leftEyeTop()); // loops not started yet

  face->startAnimationLoops();
  face->startAnimationLoops();
  EXPECT_TRUE(face->animating());
  const auto later = OledFace::Clock::now() + OledFace::kBlinkPeriod + 10ms;

  face->tick(later);
  EXPECT_FALSE(leftEyeTop());
  EXPECT_TRUE(leftEyeCentre()); // closed lid

  face->tick(later + OledFace::kBlinkLength);
  EXPECT_TRUE(leftEyeTop());
}

TEST_F(OledFaceTest, talking_opens_the_mouth) {
  face->resume();
  face->startAnimationLoops();
  EXPECT_FALSE(display->pixel(64, 44));

  face->startTalking();
  face->tick(OledFace::Clock::now());
  EXPECT_TRUE(face->talking());
  EXPECT_TRUE(display->pixel(64, 44));

  face->stopTalking();
  EXPECT_FALSE(display->pixel(64, 44));
}

TEST_F(OledFaceTest, game_image_replaces_the_face) {
  face->resume();
  face->displayGameImage("images/Rock.png");
  EXPECT_EQ(face->gameImage(), "images/Rock.png");
  EXPECT_TRUE(display->pixel(64, 32));
  EXPECT_FALSE(leftEyeCentre());

  face->clearGameImage();
  EXPECT_TRUE(face->gameImage().empty());
  EXPECT_TRUE(leftEyeCentre());
}

TEST_F(OledFaceTest, unknown_image_gets_a_frame) {
  face->resume();
  face->displayGameImage("images/lizard.png");
  EXPECT_TRUE(display->pixel(20, 8));
  EXPECT_TRUE(display->pixel(107, 55));
  EXPECT_FALSE(display->pixel(64, 32));
}
