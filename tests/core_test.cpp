/* @file core_test.cpp
 * @brief coordinator transitions, admission rules, workers, config and fault reporting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <future>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

// spdlog headers
#include <spdlog/sinks/ringbuffer_sink.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Marich headers
#include "camera/CameraManager.hpp"
#include "core/Admission.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/IsolatedSteps.hpp"
#include "core/Logger.hpp"
#include "core/Mode.hpp"
#include "core/ModeCoordinator.hpp"
#include "core/Worker.hpp"

#include "FakeCamera.hpp"
#include "FakeFace.hpp"
#include "FakeHardware.hpp"
#include "ManualExecutor.hpp"
#include "MockErrorMonitor.hpp"
#include "ScriptedService.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace marich::core;
using namespace marich::test;
using marich::camera::CameraManager;
using marich::camera::DetectorAssets;
using marich::io::DetectorKind;
using marich::io::LedColor;
using namespace std::chrono_literals;

namespace {

  bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (pred())
        return true;
      std::this_thread::sleep_for(5ms);
    }
    return pred();
  }

  // files that exist when tests run from the source tree
  DetectorAssets presentAssets() {
    return DetectorAssets{ "config/marich.json", "config/presentation.json", "config/marich.json",
                           "low" };
  }

  bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
  }

} // namespace

//---coordinator fixture----------------------------------------------------

class CoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override { build(presentAssets()); }

  void build(DetectorAssets assets) {
    coordinator.reset();
    camera = std::make_unique<CameraManager>(fakeCameraFactory(cam), std::move(assets));
    coordinator = std::make_unique<ModeCoordinator>(hw, *camera, face, ui, services,
                                                    std::static_pointer_cast<ErrorMonitor>(monitor),
                                                    200ms);
  }

  CoordinatorSnapshot snap() const { return coordinator->snapshot(); }

  FakeHardware hw;
  std::shared_ptr<FakeCameraState> cam = std::make_shared<FakeCameraState>();
  FakeFace face;
  ManualExecutor ui;
  ScriptedFactory services;
  std::shared_ptr<testing::NiceMock<MockErrorMonitor>> monitor =
      std::make_shared<testing::NiceMock<MockErrorMonitor>>();
  std::unique_ptr<CameraManager> camera;
  std::unique_ptr<ModeCoordinator> coordinator;
};

TEST_F(CoordinatorTest, face_then_rps_hands_camera_over_to_the_game) {
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
  EXPECT_EQ(cam->opens, 1);
  EXPECT_TRUE(cam->called("start face"));
  EXPECT_EQ(snap().state.active.kind, ModeKind::Face);
  EXPECT_EQ(snap().detector, DetectorKind::Face);
  EXPECT_EQ(hw.lastLed(), LedColor::Green);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Entered);
  EXPECT_TRUE(cam->called("stop face"));
  EXPECT_TRUE(cam->called("start gesture quiet"));
  EXPECT_EQ(cam->opens, 1); // device kept, not reopened
  EXPECT_EQ(snap().state.active.kind, ModeKind::Rps);
  EXPECT_TRUE(snap().rpsRunning);
  EXPECT_TRUE(waitFor([&] { return services.rpsTrace->started == 1; }));
}

TEST_F(CoordinatorTest, repeating_the_active_color_mode_is_a_no_op) {
  ASSERT_EQ(coordinator->requestMode(Mode::colorTracking("red")), RequestOutcome::Entered);
  const auto before = cam->snapshot().size();
  const auto motorStops = hw.motorStops();

  EXPECT_EQ(coordinator->requestMode(Mode::colorTracking("RED")), RequestOutcome::AlreadyActive);
  EXPECT_EQ(cam->snapshot().size(), before);
  EXPECT_EQ(hw.motorStops(), motorStops);
  EXPECT_EQ(snap().state.active, Mode::colorTracking("red"));
  EXPECT_EQ(hw.lastLed(), LedColor::Red);
}

TEST_F(CoordinatorTest, switching_color_restarts_the_tracker) {
  ASSERT_EQ(coordinator->requestMode(Mode::colorTracking("red")), RequestOutcome::Entered);
  EXPECT_EQ(coordinator->requestMode(Mode::colorTracking("blue")), RequestOutcome::Entered);
  EXPECT_TRUE(cam->called("stop color"));
  EXPECT_TRUE(cam->called("start color blue"));
  EXPECT_EQ(hw.lastLed(), LedColor::Blue);
}

TEST_F(CoordinatorTest, ai_toggle_in_plate_mode_releases_camera_then_starts_chatbot) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Plate)), RequestOutcome::Entered);

  EXPECT_TRUE(coordinator->toggleAI());
  EXPECT_TRUE(cam->called("stop plate"));
  EXPECT_TRUE(snap().state.aiEnabled);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_FALSE(snap().chatbotRunning); // waits for the deferred release
  EXPECT_EQ(ui.delayedPosts(), 1);
  EXPECT_EQ(ui.lastDelay(), 10ms);

  ui.runAll();

  EXPECT_FALSE(snap().cameraAcquired);
  EXPECT_EQ(cam->releases, 1);
  EXPECT_EQ(cam->destroyed, 1);
  EXPECT_TRUE(snap().chatbotRunning);
  EXPECT_EQ(effectiveModeName(snap().state), "AIChat");
  EXPECT_EQ(services.suppressedGreetings(), std::vector<bool>{ false });
  EXPECT_TRUE(face.visible());
  EXPECT_EQ(face.currentEmotion(), Emotion::Happy);
  EXPECT_EQ(hw.lastLed(), LedColor::Green);
}

TEST_F(CoordinatorTest, ai_toggle_without_camera_starts_chatbot_directly) {
  EXPECT_TRUE(coordinator->toggleAI());
  EXPECT_EQ(ui.delayedPosts(), 0);
  EXPECT_TRUE(snap().chatbotRunning);
  EXPECT_TRUE(waitFor([&] { return services.preloads() == 1; }));

  ui.runAll();
  EXPECT_EQ(face.animationStarts(), 1);
  EXPECT_TRUE(face.visible());
}

TEST_F(CoordinatorTest, greeting_is_suppressed_after_the_first_ai_session) {
  coordinator->toggleAI();
  EXPECT_FALSE(coordinator->toggleAI());
  EXPECT_FALSE(snap().chatbotRunning);
  EXPECT_TRUE(services.chatbotTrace->sawCancel);

  coordinator->toggleAI();
  EXPECT_EQ(services.suppressedGreetings(), (std::vector<bool>{ false, true }));
  EXPECT_TRUE(snap().state.hasGreetedBefore);
}

TEST_F(CoordinatorTest, disabling_ai_hides_face_and_turns_led_off) {
  coordinator->toggleAI();
  ui.runAll();
  ASSERT_TRUE(face.visible());

  coordinator->toggleAI();
  ui.runAll();
  EXPECT_FALSE(face.visible());
  EXPECT_EQ(face.currentEmotion(), Emotion::Neutral);
  EXPECT_EQ(hw.lastLed(), LedColor::Off);
  EXPECT_FALSE(snap().state.aiEnabled);
}

TEST_F(CoordinatorTest, camera_modes_are_refused_while_ai_is_enabled) {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
  logging::addSink(sink);

  coordinator->toggleAI();
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Refused);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Refused);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Presentation)), RequestOutcome::Refused);

  logging::removeSink(sink);

  const auto lines = sink->last_formatted();
  const bool found = std::any_of(lines.begin(), lines.end(), [](const std::string& l) {
    return l.find("Cannot start face while AI is enabled. Disable AI first.") != std::string::npos;
  });
  EXPECT_TRUE(found);
  EXPECT_EQ(cam->opens, 0);
  EXPECT_TRUE(snap().chatbotRunning);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
}

TEST_F(CoordinatorTest, camera_open_failure_leaves_idle_and_reports) {
  cam->fail_open = true;
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("no camera"))).Times(1);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Failed);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_FALSE(snap().cameraAcquired);

  // a later request retries the device
  cam->fail_open = false;
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
}

TEST_F(CoordinatorTest, failed_switch_falls_back_to_idle_not_previous_mode) {
  ASSERT_EQ(coordinator->requestMode(Mode::colorTracking("green")), RequestOutcome::Entered);
  cam->fail_start = true;

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Gesture)), RequestOutcome::Failed);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_EQ(snap().detector, DetectorKind::None);
}

TEST_F(CoordinatorTest, missing_assets_refuse_object_mode_before_opening_camera) {
  build(DetectorAssets{ "does/not/exist.pb", "does/not/exist.pbtxt", "", "low" });
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("Missing:"))).Times(1);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Object)), RequestOutcome::Failed);
  EXPECT_EQ(cam->opens, 0);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
}

TEST_F(CoordinatorTest, object_mode_starts_with_assets_present) {
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Object)), RequestOutcome::Entered);
  EXPECT_TRUE(cam->called("start object"));
  EXPECT_EQ(hw.lastLed(), LedColor::Blue);
}

TEST_F(CoordinatorTest, stop_is_idempotent) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Gesture)), RequestOutcome::Entered);

  int stopped = 0;
  coordinator->setStoppedHandler([&] { ++stopped; });
  EXPECT_NO_THROW(coordinator->stopCurrentMode());
  EXPECT_NO_THROW(coordinator->stopCurrentMode());

  EXPECT_EQ(stopped, 2);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_EQ(snap().detector, DetectorKind::None);
  EXPECT_EQ(hw.lastLed(), LedColor::Off);
  EXPECT_EQ(hw.wheels(), (std::array<int, 4>{ 0, 0, 0, 0 }));
  EXPECT_TRUE(snap().cameraAcquired); // only a full release drops the device
}

TEST_F(CoordinatorTest, one_failing_cleanup_step_does_not_block_the_rest) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
  cam->fail_stop_face = true;
  hw.fail_led = true;
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("LED off"))).Times(1);

  const auto stopsBefore = hw.motorStops();
  EXPECT_NO_THROW(coordinator->stopCurrentMode());
  EXPECT_EQ(hw.motorStops(), stopsBefore + 1);
  EXPECT_TRUE(cam->called("stop plate"));
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
}

TEST_F(CoordinatorTest, workers_exclude_each_other) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Entered);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Presentation)), RequestOutcome::Refused);
  EXPECT_TRUE(snap().rpsRunning);

  coordinator->stopCurrentMode();
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Presentation)), RequestOutcome::Entered);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Refused);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Refused);
  EXPECT_TRUE(snap().presentationRunning);
  EXPECT_FALSE(snap().rpsRunning);
}

TEST_F(CoordinatorTest, face_animations_start_once) {
  coordinator->requestMode(Mode::of(ModeKind::Rps));
  coordinator->stopCurrentMode();
  coordinator->requestMode(Mode::of(ModeKind::Presentation));
  ui.runAll();
  EXPECT_EQ(face.animationStarts(), 1);
  EXPECT_TRUE(snap().state.animationsStarted);
}

TEST_F(CoordinatorTest, finished_presentation_falls_back_to_idle) {
  services.presentation = ScriptedFactory::Behaviour::Finish;
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Presentation)), RequestOutcome::Entered);
  ASSERT_TRUE(waitFor([&] { return services.presentationTrace->exited == 1; }));

  coordinator->reapFinished();
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_FALSE(snap().presentationRunning);
}

TEST_F(CoordinatorTest, presentation_factory_failure_is_reported) {
  services.fail_presentation = true;
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("unreadable"))).Times(1);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Presentation)), RequestOutcome::Failed);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
}

TEST_F(CoordinatorTest, preload_failure_still_starts_chatbot) {
  services.fail_preload = true;
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("conversation preload"))).Times(1);

  EXPECT_TRUE(coordinator->toggleAI());
  EXPECT_TRUE(snap().chatbotRunning);
  EXPECT_TRUE(waitFor([&] { return services.chatbotTrace->started == 1; }));
}

TEST_F(CoordinatorTest, slow_preload_runs_on_the_chatbot_thread) {
  services.preloadFor = 5s;

  const auto before = std::chrono::steady_clock::now();
  EXPECT_TRUE(coordinator->toggleAI());
  EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
  EXPECT_TRUE(snap().chatbotRunning); // the mutex is free while the model warms up
  ASSERT_TRUE(waitFor([&] { return services.preloads() == 1; }));
  EXPECT_EQ(services.chatbotTrace->started.load(), 0);

  // disabling AI cancels the warm-up inside the grace period
  EXPECT_CALL(*monitor, notifyFailure(testing::_)).Times(0);
  EXPECT_FALSE(coordinator->toggleAI());
  EXPECT_FALSE(snap().chatbotRunning);
  EXPECT_EQ(services.chatbotTrace->started.load(), 0);
}

TEST_F(CoordinatorTest, leaked_worker_blocks_restart_until_it_exits) {
  services.rps = ScriptedFactory::Behaviour::Stubborn;
  services.stubbornFor = 600ms;
  EXPECT_CALL(*monitor, notifyFailure("rps worker leaked after join timeout")).Times(1);

  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Entered);
  ASSERT_TRUE(waitFor([&] { return services.rpsTrace->started == 1; }));
  coordinator->stopCurrentMode();
  EXPECT_FALSE(snap().rpsRunning);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Failed);
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);

  ASSERT_TRUE(waitFor([&] { return services.rpsTrace->exited == 1; }));
  services.rps = ScriptedFactory::Behaviour::UntilCancelled;
  EXPECT_TRUE(waitFor([&] {
    return coordinator->requestMode(Mode::of(ModeKind::Rps)) == RequestOutcome::Entered;
  }));
}

TEST_F(CoordinatorTest, refused_rps_start_stops_the_gesture_detector_and_hides_face) {
  services.rps = ScriptedFactory::Behaviour::Stubborn;
  services.stubbornFor = 600ms;
  EXPECT_CALL(*monitor, notifyFailure("rps worker leaked after join timeout")).Times(1);

  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Entered);
  ASSERT_TRUE(waitFor([&] { return services.rpsTrace->started == 1; }));
  coordinator->stopCurrentMode();
  ui.runAll();

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Failed);
  ui.runAll();
  EXPECT_EQ(snap().state.active.kind, ModeKind::Idle);
  EXPECT_EQ(snap().detector, DetectorKind::None);
  EXPECT_FALSE(face.visible());
  EXPECT_EQ(hw.lastLed(), LedColor::Off);
  EXPECT_EQ(hw.wheels(), (std::array<int, 4>{ 0, 0, 0, 0 }));

  ASSERT_TRUE(waitFor([&] { return services.rpsTrace->exited == 1; }));
}

TEST_F(CoordinatorTest, rps_factory_failure_stops_the_gesture_detector) {
  services.fail_rps = true;
  EXPECT_CALL(*monitor, notifyFailure(testing::HasSubstr("gesture model"))).Times(1);

  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Failed);
  ui.runAll();
  EXPECT_TRUE(cam->called("start gesture quiet"));
  EXPECT_TRUE(cam->called("stop gesture"));
  EXPECT_EQ(snap().detector, DetectorKind::None);
  EXPECT_FALSE(snap().rpsRunning);
  EXPECT_FALSE(face.visible());
}

TEST_F(CoordinatorTest, every_request_sequence_keeps_one_activity_at_a_time) {
  const std::vector<Mode> modes = { Mode::colorTracking("red"),    Mode::colorTracking("blue"),
                                    Mode::of(ModeKind::Face),      Mode::of(ModeKind::Gesture),
                                    Mode::of(ModeKind::Object),    Mode::of(ModeKind::Plate),
                                    Mode::of(ModeKind::Rps),       Mode::of(ModeKind::Presentation),
                                    Mode::idle() };
  std::mt19937 rng(20250917);
  std::uniform_int_distribution<int> pick(0, static_cast<int>(modes.size()) + 2);

  for (int i = 0; i < 300; ++i) {
    const int op = pick(rng);
    std::string what;
    if (op < static_cast<int>(modes.size())) {
      what = "request " + describe(modes[op]);
      coordinator->requestMode(modes[op]);
    } else if (op == static_cast<int>(modes.size())) {
      what = "toggle AI";
      coordinator->toggleAI();
    } else if (op == static_cast<int>(modes.size()) + 1) {
      what = "stop";
      coordinator->stopCurrentMode();
    } else {
      what = "run UI tasks";
      ui.runAll();
    }

    const auto s = snap();
    SCOPED_TRACE("step " + std::to_string(i) + ": " + what);
    ASSERT_LE(int(s.rpsRunning) + int(s.presentationRunning), 1);
    if (s.rpsRunning)
      ASSERT_TRUE(s.detector == DetectorKind::None || s.detector == DetectorKind::Gesture);
    if (s.presentationRunning)
      ASSERT_EQ(s.detector, DetectorKind::None);
    if (s.state.aiEnabled) {
      ASSERT_EQ(s.detector, DetectorKind::None);
      ASSERT_FALSE(s.rpsRunning);
      ASSERT_FALSE(s.presentationRunning);
      ASSERT_EQ(s.state.active.kind, ModeKind::Idle);
    }
    if (s.chatbotRunning)
      ASSERT_TRUE(s.state.aiEnabled);
    if (s.state.active.kind == ModeKind::Idle) {
      ASSERT_EQ(s.detector, DetectorKind::None);
      ASSERT_FALSE(s.rpsRunning);
      ASSERT_FALSE(s.presentationRunning);
    }
  }
}

TEST_F(CoordinatorTest, display_poll_is_idle_while_the_camera_is_released) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
  marich::io::FrameEvent key;
  key.kind = marich::io::FrameEvent::Kind::Key;
  key.key = 'x';
  cam->frames.push_back(key);

  marich::io::FrameEvent::Kind fromCoordinator = marich::io::FrameEvent::Kind::Key;
  marich::io::FrameEvent::Kind fromCamera = marich::io::FrameEvent::Kind::Key;
  bool answered = false;
  cam->during_release = [&] {
    // the releasing thread holds both locks; poll from the UI side meanwhile
    auto polled = std::async(std::launch::async, [&] {
      fromCoordinator = coordinator->pollDisplay().kind;
      fromCamera = camera->pollFrame().kind;
    });
    answered = polled.wait_for(1s) == std::future_status::ready;
  };

  coordinator->releaseCameraCompletely();
  EXPECT_TRUE(answered);
  EXPECT_EQ(fromCoordinator, marich::io::FrameEvent::Kind::Idle);
  EXPECT_EQ(fromCamera, marich::io::FrameEvent::Kind::Idle);
  EXPECT_EQ(cam->frames.size(), 1u); // nothing was read from the device
  EXPECT_EQ(cam->releases, 1);
  EXPECT_FALSE(snap().cameraAcquired);
}

TEST_F(CoordinatorTest, shutdown_stops_game_and_releases_everything) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Rps)), RequestOutcome::Entered);
  ASSERT_TRUE(snap().cameraAcquired);

  EXPECT_NO_THROW(coordinator->shutdown());
  ui.runAll();

  EXPECT_TRUE(services.rpsTrace->sawCancel);
  EXPECT_FALSE(snap().rpsRunning);
  EXPECT_FALSE(snap().cameraAcquired);
  EXPECT_EQ(cam->releases, 1);
  EXPECT_EQ(hw.lastLed(), LedColor::Off);
  EXPECT_EQ(hw.wheels(), (std::array<int, 4>{ 0, 0, 0, 0 }));
  EXPECT_FALSE(hw.irEnabled());
  EXPECT_FALSE(face.visible());
  EXPECT_TRUE(snap().shuttingDown);

  // second call and later requests are inert
  EXPECT_NO_THROW(coordinator->shutdown());
  EXPECT_EQ(hw.irSwitchCalls(), 1);
  EXPECT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Refused);
  EXPECT_FALSE(coordinator->toggleAI());
}

TEST_F(CoordinatorTest, shutdown_survives_hardware_faults) {
  coordinator->toggleAI();
  hw.fail_led = true;
  hw.fail_motor = true;
  hw.fail_ir_switch = true;

  EXPECT_NO_THROW(coordinator->shutdown());
  EXPECT_FALSE(snap().chatbotRunning);
  EXPECT_FALSE(snap().state.aiEnabled);
}

TEST_F(CoordinatorTest, q_key_in_camera_window_requests_shutdown) {
  bool asked = false;
  coordinator->setShutdownHandler([&] { asked = true; });
  EXPECT_EQ(coordinator->pollDisplay().kind, marich::io::FrameEvent::Kind::Idle);

  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
  marich::io::FrameEvent key;
  key.kind = marich::io::FrameEvent::Kind::Key;
  key.key = 'q';
  cam->frames.push_back(key);

  EXPECT_EQ(coordinator->pollDisplay().kind, marich::io::FrameEvent::Kind::Key);
  EXPECT_TRUE(asked);
}

TEST_F(CoordinatorTest, release_camera_completely_drops_device) {
  ASSERT_EQ(coordinator->requestMode(Mode::of(ModeKind::Face)), RequestOutcome::Entered);
  coordinator->releaseCameraCompletely();
  EXPECT_FALSE(snap().cameraAcquired);
  EXPECT_EQ(cam->destroyed, 1);
  EXPECT_FALSE(snap().chatbotRunning);
}

//---admission----------------------------------------------------------------

TEST(admission_tests, ai_enabled_rejects_hardware_modes) {
  CoordinatorState s;
  s.aiEnabled = true;
  for (auto k : { ModeKind::Color, ModeKind::Face, ModeKind::Gesture, ModeKind::Object,
                  ModeKind::Plate, ModeKind::Rps, ModeKind::Presentation })
    EXPECT_EQ(decideAdmission(s, {}, Mode::of(k)), Admission::RejectAiEnabled) << toString(k);
  EXPECT_EQ(decideAdmission(s, {}, Mode::idle()), Admission::AlreadyActive);
}

TEST(admission_tests, worker_conflicts) {
  CoordinatorState s;
  EXPECT_EQ(decideAdmission(s, { false, true }, Mode::of(ModeKind::Rps)),
            Admission::RejectWorkerConflict);
  EXPECT_EQ(decideAdmission(s, { true, false }, Mode::of(ModeKind::Presentation)),
            Admission::RejectWorkerConflict);
  EXPECT_EQ(decideAdmission(s, { false, true }, Mode::colorTracking("red")),
            Admission::RejectWorkerConflict);
  // a camera mode may pre-empt the game
  EXPECT_EQ(decideAdmission(s, { true, false }, Mode::of(ModeKind::Face)), Admission::Accept);
}

TEST(admission_tests, parameters_count_for_already_active) {
  CoordinatorState s;
  s.active = Mode::colorTracking("red");
  EXPECT_EQ(decideAdmission(s, {}, Mode::colorTracking("red")), Admission::AlreadyActive);
  EXPECT_EQ(decideAdmission(s, {}, Mode::colorTracking("blue")), Admission::Accept);
}

TEST(mode_tests, names) {
  EXPECT_EQ(describe(Mode::colorTracking("Yellow")), "color(yellow)");
  EXPECT_EQ(describe(Mode{ ModeKind::Gesture, {}, false }), "gesture(no actions)");
  EXPECT_EQ(describe(Mode::of(ModeKind::Rps)), "rps");

  CoordinatorState s;
  s.active = Mode::of(ModeKind::Face);
  EXPECT_EQ(effectiveModeName(s), "face");
  s.aiEnabled = true;
  EXPECT_EQ(effectiveModeName(s), "AIChat");
  EXPECT_TRUE(isCameraMode(ModeKind::Plate));
  EXPECT_FALSE(isCameraMode(ModeKind::Rps));
  EXPECT_TRUE(isWorkerMode(ModeKind::Presentation));
}

//---worker -------------------------------------------------------------------

TEST(worker_tests, start_stop_joins) {
  auto trace = std::make_shared<ServiceTrace>();
  Worker w("test", 500ms);
  EXPECT_EQ(w.stop(), StopResult::NotRunning);

  ASSERT_TRUE(w.start(std::make_unique<ScriptedService>(ScriptedService::Behaviour::UntilCancelled,
                                                        trace)));
  EXPECT_TRUE(w.running());
  // a second start while running keeps the first task
  EXPECT_TRUE(w.start(std::make_unique<ScriptedService>(ScriptedService::Behaviour::Finish, trace)));

  EXPECT_EQ(w.stop(), StopResult::Joined);
  EXPECT_FALSE(w.running());
  EXPECT_TRUE(trace->sawCancel);
  EXPECT_EQ(trace->started.load(), 1);
}

TEST(worker_tests, self_terminated_task_is_reaped) {
  auto trace = std::make_shared<ServiceTrace>();
  Worker w("test", 500ms);
  ASSERT_TRUE(w.start(std::make_unique<ScriptedService>(ScriptedService::Behaviour::Finish, trace)));
  ASSERT_TRUE(waitFor([&] { return w.finished(); }));

  EXPECT_TRUE(w.reap());
  EXPECT_FALSE(w.running());
  EXPECT_FALSE(w.reap());
}

TEST(worker_tests, timed_out_stop_reports_leak) {
  auto trace = std::make_shared<ServiceTrace>();
  Worker w("test", 50ms);
  ASSERT_TRUE(w.start(
      std::make_unique<ScriptedService>(ScriptedService::Behaviour::Stubborn, trace, 300ms)));

  EXPECT_EQ(w.stop(), StopResult::Leaked);
  EXPECT_FALSE(w.running());
  EXPECT_TRUE(w.leakedTaskAlive());
  EXPECT_FALSE(w.start(std::make_unique<ScriptedService>(ScriptedService::Behaviour::Finish, trace)));

  ASSERT_TRUE(waitFor([&] { return !w.leakedTaskAlive(); }));
  EXPECT_TRUE(trace->sawCancel);
  EXPECT_TRUE(w.start(std::make_unique<ScriptedService>(ScriptedService::Behaviour::Finish, trace)));
  w.stop();
}

TEST(worker_tests, null_service_is_rejected) {
  Worker w("test");
  EXPECT_THROW(w.start(nullptr), std::invalid_argument);
}

TEST(cancel_signal_tests, copies_share_the_flag) {
  CancelSignal a;
  CancelSignal b = a;
  EXPECT_TRUE(a.sleepFor(1ms));
  b.request();
  EXPECT_TRUE(a.requested());
  EXPECT_FALSE(a.sleepFor(1s));
}

//---isolated steps / error monitor ----------------------------------------

TEST(isolated_steps_tests, every_step_runs) {
  std::vector<std::string> ran;
  auto failures = runIsolated(
      { { "one", [&] { ran.push_back("one"); } },
        { "two",
          [&] {
            ran.push_back("two");
            throw HardwareError("bus");
          } },
        { "three", [&] { ran.push_back("three"); } } },
      *logging::get("coordinator"));

  EXPECT_EQ(ran, (std::vector<std::string>{ "one", "two", "three" }));
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].step, "two");
  EXPECT_EQ(failures[0].what, "bus");
}

TEST(error_monitor_tests, escalates_each_distinct_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("LED off: bus");
  monitor.notifyFailure("LED off: bus");
  monitor.notifyFailure("motor stop: bus");

  EXPECT_EQ(monitor.failureCount(), 3u);
  EXPECT_EQ(escalated, (std::vector<std::string>{ "LED off: bus", "motor stop: bus" }));
  EXPECT_EQ(monitor.distinctFailures().size(), 2u);
}

//---configuration ----------------------------------------------------------

namespace {

  std::string writeTemp(const std::string& name, const std::string& body) {
    const auto path = testing::TempDir() + name;
    std::ofstream(path) << body;
    return path;
  }

} // namespace

TEST(config_tests, missing_file_yields_defaults) {
  auto cfg = ConfigLoader(testing::TempDir() + "no_such_marich.json").loadRobotConfig();
  EXPECT_EQ(cfg.ir.codes.exit, 0x1A);
  EXPECT_EQ(cfg.ir.debounce, 400ms);
  EXPECT_EQ(cfg.workerGrace, 2000ms);
  EXPECT_EQ(cfg.camera.fourcc, "YUYV");
  EXPECT_EQ(cfg.hardware.address, 0x2B);
  EXPECT_EQ(cfg.chatbot.historyLimit, 7u);
  EXPECT_TRUE(cfg.presentation.scriptPath.empty());
}

TEST(config_tests, overrides_are_applied) {
  const auto doc = nlohmann::json::parse(R"({
    "ir": { "debounce_ms": 250, "codes": { "exit": "0x1B", "red": 7 } },
    "camera": { "device": "/dev/video2", "width": 320, "height": 240, "fourcc": "MJPG",
                "face_cascade": "cascades/face.xml" },
    "workers": { "join_grace_ms": 1500 },
    "hardware": { "address": "43" },
    "chatbot": { "llm_command": ["cat"], "history_limit": 5 },
    "presentation": { "script": "config/presentation.json" },
    "logging": { "level": "debug" },
    "unknown_section": { "ignored": true }
  })");
  auto cfg = ConfigLoader::fromJson(doc);
  EXPECT_EQ(cfg.ir.debounce, 250ms);
  EXPECT_EQ(cfg.ir.codes.exit, 0x1B);
  EXPECT_EQ(cfg.ir.codes.red, 7);
  EXPECT_EQ(cfg.ir.codes.blue, 0x04);
  EXPECT_EQ(cfg.camera.device, "/dev/video2");
  EXPECT_EQ(cfg.camera.width, 320);
  EXPECT_EQ(cfg.camera.fourcc, "MJPG");
  EXPECT_EQ(cfg.camera.faceCascade, "cascades/face.xml");
  EXPECT_EQ(cfg.workerGrace, 1500ms);
  EXPECT_EQ(cfg.hardware.address, 43);
  EXPECT_EQ(cfg.chatbot.llmCommand, std::vector<std::string>{ "cat" });
  EXPECT_EQ(cfg.chatbot.historyLimit, 5u);
  EXPECT_EQ(cfg.presentation.scriptPath, "config/presentation.json");
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST(config_tests, shipped_config_loads) {
  EXPECT_NO_THROW(ConfigLoader(ConfigLoader::kDefaultPath).loadRobotConfig());
}

TEST(config_tests, rejects_bad_documents) {
  const char* bad[] = {
    R"([1, 2])",
    R"({ "ir": 3 })",
    R"({ "ir": { "codes": { "red": 0 } } })",
    R"({ "ir": { "codes": { "red": "0xFF" } } })",
    R"({ "ir": { "codes": { "blue": 1 } } })", // duplicates red
    R"({ "ir": { "debounce_ms": -5 } })",
    R"({ "ir": { "poll_interval_ms": 0 } })",
    R"({ "camera": { "width": "wide" } })",
    R"({ "camera": { "width": 0 } })",
    R"({ "camera": { "fourcc": "MJPEG" } })",
    R"({ "hardware": { "address": 300 } })",
    R"({ "hardware": { "address": "0x2Bz" } })",
  };
  for (const auto* text : bad)
    EXPECT_THROW(ConfigLoader::fromJson(nlohmann::json::parse(text)), ConfigError) << text;
}

TEST(config_tests, malformed_file_throws) {
  const auto path = writeTemp("marich_bad.json", "{ \"ir\": ");
  EXPECT_THROW(ConfigLoader(path).loadRobotConfig(), ConfigError);
  std::remove(path.c_str());
}

TEST(config_tests, missing_voice_assets_are_listed) {
  RobotConfig cfg;
  cfg.voice.piperBinary = "piper"; // resolved through PATH
  cfg.voice.model = "config/marich.json";
  cfg.voice.modelConfig = "nowhere/voice.json";
  auto missing = cfg.missingVoiceAssets();
  EXPECT_EQ(missing, std::vector<std::string>{ "nowhere/voice.json" });
  EXPECT_FALSE(contains(missing, "piper"));
}
