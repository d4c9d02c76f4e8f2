/* @file input_test.cpp
 * @brief IR debounce, command table and router dispatch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// Marich headers
#include "camera/CameraManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ModeCoordinator.hpp"
#include "core/RobotConfig.hpp"
#include "input/InputRouter.hpp"
#include "input/IrCommandMap.hpp"
#include "input/IrDebouncer.hpp"

#include "FakeCamera.hpp"
#include "FakeFace.hpp"
#include "FakeHardware.hpp"
#include "ManualExecutor.hpp"
#include "ScriptedService.hpp"

// GTest headers
#include <gtest/gtest.h>

using namespace marich::input;
using namespace marich::test;
using marich::core::ModeKind;
using namespace std::chrono_literals;

//---IrDebouncer -------------------------------------------------------------

TEST(ir_debouncer, drops_repeats_inside_window) {
  IrDebouncer d(400ms);
  const auto t0 = IrDebouncer::Clock::now();

  EXPECT_TRUE(d.accept(0x01, t0));
  EXPECT_FALSE(d.accept(0x01, t0 + 100ms));
  EXPECT_FALSE(d.accept(0x01, t0 + 399ms));
  EXPECT_TRUE(d.accept(0x01, t0 + 400ms));
  EXPECT_EQ(d.lastCode(), 0x01);
}

TEST(ir_debouncer, different_code_passes_immediately) {
  IrDebouncer d(400ms);
  const auto t0 = IrDebouncer::Clock::now();
  EXPECT_TRUE(d.accept(0x01, t0));
  EXPECT_TRUE(d.accept(0x04, t0 + 10ms));
  EXPECT_TRUE(d.accept(0x01, t0 + 20ms));
}

TEST(ir_debouncer, rejected_repeat_does_not_extend_window) {
  IrDebouncer d(400ms);
  const auto t0 = IrDebouncer::Clock::now();
  EXPECT_TRUE(d.accept(0x01, t0));
  EXPECT_FALSE(d.accept(0x01, t0 + 300ms));
  EXPECT_TRUE(d.accept(0x01, t0 + 450ms));
}

TEST(ir_debouncer, bypass_accepts_everything) {
  IrDebouncer d(400ms, true);
  const auto t0 = IrDebouncer::Clock::now();
  EXPECT_TRUE(d.accept(0x01, t0));
  EXPECT_TRUE(d.accept(0x01, t0));
}

//---IrCommandMap ------------------------------------------------------------

TEST(ir_command_map, default_codes) {
  IrCommandMap map;
  EXPECT_EQ(map.lookup(0x01), IrCommand::ColorRed);
  EXPECT_EQ(map.lookup(0x19), IrCommand::Rps);
  EXPECT_EQ(map.lookup(0x15), IrCommand::Presentation);
  EXPECT_EQ(map.lookup(0x02), IrCommand::AiToggle);
  EXPECT_EQ(map.lookup(0x1A), IrCommand::Exit);
  EXPECT_FALSE(map.lookup(0x42).has_value());
  EXPECT_EQ(map.codeFor(IrCommand::StopAll), 0x05);
}

TEST(ir_command_map, follows_configured_codes) {
  marich::core::IrCodes codes;
  codes.exit = 0x30;
  IrCommandMap map(codes);
  EXPECT_EQ(map.lookup(0x30), IrCommand::Exit);
  EXPECT_FALSE(map.lookup(0x1A).has_value());
}

TEST(ir_command_map, help_lists_every_command) {
  const auto help = IrCommandMap().helpText();
  EXPECT_NE(help.find("=== IR COMMAND MAP ==="), std::string::npos);
  EXPECT_NE(help.find("Red Color Mode"), std::string::npos);
  EXPECT_NE(help.find("License Plate Mode"), std::string::npos);
  EXPECT_NE(help.find("Exit App            : 0x1A"), std::string::npos);
}

//---InputRouter -------------------------------------------------------------

class InputRouterTest : public ::testing::Test {
protected:
  void SetUp() override {
    camera = std::make_unique<marich::camera::CameraManager>(fakeCameraFactory(cam),
                                                             marich::camera::DetectorAssets{});
    coordinator = std::make_unique<marich::core::ModeCoordinator>(
        hw, *camera, face, ui, services, std::make_shared<marich::core::ErrorMonitor>(), 500ms);
  }

  std::unique_ptr<InputRouter> makeRouter(const marich::core::IrSettings& settings) {
    return std::make_unique<InputRouter>(hw, *coordinator, ui, settings, [this] { ++exits; });
  }

  ModeKind active() const { return coordinator->snapshot().state.active.kind; }

  FakeHardware hw;
  std::shared_ptr<FakeCameraState> cam = std::make_shared<FakeCameraState>();
  FakeFace face;
  ManualExecutor ui;
  ScriptedFactory services;
  std::unique_ptr<marich::camera::CameraManager> camera;
  std::unique_ptr<marich::core::ModeCoordinator> coordinator;
  std::atomic<int> exits{ 0 };
};

TEST_F(InputRouterTest, sentinels_and_bus_errors_are_ignored) {
  auto router = makeRouter({});
  const auto now = InputRouter::Clock::now();

  hw.queueIr(0x00);
  hw.queueIr(0xFF);
  hw.queueIr(std::nullopt);
  EXPECT_FALSE(router->pollOnce(now));
  EXPECT_FALSE(router->pollOnce(now));
  EXPECT_FALSE(router->pollOnce(now));
  EXPECT_EQ(hw.beeps(), 0);
}

TEST_F(InputRouterTest, camera_codes_switch_mode_on_the_poll_thread) {
  auto router = makeRouter({});
  const auto t0 = InputRouter::Clock::now();

  hw.queueIr(0x01);
  EXPECT_TRUE(router->pollOnce(t0));
  EXPECT_EQ(hw.beeps(), 1);
  EXPECT_EQ(active(), ModeKind::Color);
  EXPECT_EQ(coordinator->snapshot().state.active.color, "red");
  EXPECT_TRUE(cam->called("start color red"));

  // held key repeats inside the debounce window
  hw.queueIr(0x01);
  EXPECT_FALSE(router->pollOnce(t0 + 100ms));
  EXPECT_EQ(hw.beeps(), 1);

  hw.queueIr(0x10);
  EXPECT_TRUE(router->pollOnce(t0 + 150ms));
  EXPECT_EQ(active(), ModeKind::Face);
}

TEST_F(InputRouterTest, face_touching_commands_are_posted_to_ui) {
  auto router = makeRouter({});

  router->dispatch(0x19);
  EXPECT_EQ(active(), ModeKind::Idle);
  EXPECT_EQ(ui.pending(), 1u);
  ui.runAll();
  EXPECT_EQ(active(), ModeKind::Rps);

  router->dispatch(0x05);
  EXPECT_EQ(ui.delayedPosts(), 1);
  ui.runAll();
  EXPECT_EQ(active(), ModeKind::Idle);
  EXPECT_FALSE(coordinator->snapshot().cameraAcquired);

  router->dispatch(0x02);
  EXPECT_FALSE(coordinator->snapshot().state.aiEnabled);
  ui.runAll();
  EXPECT_TRUE(coordinator->snapshot().state.aiEnabled);

  router->dispatch(0x15);
  ui.runAll();
  EXPECT_EQ(active(), ModeKind::Idle); // refused while AI is on
}

TEST_F(InputRouterTest, exit_code_invokes_callback) {
  auto router = makeRouter({});
  router->dispatch(0x1A);
  EXPECT_EQ(exits.load(), 1);
  EXPECT_EQ(hw.beeps(), 1);
}

TEST_F(InputRouterTest, unmapped_codes_beep_only_in_debug) {
  auto quiet = makeRouter({});
  quiet->dispatch(0x42);
  EXPECT_EQ(hw.beeps(), 0);

  marich::core::IrSettings debug;
  debug.debug = true;
  auto loud = makeRouter(debug);
  loud->dispatch(0x42);
  EXPECT_EQ(hw.beeps(), 1);
  EXPECT_EQ(active(), ModeKind::Idle);
}

TEST_F(InputRouterTest, poll_thread_dispatches_until_stopped) {
  marich::core::IrSettings settings;
  settings.pollInterval = 5ms;
  auto router = makeRouter(settings);

  router->start();
  hw.queueIr(0x1A);
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (exits == 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(5ms);
  EXPECT_EQ(exits.load(), 1);

  router->requestStop();
  EXPECT_TRUE(router->stopRequested());
  router->join();
  router->join(); // second join is a no-op
}
