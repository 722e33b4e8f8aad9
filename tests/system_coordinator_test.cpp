// KaliPiMax headers
#include "core/StateStore.hpp"
#include "core/SystemCoordinator.hpp"

// KaliPiMax fakes
#include "FakeInputSource.hpp"
#include "FakeRenderer.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace kpm::test {

  using kpm::core::SystemCoordinator;
  using kpm::ui::InputEvent;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  class SystemCoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      root = fs::temp_directory_path() /
             ("kpm_coord_" + std::to_string(::getpid()) + "_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::remove_all(root);
      config.captureRoot = root / "loot";
      config.logPath = root / "logs" / "run.log";
      config.inputPoll = 10ms;
      config.tick = 20ms;
      config.render = 20ms;
      config.renderActive = 10ms;
      config.terminationGrace = 200ms;
    }

    void TearDown() override {
      std::error_code ec;
      fs::remove_all(root, ec);
    }

    fs::path root;
    kpm::core::AppConfig config;
    std::atomic<bool> stop{ false };
  };

  TEST_F(SystemCoordinatorTest, runs_scripted_input_and_shuts_down_cleanly) {
    FakeInputSource input(stop);
    FakeRenderer renderer;
    input.push(InputEvent::Next);
    input.push(InputEvent::Next);
    input.idleBeforeStop = 10;

    SystemCoordinator coordinator(input, renderer);
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::BOOT);
    coordinator.initialize(config);
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::INIT);

    coordinator.run(stop);
    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::STOPPED);

    EXPECT_EQ(coordinator.stateStore().getSnapshot().activeMode, 2u); // System → Nmap → WiFi
    for (const auto& category : config.lootCategories)
      EXPECT_TRUE(fs::is_directory(config.captureRoot / category)) << category;

    const auto frames = renderer.frames();
    ASSERT_FALSE(frames.empty());
    EXPECT_EQ(frames.back().modeView.title, "WiFi");

    std::ifstream in(config.logPath);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find(",OK,\"KaliPiMax ready\""), std::string::npos);
  }

  TEST_F(SystemCoordinatorTest, fatal_error_ends_run_loop) {
    FakeInputSource input(stop);
    FakeRenderer renderer;
    input.idleBeforeStop = 1000000; // never raises the flag itself

    SystemCoordinator coordinator(input, renderer);
    coordinator.initialize(config);
    std::thread fault([&coordinator] {
      std::this_thread::sleep_for(100ms);
      coordinator.handleError("resource map corrupt");
    });
    coordinator.run(stop);
    fault.join();

    EXPECT_EQ(coordinator.state(), SystemCoordinator::State::STOPPED);
    EXPECT_FALSE(stop.load());
  }

  TEST_F(SystemCoordinatorTest, run_before_initialize_is_rejected) {
    FakeInputSource input(stop);
    FakeRenderer renderer;
    SystemCoordinator coordinator(input, renderer);
    EXPECT_THROW(coordinator.run(stop), std::logic_error);
    EXPECT_THROW(coordinator.stateStore(), std::logic_error);
  }

  TEST_F(SystemCoordinatorTest, load_config_reads_json_file) {
    fs::create_directories(root);
    const auto path = root / "config.json";
    std::ofstream(path) << R"({ "scan_target": "10.1.0.0/16", "tick_ms": 50 })";

    const auto cfg = SystemCoordinator::loadConfig(path.string());
    EXPECT_EQ(cfg.scanTarget, "10.1.0.0/16");
    EXPECT_EQ(cfg.tick, 50ms);
    EXPECT_THROW(SystemCoordinator::loadConfig((root / "missing.json").string()),
                 std::runtime_error);
  }

} // namespace kpm::test
