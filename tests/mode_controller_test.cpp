// KaliPiMax headers
#include "core/ModeController.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"

// KaliPiMax fakes
#include "FakeMode.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace kpm::test {

  using kpm::core::AlertLevel;
  using kpm::core::ModeController;
  using kpm::core::PayloadManager;
  using kpm::core::PayloadRequest;
  using kpm::core::StateStore;
  using kpm::ui::InputEvent;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  class ModeControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      root = fs::temp_directory_path() /
             ("kpm_modes_" + std::to_string(::getpid()) + "_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name());
      state = std::make_unique<StateStore>(100);
      PayloadManager::Settings s;
      s.captureRoot = root;
      s.terminationGrace = 500ms;
      payloads = std::make_unique<PayloadManager>(
          *state, std::make_shared<::testing::NiceMock<MockErrorMonitor>>(), s);

      ModeController::Registry registry;
      auto a = std::make_unique<FakeMode>("Alpha", *payloads, false);
      auto b = std::make_unique<FakeMode>("Beta", *payloads, true);
      auto c = std::make_unique<FakeMode>("Gamma", *payloads, false);
      alpha = a.get();
      beta = b.get();
      third = c.get();
      registry.push_back(std::move(a));
      registry.push_back(std::move(b));
      registry.push_back(std::move(c));
      controller = std::make_unique<ModeController>(std::move(registry), *state, *payloads);
      controller->start();
    }

    void TearDown() override {
      controller.reset();
      payloads.reset();
      std::error_code ec;
      fs::remove_all(root, ec);
    }

    static PayloadRequest sleeper(const std::string& resourceClass = "wifi") {
      PayloadRequest r;
      r.command = "/bin/sh";
      r.args = { "-c", "exec sleep 30" };
      r.resourceClass = resourceClass;
      r.category = "wifi";
      r.label = "Sleeper";
      return r;
    }

    bool hasAlert(const std::string& message, AlertLevel level) const {
      const auto alerts = state->getSnapshot().alerts;
      return std::any_of(alerts.begin(), alerts.end(), [&](const kpm::core::Alert& a) {
        return a.message == message && a.level == level;
      });
    }

    fs::path root;
    std::unique_ptr<StateStore> state;
    std::unique_ptr<PayloadManager> payloads;
    std::unique_ptr<ModeController> controller;
    FakeMode* alpha = nullptr;
    FakeMode* beta = nullptr;
    FakeMode* third = nullptr;
  };

  TEST_F(ModeControllerTest, start_enters_first_mode_and_publishes_view) {
    EXPECT_EQ(controller->active(), 0u);
    EXPECT_EQ(alpha->enters, 1);
    EXPECT_EQ(alpha->id(), 0u);
    EXPECT_EQ(third->id(), 2u);
    const auto snap = state->getSnapshot();
    EXPECT_EQ(snap.activeMode, 0u);
    EXPECT_EQ(snap.modeView.title, "Alpha");
  }

  TEST_F(ModeControllerTest, navigation_wraps_in_registration_order) {
    controller->dispatchInput(InputEvent::Prev);
    EXPECT_EQ(controller->active(), 2u);
    EXPECT_EQ(alpha->exits, 1);
    EXPECT_EQ(third->enters, 1);

    controller->dispatchInput(InputEvent::Next);
    controller->dispatchInput(InputEvent::Next);
    EXPECT_EQ(controller->active(), 1u);
    EXPECT_EQ(state->getSnapshot().activeMode, 1u);
    EXPECT_EQ(state->getSnapshot().modeView.title, "Beta");
  }

  TEST_F(ModeControllerTest, leaving_mode_with_running_job_is_refused) {
    alpha->request = sleeper();
    controller->dispatchInput(InputEvent::Select);
    ASSERT_TRUE(alpha->lastJob.has_value());

    controller->dispatchInput(InputEvent::Next);
    EXPECT_EQ(controller->active(), 0u);
    EXPECT_EQ(alpha->exits, 0);
    EXPECT_TRUE(hasAlert("Payload running - cancel first", AlertLevel::Warn));
    EXPECT_FALSE(controller->selectByName("gamma"));

    // CANCEL goes to the payload, not to the mode
    controller->dispatchInput(InputEvent::Cancel);
    EXPECT_EQ(alpha->received.back(), InputEvent::Next);
    ASSERT_TRUE(payloads->waitFor(*alpha->lastJob, 5000ms));
    EXPECT_EQ(payloads->status(*alpha->lastJob).phase, kpm::core::JobPhase::Cancelled);

    controller->dispatchInput(InputEvent::Next);
    EXPECT_EQ(controller->active(), 1u);
  }

  TEST_F(ModeControllerTest, background_job_survives_mode_exit) {
    ASSERT_TRUE(controller->select(1));
    beta->request = sleeper("responder");
    controller->dispatchInput(InputEvent::Select);
    ASSERT_TRUE(beta->lastJob.has_value());

    controller->dispatchInput(InputEvent::Next);
    EXPECT_EQ(controller->active(), 2u);
    EXPECT_EQ(beta->exits, 1);
    EXPECT_TRUE(payloads->hasActiveJob(1));

    const auto snap = state->getSnapshot();
    ASSERT_EQ(snap.payloads.size(), 1u);
    EXPECT_EQ(snap.payloads[0].owner, 1u);

    // the job keeps reporting after its mode is gone
    payloads->cancel(*beta->lastJob);
    ASSERT_TRUE(payloads->waitFor(*beta->lastJob, 5000ms));
    ASSERT_TRUE(state->getSnapshot().lastOutcome.has_value());
    EXPECT_EQ(state->getSnapshot().lastOutcome->phase, kpm::core::JobPhase::Cancelled);
  }

  TEST_F(ModeControllerTest, handler_exception_becomes_alert) {
    controller->dispatchInput(InputEvent::Up);
    EXPECT_TRUE(hasAlert("Alpha error: handler blew up", AlertLevel::Error));

    controller->dispatchInput(InputEvent::Next); // still alive
    EXPECT_EQ(controller->active(), 1u);
  }

  TEST_F(ModeControllerTest, busy_resource_becomes_warn_alert) {
    alpha->request = sleeper("wifi");
    controller->dispatchInput(InputEvent::Select);
    controller->dispatchInput(InputEvent::Select);
    EXPECT_TRUE(hasAlert("Busy: wifi in use", AlertLevel::Warn));
    EXPECT_EQ(payloads->activeJobs().size(), 1u);
    payloads->cancelAll();
  }

  TEST_F(ModeControllerTest, spawn_failure_becomes_error_alert) {
    PayloadRequest r;
    r.command = "/nonexistent/kpm-tool";
    r.category = "misc";
    alpha->request = r;
    controller->dispatchInput(InputEvent::Select);
    EXPECT_TRUE(hasAlert("Spawn failed: /nonexistent/kpm-tool", AlertLevel::Error));
    EXPECT_FALSE(payloads->hasActiveJob(0));
  }

  TEST_F(ModeControllerTest, input_while_dark_only_wakes_the_display) {
    controller->dispatchInput(InputEvent::ToggleBacklight);
    EXPECT_FALSE(state->getSnapshot().backlightOn);

    controller->dispatchInput(InputEvent::Next);
    EXPECT_TRUE(state->getSnapshot().backlightOn);
    EXPECT_EQ(controller->active(), 0u);
    EXPECT_TRUE(alpha->received.empty());

    controller->dispatchInput(InputEvent::Next);
    EXPECT_EQ(controller->active(), 1u);
  }

  TEST_F(ModeControllerTest, select_by_name_is_case_insensitive) {
    EXPECT_TRUE(controller->selectByName("gAmMa"));
    EXPECT_EQ(controller->active(), 2u);
    EXPECT_FALSE(controller->selectByName("Delta"));
    EXPECT_TRUE(hasAlert("Unknown mode: Delta", AlertLevel::Warn));
    EXPECT_THROW(controller->select(9), std::out_of_range);
  }

  TEST_F(ModeControllerTest, exit_is_idempotent) {
    controller->exit(0);
    controller->exit(0);
    EXPECT_EQ(alpha->exits, 1);
    controller->enter(0);
    controller->enter(0);
    EXPECT_EQ(alpha->enters, 2);
  }

  TEST_F(ModeControllerTest, tick_reaches_only_active_mode) {
    controller->tick(std::chrono::steady_clock::now());
    controller->tick(std::chrono::steady_clock::now());
    EXPECT_EQ(alpha->ticks, 2);
    EXPECT_EQ(beta->ticks, 0);
  }

  TEST_F(ModeControllerTest, shutdown_exits_and_cancels_active_mode_jobs) {
    alpha->request = sleeper();
    controller->dispatchInput(InputEvent::Select);
    ASSERT_TRUE(alpha->lastJob.has_value());

    controller->shutdown();
    EXPECT_EQ(alpha->exits, 1);
    ASSERT_TRUE(payloads->waitFor(*alpha->lastJob, 5000ms));
    EXPECT_EQ(payloads->status(*alpha->lastJob).phase, kpm::core::JobPhase::Cancelled);
  }

  TEST(mode_controller, empty_registry_is_rejected) {
    StateStore state;
    PayloadManager payloads(state, std::make_shared<::testing::NiceMock<MockErrorMonitor>>(),
                            PayloadManager::Settings{});
    EXPECT_THROW(ModeController(ModeController::Registry{}, state, payloads),
                 std::invalid_argument);
  }

} // namespace kpm::test
