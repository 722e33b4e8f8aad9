// KaliPiMax headers
#include "core/Errors.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"

// KaliPiMax fakes
#include "FakeChildProcess.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL / Linux headers
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace kpm::test {

  using kpm::core::AlertLevel;
  using kpm::core::JobId;
  using kpm::core::JobPhase;
  using kpm::core::PayloadManager;
  using kpm::core::PayloadRequest;
  using kpm::core::ResourceBusy;
  using kpm::core::SpawnError;
  using kpm::core::StateStore;
  using kpm::core::TerminationStage;
  using namespace std::chrono_literals;
  namespace fs = std::filesystem;

  class PayloadManagerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      root = fs::temp_directory_path() /
             ("kpm_payload_" + std::to_string(::getpid()) + "_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name());
      fs::remove_all(root);

      errorMonitor = std::make_shared<::testing::NiceMock<MockErrorMonitor>>();
      state = std::make_unique<StateStore>(100);
    }

    void TearDown() override {
      manager.reset(); // joins every watcher
      std::error_code ec;
      fs::remove_all(root, ec);
    }

    void makeManager(std::chrono::milliseconds grace = 2000ms,
                     PayloadManager::ProcessFactory factory = {}) {
      PayloadManager::Settings s;
      s.captureRoot = root;
      s.terminationGrace = grace;
      manager = std::make_unique<PayloadManager>(
          *state, std::static_pointer_cast<kpm::core::ErrorMonitor>(errorMonitor), s,
          std::move(factory));
    }

    /// Every job gets a FakeChildProcess failing its waits per \p mode.
    void makeFailingManager(FakeChildProcess::FailMode mode) {
      makeManager(2000ms, [this, mode] {
        return std::make_unique<FakeChildProcess>(mode, waitFailures);
      });
    }

    static PayloadRequest shell(const std::string& script, const std::string& resourceClass = "",
                                std::chrono::seconds timeout = 0s) {
      PayloadRequest r;
      r.command = "/bin/sh";
      r.args = { "-c", script };
      r.resourceClass = resourceClass;
      r.timeout = timeout;
      r.category = "nmap";
      r.label = "Job";
      return r;
    }

    std::size_t countAlerts(const std::string& message) const {
      const auto alerts = state->getSnapshot().alerts;
      return static_cast<std::size_t>(std::count_if(
          alerts.begin(), alerts.end(), [&](const auto& a) { return a.message == message; }));
    }

    static std::string slurp(const fs::path& p) {
      std::ifstream in(p);
      std::stringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    /// Polls the capture file until it contains \p needle.
    static bool waitForOutput(const fs::path& p, const std::string& needle,
                              std::chrono::milliseconds limit = 3000ms) {
      const auto deadline = std::chrono::steady_clock::now() + limit;
      while (std::chrono::steady_clock::now() < deadline) {
        if (slurp(p).find(needle) != std::string::npos)
          return true;
        std::this_thread::sleep_for(10ms);
      }
      return false;
    }

    /// True once \p pid is dead: gone entirely or a zombie awaiting its new parent.
    static bool processGone(pid_t pid, std::chrono::milliseconds limit = 3000ms) {
      const auto deadline = std::chrono::steady_clock::now() + limit;
      while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(pid, 0) == -1 && errno == ESRCH)
          return true;
        const auto stat = slurp("/proc/" + std::to_string(pid) + "/stat");
        const auto close = stat.rfind(')');
        if (close != std::string::npos && close + 2 < stat.size() && stat[close + 2] == 'Z')
          return true;
        std::this_thread::sleep_for(10ms);
      }
      return false;
    }

    fs::path root;
    std::shared_ptr<std::atomic<int>> waitFailures = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<::testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<StateStore> state;
    std::unique_ptr<PayloadManager> manager;
  };

  TEST_F(PayloadManagerTest, completed_job_leaves_output_in_category_dir) {
    makeManager();
    auto req = shell("echo scan-report", "network");
    req.label = "Quick scan";
    const JobId id = manager->start(req);

    EXPECT_EQ(id, 1u);
    const auto early = manager->status(id).phase;
    EXPECT_TRUE(early == JobPhase::Running || early == JobPhase::Completed);
    const auto path = manager->outputPath(id);
    EXPECT_TRUE(fs::exists(path)); // exists as soon as start() returns
    EXPECT_EQ(path.parent_path(), root / "nmap");
    EXPECT_EQ(path.extension(), ".txt");
    EXPECT_EQ(path.filename().string().rfind("1-", 0), 0u);

    ASSERT_TRUE(manager->waitFor(id, 5000ms));
    const auto st = manager->status(id);
    EXPECT_EQ(st.phase, JobPhase::Completed);
    ASSERT_TRUE(st.exitCode.has_value());
    EXPECT_EQ(*st.exitCode, 0);
    EXPECT_NE(slurp(path).find("scan-report"), std::string::npos);

    const auto snap = state->getSnapshot();
    EXPECT_TRUE(snap.payloads.empty());
    ASSERT_TRUE(snap.lastOutcome.has_value());
    EXPECT_EQ(snap.lastOutcome->phase, JobPhase::Completed);
    EXPECT_EQ(countAlerts("Started: Quick scan"), 1u);
    EXPECT_EQ(countAlerts("Quick scan complete"), 1u);
  }

  TEST_F(PayloadManagerTest, running_job_is_visible_in_snapshot) {
    makeManager();
    const JobId id = manager->start(shell("sleep 30", "network"));
    const auto snap = state->getSnapshot();
    ASSERT_EQ(snap.payloads.size(), 1u);
    EXPECT_EQ(snap.payloads[0].id, id);
    EXPECT_EQ(snap.payloads[0].phase, JobPhase::Running);
    EXPECT_TRUE(manager->hasActiveJob(kpm::core::kNoMode));
    manager->cancel(id);
    ASSERT_TRUE(manager->waitFor(id, 5000ms));
  }

  TEST_F(PayloadManagerTest, nonzero_exit_is_failed_with_code) {
    makeManager();
    const JobId id = manager->start(shell("echo oops >&2; exit 3"));
    ASSERT_TRUE(manager->waitFor(id, 5000ms));

    const auto st = manager->status(id);
    EXPECT_EQ(st.phase, JobPhase::Failed);
    ASSERT_TRUE(st.exitCode.has_value());
    EXPECT_EQ(*st.exitCode, 3);
    EXPECT_EQ(countAlerts("Job failed (exit 3)"), 1u);
    EXPECT_NE(slurp(manager->outputPath(id)).find("oops"), std::string::npos); // stderr captured
  }

  TEST_F(PayloadManagerTest, held_resource_rejects_start_without_creating_job) {
    makeManager();
    auto capture = shell("sleep 30", "wifi");
    capture.label = "Handshake";
    const JobId first = manager->start(capture);

    try {
      manager->start(shell("echo deauth", "wifi"));
      FAIL() << "expected ResourceBusy";
    } catch (const ResourceBusy& e) {
      EXPECT_EQ(e.resourceClass(), "wifi");
      EXPECT_EQ(e.holder(), first);
    }
    EXPECT_EQ(manager->activeJobs(), std::vector<JobId>{ first });
    EXPECT_THROW(manager->status(first + 1), std::out_of_range);

    // a different class is unaffected
    const JobId other = manager->start(shell("true", "network"));
    ASSERT_TRUE(manager->waitFor(other, 5000ms));

    manager->cancel(first);
    ASSERT_TRUE(manager->waitFor(first, 5000ms));
    EXPECT_EQ(manager->status(first).phase, JobPhase::Cancelled);

    const JobId retry = manager->start(shell("echo deauth", "wifi"));
    ASSERT_TRUE(manager->waitFor(retry, 5000ms));
    EXPECT_EQ(manager->status(retry).phase, JobPhase::Completed);
  }

  TEST_F(PayloadManagerTest, deadline_ends_job_as_timed_out_and_kills_it) {
    makeManager(500ms);
    const JobId id = manager->start(shell("echo $$; exec sleep 30", "", 2s));
    ASSERT_TRUE(waitForOutput(manager->outputPath(id), "\n"));
    const pid_t pid = static_cast<pid_t>(std::stol(slurp(manager->outputPath(id))));

    const auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(manager->waitFor(id, 4000ms));
    const auto settledAfter = std::chrono::steady_clock::now() - begin;

    const auto st = manager->status(id);
    EXPECT_EQ(st.phase, JobPhase::TimedOut);
    EXPECT_LE(st.elapsed, 2500ms);
    EXPECT_LE(settledAfter, 2500ms);
    EXPECT_EQ(countAlerts("Job timed out (2s)"), 1u);

    errno = 0;
    EXPECT_EQ(::kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
  }

  TEST_F(PayloadManagerTest, term_ignoring_tool_times_out_within_default_grace) {
    makeManager(); // default 2000ms grace
    std::vector<TerminationStage> stages;
    std::mutex stagesMtx;
    manager->setTerminationHook([&](JobId, TerminationStage s) {
      std::lock_guard<std::mutex> lk(stagesMtx);
      stages.push_back(s);
    });

    const auto begin = std::chrono::steady_clock::now();
    const JobId id =
        manager->start(shell("trap '' TERM; echo ready; while :; do sleep 1; done", "", 1s));
    ASSERT_TRUE(waitForOutput(manager->outputPath(id), "ready"));
    ASSERT_TRUE(manager->waitFor(id, 6000ms));
    const auto settledAfter = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(manager->status(id).phase, JobPhase::TimedOut);
    EXPECT_EQ(countAlerts("Job timed out (1s)"), 1u);
    // deadline (1s) + grace (2s), plus at most 500ms to kill and reap
    EXPECT_GE(settledAfter, 2900ms);
    EXPECT_LE(settledAfter, 3500ms);
    std::lock_guard<std::mutex> lk(stagesMtx);
    EXPECT_EQ(stages, (std::vector<TerminationStage>{ TerminationStage::GracefulStop,
                                                      TerminationStage::ForceKill }));
  }

  TEST_F(PayloadManagerTest, finished_tool_leaves_no_background_children) {
    makeManager();
    const JobId id = manager->start(shell("sleep 30 & echo $!; exit 0"));
    ASSERT_TRUE(manager->waitFor(id, 5000ms));
    EXPECT_EQ(manager->status(id).phase, JobPhase::Completed);

    const pid_t orphan = static_cast<pid_t>(std::stol(slurp(manager->outputPath(id))));
    ASSERT_GT(orphan, 0);
    EXPECT_TRUE(processGone(orphan));
  }

  TEST_F(PayloadManagerTest, wait_failure_after_cancel_still_settles_cancelled) {
    makeFailingManager(FakeChildProcess::FailMode::OnWake);
    const JobId id = manager->start(shell("echo $$; exec sleep 30"));
    ASSERT_TRUE(waitForOutput(manager->outputPath(id), "\n"));
    const pid_t pid = static_cast<pid_t>(std::stol(slurp(manager->outputPath(id))));

    manager->cancel(id);
    ASSERT_TRUE(manager->waitFor(id, 5000ms));

    EXPECT_EQ(waitFailures->load(), 1);
    EXPECT_EQ(manager->status(id).phase, JobPhase::Cancelled);
    EXPECT_EQ(countAlerts("Cancelled: Job"), 1u);
    EXPECT_TRUE(processGone(pid));
  }

  TEST_F(PayloadManagerTest, wait_failure_without_cancel_is_failed) {
    makeFailingManager(FakeChildProcess::FailMode::OnFirst);
    const JobId id = manager->start(shell("exec sleep 30"));
    ASSERT_TRUE(manager->waitFor(id, 5000ms));

    EXPECT_EQ(waitFailures->load(), 1);
    const auto st = manager->status(id);
    EXPECT_EQ(st.phase, JobPhase::Failed);
    EXPECT_FALSE(st.exitCode.has_value());
    EXPECT_EQ(countAlerts("Cancelled: Job"), 0u);
  }

  TEST_F(PayloadManagerTest, second_cancel_is_a_no_op) {
    makeManager();
    const JobId id = manager->start(shell("sleep 30"));
    manager->cancel(id);
    manager->cancel(id);
    ASSERT_TRUE(manager->waitFor(id, 5000ms));
    manager->cancel(id); // terminal: still a no-op

    EXPECT_EQ(manager->status(id).phase, JobPhase::Cancelled);
    EXPECT_EQ(countAlerts("Cancelling: Job"), 1u);
    EXPECT_EQ(countAlerts("Cancelled: Job"), 1u);
  }

  TEST_F(PayloadManagerTest, cancel_unknown_job_throws) {
    makeManager();
    EXPECT_THROW(manager->cancel(42), std::out_of_range);
  }

  TEST_F(PayloadManagerTest, missing_binary_is_spawn_error_and_no_job) {
    makeManager();
    PayloadRequest req;
    req.command = "/nonexistent/kpm-missing-tool";
    req.resourceClass = "network";
    req.category = "nmap";
    req.label = "Ghost";

    EXPECT_THROW(manager->start(req), SpawnError);
    EXPECT_TRUE(manager->activeJobs().empty());
    EXPECT_EQ(countAlerts("Started: Ghost"), 0u);
    EXPECT_TRUE(state->getSnapshot().payloads.empty());
    EXPECT_TRUE(fs::is_empty(root / "nmap")); // capture file removed

    // resource class was not left held
    const JobId id = manager->start(shell("true", "network"));
    EXPECT_TRUE(manager->waitFor(id, 5000ms));
  }

  TEST_F(PayloadManagerTest, term_ignoring_process_is_force_killed) {
    makeManager(200ms);
    std::vector<TerminationStage> stages;
    std::mutex stagesMtx;
    manager->setTerminationHook([&](JobId, TerminationStage s) {
      std::lock_guard<std::mutex> lk(stagesMtx);
      stages.push_back(s);
    });

    const JobId id = manager->start(shell("trap '' TERM; echo ready; while :; do sleep 1; done"));
    ASSERT_TRUE(waitForOutput(manager->outputPath(id), "ready"));
    manager->cancel(id);
    ASSERT_TRUE(manager->waitFor(id, 5000ms));

    EXPECT_EQ(manager->status(id).phase, JobPhase::Cancelled);
    std::lock_guard<std::mutex> lk(stagesMtx);
    EXPECT_EQ(stages, (std::vector<TerminationStage>{ TerminationStage::GracefulStop,
                                                      TerminationStage::ForceKill }));
  }

  TEST_F(PayloadManagerTest, cooperative_process_needs_only_graceful_stop) {
    makeManager(2000ms);
    std::vector<TerminationStage> stages;
    std::mutex stagesMtx;
    manager->setTerminationHook([&](JobId, TerminationStage s) {
      std::lock_guard<std::mutex> lk(stagesMtx);
      stages.push_back(s);
    });

    const JobId id = manager->start(shell("exec sleep 30"));
    manager->cancel(id);
    ASSERT_TRUE(manager->waitFor(id, 5000ms));
    std::lock_guard<std::mutex> lk(stagesMtx);
    EXPECT_EQ(stages, std::vector<TerminationStage>{ TerminationStage::GracefulStop });
  }

  TEST_F(PayloadManagerTest, concurrent_cancels_reach_exactly_one_terminal_phase) {
    makeManager();
    const JobId id = manager->start(shell("sleep 30"));

    std::vector<std::thread> cancellers;
    for (int i = 0; i < 8; ++i)
      cancellers.emplace_back([&] { manager->cancel(id); });
    for (auto& t : cancellers)
      t.join();

    ASSERT_TRUE(manager->waitFor(id, 5000ms));
    EXPECT_EQ(manager->status(id).phase, JobPhase::Cancelled);
    EXPECT_EQ(countAlerts("Cancelling: Job"), 1u);
    EXPECT_EQ(countAlerts("Cancelled: Job"), 1u);
    EXPECT_EQ(countAlerts("Job complete"), 0u);
  }

  TEST_F(PayloadManagerTest, cancel_owned_by_only_touches_that_mode) {
    makeManager();
    auto a = shell("sleep 30");
    a.owner = 1;
    auto b = shell("sleep 30");
    b.owner = 2;
    const JobId ja = manager->start(a);
    const JobId jb = manager->start(b);

    EXPECT_TRUE(manager->hasActiveJob(1));
    manager->cancelOwnedBy(1);
    ASSERT_TRUE(manager->waitFor(ja, 5000ms));
    EXPECT_FALSE(manager->hasActiveJob(1));
    EXPECT_TRUE(manager->hasActiveJob(2));

    manager->cancelAll();
    ASSERT_TRUE(manager->waitFor(jb, 5000ms));
    EXPECT_TRUE(manager->activeJobs().empty());
  }

  TEST_F(PayloadManagerTest, shutdown_cancels_and_rejects_new_jobs) {
    makeManager(500ms);
    const JobId id = manager->start(shell("sleep 30"));
    manager->shutdown();
    EXPECT_EQ(manager->status(id).phase, JobPhase::Cancelled);
    EXPECT_THROW(manager->start(shell("true")), std::runtime_error);
  }

  TEST_F(PayloadManagerTest, per_command_timeout_overrides_default) {
    PayloadManager::Settings s;
    s.captureRoot = root;
    s.commandTimeouts["/bin/sh"] = 1s;
    manager = std::make_unique<PayloadManager>(
        *state, std::static_pointer_cast<kpm::core::ErrorMonitor>(errorMonitor), s);

    const JobId id = manager->start(shell("exec sleep 30"));
    ASSERT_TRUE(manager->waitFor(id, 4000ms));
    EXPECT_EQ(manager->status(id).phase, JobPhase::TimedOut);
  }

  TEST_F(PayloadManagerTest, constructor_rejects_bad_settings) {
    PayloadManager::Settings s;
    s.defaultTimeout = 0s;
    auto build = [this](std::shared_ptr<kpm::core::ErrorMonitor> monitor,
                        const PayloadManager::Settings& settings) {
      PayloadManager pm(*state, std::move(monitor), settings);
    };
    EXPECT_THROW(build(errorMonitor, s), std::invalid_argument);
    EXPECT_THROW(build(nullptr, PayloadManager::Settings{}), std::invalid_argument);
  }

  TEST_F(PayloadManagerTest, healthy_runs_never_escalate) {
    EXPECT_CALL(*errorMonitor, notifyFailure(::testing::_)).Times(0);
    makeManager();
    const JobId id = manager->start(shell("true", "network"));
    ASSERT_TRUE(manager->waitFor(id, 5000ms));
  }

} // namespace kpm::test
