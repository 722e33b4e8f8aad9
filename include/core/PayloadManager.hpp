#pragma once
/** @file  PayloadManager.hpp
 *  @brief Supervises external tool processes: start, timeout, cancel, capture.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// KaliPiMax headers
#include "core/ErrorMonitor.hpp" // PayloadManager reports StateCorruption to the error monitor
#include "core/PayloadTypes.hpp"
#include "io/ChildProcess.hpp"

namespace kpm {
  namespace core {

    class StateStore;

    /**
 * @class PayloadManager
 * @brief Owns every PayloadJob from creation to its terminal phase.
 *
 *  * `start()` never waits for the process; one watcher thread per job races
 *    process exit, the deadline and a cancel request.
 *  * The watcher is the only writer of a job's terminal phase. The first cause
 *    recorded under the job lock (exit, cancel, timeout) decides it.
 *  * At most one non-terminal job per exclusive resource class. The class map
 *    is updated with `start()` and with the terminal commit under one lock.
 *  * Lock order is manager → job. No I/O or process call under either lock.
 *  * Job outcomes are reported through StateStore only, never thrown.
 */
    class PayloadManager {
    public:
      using TerminationHook = std::function<void(JobId, TerminationStage)>;
      using ProcessFactory = std::function<std::unique_ptr<io::ChildProcess>()>;

      struct Settings {
        std::filesystem::path captureRoot{ "loot" };
        std::chrono::seconds defaultTimeout{ 300 };
        std::map<std::string, std::chrono::seconds> commandTimeouts; ///< keyed by command
        std::chrono::milliseconds terminationGrace{ 2000 }; ///< SIGTERM → SIGKILL
        std::size_t historyLimit{ 64 }; ///< terminal jobs kept for status() queries
      };

      /// \p processFactory defaults to plain io::ChildProcess handles.
      PayloadManager(StateStore& state, std::shared_ptr<ErrorMonitor> errorMonitor,
                     Settings settings, ProcessFactory processFactory = {});
      ~PayloadManager(); ///< shutdown()

      //---public API------------------------------------------------------
      /**
       * @brief Launch asynchronously and return the new job id.
       * @throws ResourceBusy    resource class held by a non-terminal job (no job created)
       * @throws SpawnError      binary or capture file unusable (no job registered)
       * @throws StateCorruption resource map out of sync with the job table
       */
      JobId start(const PayloadRequest& request);

      /// Idempotent and non-blocking. Throws `std::out_of_range` for an unknown id.
      void cancel(JobId id);

      JobStatus status(JobId id) const;
      std::filesystem::path outputPath(JobId id) const;

      /// Blocks until the job's terminal phase is published; false on timeout.
      bool waitFor(JobId id, std::chrono::milliseconds timeout) const;

      void cancelOwnedBy(ModeId owner);
      void cancelAll();
      bool hasActiveJob(ModeId owner) const;
      std::vector<JobId> activeJobs() const;

      /// Observes the two termination phases (called on the watcher thread).
      void setTerminationHook(TerminationHook hook);

      /// Cancel everything and join every watcher. Further `start()` calls throw.
      void shutdown();

      const Settings& settings() const { return settings_; }

      PayloadManager(const PayloadManager&) = delete;
      PayloadManager& operator=(const PayloadManager&) = delete;

    private:
      struct Job;

      std::shared_ptr<Job> find(JobId id) const;
      void watch(std::shared_ptr<Job> job);
      void stopProcess(Job& job);
      bool commit(Job& job, JobPhase phase, std::optional<int> exitCode, std::string detail);
      void announce(const Job& job, JobPhase phase, const std::optional<int>& exitCode);
      void notifyStage(JobId id, TerminationStage stage);
      void reportCorruption(const std::string& message);
      std::chrono::seconds timeoutFor(const PayloadRequest& request) const;
      std::filesystem::path makeOutputPath(JobId id, const PayloadRequest& request) const;
      void retireHistoryLocked(std::vector<std::shared_ptr<Job>>& retired);

      StateStore& state_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Settings settings_;
      ProcessFactory processFactory_;

      mutable std::mutex mtx_; ///< guards everything below
      std::map<JobId, std::shared_ptr<Job>> jobs_;
      std::unordered_map<std::string, JobId> holders_; ///< resource class → holding job
      JobId nextId_{ 1 };
      TerminationHook terminationHook_{};
      bool shuttingDown_{ false };
    };

  } // namespace core
} // namespace kpm
