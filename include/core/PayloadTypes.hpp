#pragma once
/** @file  PayloadTypes.hpp
 *  @brief Value types shared between PayloadManager, StateStore and the modes.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kpm {
  namespace core {

    using JobId = std::uint64_t;
    using ModeId = std::size_t;

    inline constexpr ModeId kNoMode = static_cast<ModeId>(-1);

    /**
 * @enum JobPhase
 * @brief PENDING → RUNNING → {COMPLETED, FAILED, TIMED_OUT, CANCELLED}.
 *
 *  The four right-hand phases are absorbing.
 */
    enum class JobPhase : std::uint8_t { Pending, Running, Completed, Failed, TimedOut, Cancelled };

    constexpr bool isTerminal(JobPhase phase) {
      return phase != JobPhase::Pending && phase != JobPhase::Running;
    }

    inline const char* toString(JobPhase phase) {
      switch (phase) {
      case JobPhase::Pending:
        return "PENDING";
      case JobPhase::Running:
        return "RUNNING";
      case JobPhase::Completed:
        return "COMPLETED";
      case JobPhase::Failed:
        return "FAILED";
      case JobPhase::TimedOut:
        return "TIMED_OUT";
      case JobPhase::Cancelled:
        return "CANCELLED";
      default:
        return "UNKNOWN";
      }
    }

    /// The two halves of a forced stop, reported separately to the termination hook.
    enum class TerminationStage : std::uint8_t { GracefulStop, ForceKill };

    /** What a mode asks PayloadManager to run. */
    struct PayloadRequest {
      std::string command;           ///< resolved through PATH
      std::vector<std::string> args; ///< argv[1..]
      std::string resourceClass;     ///< empty = no exclusive resource
      std::chrono::seconds timeout{ 0 }; ///< 0 = configured default for `command`
      std::string category;          ///< loot subdirectory
      std::string extension{ "txt" };
      std::string label;             ///< operator-facing name; defaults to `command`
      ModeId owner{ kNoMode };
    };

    /** Read-only summary of a job, published through StateStore. */
    struct PayloadView {
      JobId id{ 0 };
      std::string label;
      ModeId owner{ kNoMode };
      std::string resourceClass;
      JobPhase phase{ JobPhase::Pending };
      std::chrono::steady_clock::time_point startedAt{};
      std::string detail; ///< e.g. "exit 2", "signal 9", output path
    };

    struct JobStatus {
      JobPhase phase{ JobPhase::Pending };
      std::chrono::milliseconds elapsed{ 0 };
      std::optional<int> exitCode; ///< terminal phases only
    };

  } // namespace core
} // namespace kpm
