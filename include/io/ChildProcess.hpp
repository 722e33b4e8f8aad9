#pragma once
/** @file  ChildProcess.hpp
 *  @brief RAII handle for one external tool running in its own process group.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Linux header
#include <sys/types.h> // pid_t

namespace kpm {
  namespace io {

    /**
 * @class ChildProcess
 * @brief Spawns a command with stdout/stderr redirected into a capture file
 *        and lets one owner thread wait for its exit.
 *
 *  * The child leads a new process group, so signals reach its own children too.
 *  * `waitExit()` races process exit, a deadline and an optional wake-up fd.
 *  * Reaping the leader SIGKILLs whatever is left in its group first, while
 *    the zombie still pins the group id.
 *  * The destructor SIGKILLs and reaps a child that is still alive.
 *  * Non-copyable (sole owner of the pid and pidfd).
 */
    class ChildProcess {

    public:
      enum class WaitResult { Exited, TimedOut, Woken, Error };

      //---ctr / dtr--------------------------------------------
      ChildProcess() = default;
      virtual ~ChildProcess();

      //---public API-------------------------------------------
      /** @returns false (see lastError()) if the binary or the capture file is unusable. */
      virtual bool spawn(const std::vector<std::string>& argv, const std::string& outputPath);

      /** Blocks until exit, \p timeout, or \p wakeFd becoming readable. */
      virtual WaitResult waitExit(std::chrono::milliseconds timeout, int wakeFd = -1);

      /** Sends \p sig to the whole process group; false if nothing was left to signal
       *  or the leader is already reaped. */
      virtual bool signalGroup(int sig);

      bool running() const { return pid_ > 0 && !reaped_; }
      bool reaped() const { return reaped_; }
      pid_t pid() const { return pid_; }

      std::optional<int> exitCode() const;   ///< set if the child called exit()
      std::optional<int> termSignal() const; ///< set if a signal killed the child
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      ChildProcess(const ChildProcess&) = delete;
      ChildProcess& operator=(const ChildProcess&) = delete;

    private:
      bool reap(int options);
      void closePidfd();

      /// reap poll slice when pidfd_open is unavailable (kernels < 5.3)
      static constexpr std::chrono::milliseconds kReapSlice{ 20 };

      pid_t pid_{ -1 };   ///< also the process-group id
      int pidfd_{ -1 };   ///< readable once the child exits (-1 = unsupported)
      int status_{ 0 };   ///< raw waitpid status
      bool reaped_{ false };
      bool statusKnown_{ false };
      std::string lastError_{};
    };
  } // namespace io
} // namespace kpm
