#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy for the payload subsystem.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 *
 *  TimedOut and ProcessFailed are not exceptions: they are terminal JobPhases.
 */

#include <stdexcept>
#include <string>

#include "core/PayloadTypes.hpp"

namespace kpm {
  namespace core {

    class PayloadError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Exclusive resource already held by a non-terminal job. Recoverable.
    class ResourceBusy : public PayloadError {
    public:
      ResourceBusy(const std::string& resourceClass, JobId holder)
          : PayloadError("[PayloadManager] resource '" + resourceClass + "' held by job " +
                         std::to_string(holder)),
            resourceClass_(resourceClass), holder_(holder) {}

      const std::string& resourceClass() const { return resourceClass_; }
      JobId holder() const { return holder_; }

    private:
      std::string resourceClass_;
      JobId holder_;
    };

    /// Binary missing / not executable, or capture file not writable. No job is created.
    class SpawnError : public PayloadError {
    public:
      SpawnError(const std::string& command, const std::string& reason)
          : PayloadError("[PayloadManager] cannot spawn '" + command + "': " + reason),
            command_(command) {}

      const std::string& command() const { return command_; }

    private:
      std::string command_;
    };

    /// Internal invariant violated (e.g. resource map out of sync). Fatal.
    class StateCorruption : public PayloadError {
    public:
      using PayloadError::PayloadError;
    };

  } // namespace core
} // namespace kpm
