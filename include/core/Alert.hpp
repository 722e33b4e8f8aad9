#pragma once
/** @file  Alert.hpp
 *  @brief Operator-facing alert record shared by AlertLog, StateStore and Logger.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace kpm {
  namespace core {

    enum class AlertLevel : std::uint8_t { Info, Ok, Warn, Error, Count };
    static_assert(static_cast<std::uint8_t>(AlertLevel::Count) == 4,
                  "AlertLevel count changed please update toString()");

    inline const char* toString(AlertLevel level) {
      switch (level) {
      case AlertLevel::Info:
        return "INFO";
      case AlertLevel::Ok:
        return "OK";
      case AlertLevel::Warn:
        return "WARN";
      case AlertLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    /** Immutable once appended to the log. */
    struct Alert {
      std::chrono::system_clock::time_point timestamp{};
      AlertLevel level{ AlertLevel::Info };
      std::string message;
    };

  } // namespace core
} // namespace kpm
