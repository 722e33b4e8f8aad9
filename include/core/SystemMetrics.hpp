#pragma once
/** @file  SystemMetrics.hpp
 *  @brief Cached host metrics shown by the System mode.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>

namespace kpm {
  namespace core {

    struct SystemMetrics {
      bool valid{ false }; ///< false until the first successful sample
      double cpuPercent{ 0.0 };
      double memPercent{ 0.0 };
      std::optional<double> tempCelsius;
      std::chrono::seconds uptime{ 0 };
    };

  } // namespace core
} // namespace kpm
