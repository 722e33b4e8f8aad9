#pragma once
/** @file  ProcStats.hpp
 *  @brief CPU / memory / temperature / uptime sampler over procfs and sysfs.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include "core/SystemMetrics.hpp"

namespace kpm {
  namespace io {

    /**
 * @class ProcStats
 * @brief CPU% is the busy share since the previous `sample()` call, so the first
 *        sample reports the average since boot.
 */
    class ProcStats {
    public:
      explicit ProcStats(std::string procRoot = "/proc",
                         std::string thermalPath = "/sys/class/thermal/thermal_zone0/temp");

      /// `valid` is false if /proc/stat or /proc/meminfo could not be parsed.
      core::SystemMetrics sample();

    private:
      bool readCpu(double& percent);
      bool readMemory(double& percent) const;

      std::string procRoot_;
      std::string thermalPath_;
      std::uint64_t prevIdle_{ 0 };
      std::uint64_t prevTotal_{ 0 };
    };

  } // namespace io
} // namespace kpm
