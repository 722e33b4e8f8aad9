/* @file ProcStats.cpp
 * @brief procfs readers for the System mode
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "io/ProcStats.hpp"

#include <fstream>
#include <sstream>

using namespace kpm::io;

ProcStats::ProcStats(std::string procRoot, std::string thermalPath)
    : procRoot_(std::move(procRoot)), thermalPath_(std::move(thermalPath)) {}

kpm::core::SystemMetrics ProcStats::sample() {
  core::SystemMetrics m;
  const bool cpuOk = readCpu(m.cpuPercent);
  const bool memOk = readMemory(m.memPercent);
  m.valid = cpuOk && memOk;

  std::ifstream uptime(procRoot_ + "/uptime");
  double up = 0.0;
  if (uptime >> up)
    m.uptime = std::chrono::seconds{ static_cast<long long>(up) };

  std::ifstream thermal(thermalPath_);
  long milli = 0;
  if (thermal >> milli)
    m.tempCelsius = static_cast<double>(milli) / 1000.0;

  return m;
}

// first line of /proc/stat: cpu user nice system idle iowait irq softirq steal ...
bool ProcStats::readCpu(double& percent) {
  std::ifstream in(procRoot_ + "/stat");
  std::string line;
  if (!std::getline(in, line) || line.rfind("cpu ", 0) != 0)
    return false;

  std::istringstream fields(line.substr(4));
  std::uint64_t value = 0;
  std::uint64_t total = 0;
  std::uint64_t idle = 0;
  for (int i = 0; fields >> value; ++i) {
    total += value;
    if (i == 3 || i == 4) // idle + iowait
      idle += value;
  }
  if (total == 0)
    return false;

  const std::uint64_t dTotal = total - prevTotal_;
  const std::uint64_t dIdle = idle - prevIdle_;
  prevTotal_ = total;
  prevIdle_ = idle;
  percent = dTotal == 0 ? 0.0 : 100.0 * static_cast<double>(dTotal - dIdle) / dTotal;
  return true;
}

bool ProcStats::readMemory(double& percent) const {
  std::ifstream in(procRoot_ + "/meminfo");
  std::string line;
  std::uint64_t total = 0;
  std::uint64_t available = 0;
  // some rows (HugePages_*) carry no unit, so parse line by line
  while (std::getline(in, line)) {
    std::istringstream row(line);
    std::string key;
    std::uint64_t value = 0;
    if (!(row >> key >> value))
      continue;
    if (key == "MemTotal:")
      total = value;
    else if (key == "MemAvailable:")
      available = value;
  }
  if (total == 0 || available > total)
    return false;
  percent = 100.0 * static_cast<double>(total - available) / static_cast<double>(total);
  return true;
}
