/* @file SystemMode.cpp
 * @brief metrics refresh + housekeeping menu
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/SystemMode.hpp"

#include <cstdio>

#include "core/AppConfig.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"

using namespace kpm::modes;
using kpm::core::AlertLevel;

namespace {

  std::string formatUptime(std::chrono::seconds up) {
    const long total = static_cast<long>(up.count());
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%ldd %02ld:%02ld", total / 86400, (total % 86400) / 3600,
                  (total % 3600) / 60);
    return buf;
  }

  std::string percent(const char* label, double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %5.1f%%", label, value);
    return buf;
  }

} // namespace

SystemMode::SystemMode(ModeContext ctx, io::ProcStats stats)
    : MenuMode("System", "SYS"), ctx_(ctx), stats_(std::move(stats)) {
  setItems({
      { "Refresh", [this] { refresh(); } },
      { "Kill all tools", [this] { killAll(); } },
      { "Clear alerts", [this] { clearAlerts(); } },
  });
}

void SystemMode::onEnter() {
  MenuMode::onEnter();
  refresh();
}

void SystemMode::onTick(std::chrono::steady_clock::time_point now) {
  if (now - lastRefresh_ < ctx_.config.dataRefresh)
    return;
  refresh();
  lastRefresh_ = now;
}

void SystemMode::refresh() {
  ctx_.state.setSystemMetrics(stats_.sample());
  lastRefresh_ = std::chrono::steady_clock::now();
}

void SystemMode::killAll() {
  const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(ctx_.config.confirmWindow);
  if (!ctx_.state.requestConfirm("kill_all", window)) {
    ctx_.state.addAlert("Press again to kill all tools", AlertLevel::Warn);
    return;
  }
  const auto n = ctx_.payloads.activeJobs().size();
  ctx_.payloads.cancelAll();
  ctx_.state.addAlert("Stopping " + std::to_string(n) + " tool(s)", AlertLevel::Ok);
}

void SystemMode::clearAlerts() {
  const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(ctx_.config.confirmWindow);
  if (!ctx_.state.requestConfirm("clear_alerts", window)) {
    ctx_.state.addAlert("Press again to clear alerts", AlertLevel::Warn);
    return;
  }
  ctx_.state.clearAlerts();
}

std::vector<std::string> SystemMode::infoLines() const {
  const auto m = ctx_.state.getSnapshot().metrics;
  if (!m.valid)
    return { "Metrics unavailable" };

  std::vector<std::string> lines{ percent("CPU", m.cpuPercent), percent("MEM", m.memPercent) };
  if (m.tempCelsius) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "TEMP %.1fC", *m.tempCelsius);
    lines.emplace_back(buf);
  } else {
    lines.emplace_back("TEMP n/a");
  }
  lines.push_back("UP " + formatUptime(m.uptime));
  return lines;
}

std::string SystemMode::statusLine() const {
  const auto n = ctx_.payloads.activeJobs().size();
  return n == 0 ? "No tools running" : std::to_string(n) + " tool(s) running";
}
