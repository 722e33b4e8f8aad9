/* @file AppConfig.cpp
 * @brief JSON → AppConfig schema mapping and validation
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/AppConfig.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace kpm::core {

  namespace {

    constexpr long long kMaxAlertCapacity = 10000;

    template <typename Duration>
    void readDuration(const nlohmann::json& j, const char* key, Duration& out) {
      if (!j.contains(key))
        return;
      const auto value = j.at(key).get<long long>();
      if (value < 0)
        throw std::invalid_argument(std::string("[AppConfig] '") + key + "' must be >= 0");
      out = Duration{ value };
    }

    /// Integer keys are read wide and range-checked; a narrowing get<> would wrap.
    long long readBounded(const nlohmann::json& j, const char* key, long long fallback,
                          long long lo, long long hi) {
      if (!j.contains(key))
        return fallback;
      const auto value = j.at(key).get<long long>();
      if (value < lo || value > hi)
        throw std::invalid_argument(std::string("[AppConfig] '") + key + "' must be in [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) + "]");
      return value;
    }

  } // namespace

  std::string AppConfig::interfaceFor(const std::string& resourceClass) const {
    auto it = resources.find(resourceClass);
    return it == resources.end() ? std::string{} : it->second;
  }

  void from_json(const nlohmann::json& j, AppConfig& cfg) {
    if (!j.is_object())
      throw std::invalid_argument("[AppConfig] top-level value must be an object");

    if (j.contains("capture_root"))
      cfg.captureRoot = j.at("capture_root").get<std::string>();
    if (j.contains("log_path"))
      cfg.logPath = j.at("log_path").get<std::string>();

    cfg.alertCapacity = static_cast<std::size_t>(readBounded(
        j, "alert_capacity", static_cast<long long>(cfg.alertCapacity), 1, kMaxAlertCapacity));

    readDuration(j, "input_poll_ms", cfg.inputPoll);
    readDuration(j, "tick_ms", cfg.tick);
    readDuration(j, "render_ms", cfg.render);
    readDuration(j, "render_active_ms", cfg.renderActive);
    readDuration(j, "data_refresh_s", cfg.dataRefresh);
    readDuration(j, "backlight_timeout_s", cfg.backlightTimeout);
    readDuration(j, "confirm_window_s", cfg.confirmWindow);
    readDuration(j, "default_timeout_s", cfg.defaultTimeout);
    readDuration(j, "termination_grace_ms", cfg.terminationGrace);

    if (cfg.tick.count() == 0 || cfg.inputPoll.count() == 0 || cfg.render.count() == 0 ||
        cfg.renderActive.count() == 0)
      throw std::invalid_argument("[AppConfig] loop intervals must be > 0");
    if (cfg.defaultTimeout.count() == 0)
      throw std::invalid_argument("[AppConfig] 'default_timeout_s' must be > 0");

    if (j.contains("timeouts")) {
      for (const auto& [command, seconds] : j.at("timeouts").items()) {
        const auto value = seconds.get<long long>();
        if (value <= 0)
          throw std::invalid_argument("[AppConfig] timeout for '" + command + "' must be > 0");
        cfg.timeouts[command] = std::chrono::seconds{ value };
      }
    }

    // merged over the defaults so a partial map keeps the other classes
    if (j.contains("resources")) {
      for (const auto& [resourceClass, iface] : j.at("resources").items())
        cfg.resources[resourceClass] = iface.get<std::string>();
    }

    if (j.contains("loot_categories"))
      cfg.lootCategories = j.at("loot_categories").get<std::vector<std::string>>();

    cfg.scanTarget = j.value("scan_target", cfg.scanTarget);
    cfg.wifiTarget = j.value("wifi_target", cfg.wifiTarget);
    cfg.shellPort =
        static_cast<std::uint16_t>(readBounded(j, "shell_port", cfg.shellPort, 1, 65535));
  }

  AppConfig parseAppConfig(const nlohmann::json& j) {
    try {
      return j.get<AppConfig>();
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("[AppConfig] ") + e.what());
    }
  }

} // namespace kpm::core
