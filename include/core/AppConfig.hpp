#pragma once
/** @file  AppConfig.hpp
 *  @brief Typed configuration surface consumed by the runtime.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace kpm::core {

  /**
 * @struct AppConfig
 * @brief Every key is optional in the JSON file; defaults match the LCD HAT build.
 */
  struct AppConfig {
    std::filesystem::path captureRoot{ "loot" };
    std::filesystem::path logPath{ "logs/kalipimax.log" };
    std::size_t alertCapacity{ 50 };

    std::chrono::milliseconds inputPoll{ 20 };
    std::chrono::milliseconds tick{ 250 };
    std::chrono::milliseconds render{ 500 };
    std::chrono::milliseconds renderActive{ 100 }; ///< while a payload runs
    std::chrono::seconds dataRefresh{ 2 };
    std::chrono::seconds backlightTimeout{ 60 };   ///< 0 = never
    std::chrono::seconds confirmWindow{ 3 };

    std::chrono::seconds defaultTimeout{ 300 };
    std::chrono::milliseconds terminationGrace{ 2000 };
    std::map<std::string, std::chrono::seconds> timeouts; ///< per command

    /// exclusive resource class → network interface
    std::map<std::string, std::string> resources{
      { "network", "eth0" }, { "responder", "eth0" }, { "wifi", "wlan1" },
      { "capture", "eth0" }, { "shell", "eth0" }
    };
    std::vector<std::string> lootCategories{ "nmap",  "responder", "mitm",    "deauth",
                                             "wifi",  "shells",    "captures" };

    std::string scanTarget{ "192.168.1.0/24" };
    std::string wifiTarget{ "FF:FF:FF:FF:FF:FF" };
    std::uint16_t shellPort{ 4444 };

    /// Interface mapped to \p resourceClass, or "" when unmapped.
    std::string interfaceFor(const std::string& resourceClass) const;
  };

  /// ADL hook for `json.get<AppConfig>()`. Throws `std::invalid_argument` on bad values.
  void from_json(const nlohmann::json& j, AppConfig& cfg);

  /// Wraps nlohmann type errors into `std::runtime_error("[AppConfig] ...")`.
  AppConfig parseAppConfig(const nlohmann::json& j);

} // namespace kpm::core
