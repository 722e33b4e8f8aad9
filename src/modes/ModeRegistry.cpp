/* @file ModeRegistry.cpp
 * @brief mode registration
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/ModeRegistry.hpp"

#include "modes/AlertsMode.hpp"
#include "modes/CaptureMode.hpp"
#include "modes/NmapMode.hpp"
#include "modes/ResponderMode.hpp"
#include "modes/ShellsMode.hpp"
#include "modes/SystemMode.hpp"
#include "modes/WifiMode.hpp"

std::vector<std::unique_ptr<kpm::modes::Mode>> kpm::modes::buildModeRegistry(const ModeContext& ctx) {
  std::vector<std::unique_ptr<Mode>> registry;
  registry.push_back(std::make_unique<SystemMode>(ctx));
  registry.push_back(std::make_unique<NmapMode>(ctx));
  registry.push_back(std::make_unique<WifiMode>(ctx));
  registry.push_back(std::make_unique<ResponderMode>(ctx));
  registry.push_back(std::make_unique<CaptureMode>(ctx));
  registry.push_back(std::make_unique<ShellsMode>(ctx));
  registry.push_back(std::make_unique<AlertsMode>(ctx));
  return registry;
}
