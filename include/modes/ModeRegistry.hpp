#pragma once
/** @file  ModeRegistry.hpp
 *  @brief Builds the fixed navigation cycle of modes.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <memory>
#include <vector>

#include "modes/Mode.hpp"

namespace kpm::modes {

  /// Registration order is the navigation order: System, Nmap, WiFi,
  /// Responder, Capture, Shells, Alerts.
  std::vector<std::unique_ptr<Mode>> buildModeRegistry(const ModeContext& ctx);

} // namespace kpm::modes
