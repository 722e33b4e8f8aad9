/* @file NmapMode.cpp
 * @brief nmap scan presets
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/NmapMode.hpp"

#include "core/AppConfig.hpp"

using namespace kpm::modes;

NmapMode::NmapMode(ModeContext ctx) : PayloadMenuMode("Nmap", "NET", ctx, "network", false) {
  setItems({
      { "Quick scan", [this] { scan("Quick scan", { "-T4", "-F" }); } },
      { "Service scan", [this] { scan("Service scan", { "-sV", "-sC" }); } },
      { "Full port scan", [this] { scan("Full scan", { "-p-" }, std::chrono::seconds{ 600 }); } },
      { "Ping sweep", [this] { scan("Ping sweep", { "-sn" }); } },
  });
}

void NmapMode::scan(const std::string& label, std::vector<std::string> flags,
                    std::chrono::seconds timeout) {
  flags.push_back(ctx_.config.scanTarget);
  launch(makeRequest(label, "nmap", std::move(flags), "nmap", "txt", timeout));
}

std::vector<std::string> NmapMode::infoLines() const {
  return { "Target " + ctx_.config.scanTarget, "Iface  " + iface() };
}
