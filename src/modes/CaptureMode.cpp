/* @file CaptureMode.cpp
 * @brief tcpdump presets
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/CaptureMode.hpp"

using namespace kpm::modes;

// tcpdump writes to stdout so the capture file PayloadManager opened gets the data.
CaptureMode::CaptureMode(ModeContext ctx)
    : PayloadMenuMode("Capture", "PCAP", ctx, "capture", false) {
  setItems({
      { "Full capture",
        [this] {
          launch(makeRequest("Packet capture", "tcpdump", { "-i", iface(), "-U", "-w", "-" },
                             "captures", "pcap"));
        } },
      { "HTTP traffic",
        [this] {
          launch(makeRequest("HTTP capture", "tcpdump", { "-i", iface(), "-A", "-l", "port", "80" },
                             "captures", "txt"));
        } },
      { "DNS queries",
        [this] {
          launch(makeRequest("DNS capture", "tcpdump", { "-i", iface(), "-l", "port", "53" },
                             "captures", "txt"));
        } },
  });
}

std::vector<std::string> CaptureMode::infoLines() const { return { "Iface  " + iface() }; }
