/* @file ResponderMode.cpp
 * @brief Responder launch presets
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/ResponderMode.hpp"

using namespace kpm::modes;

ResponderMode::ResponderMode(ModeContext ctx)
    : PayloadMenuMode("Responder", "RESP", ctx, "responder", true) {
  setItems({
      { "Basic poisoning", [this] { listen("Responder", { "-wrf" }); } },
      { "With SMB", [this] { listen("Responder+SMB", { "-wrfbF" }); } },
      { "With WPAD", [this] { listen("Responder+WPAD", { "-wrfP" }); } },
  });
}

void ResponderMode::listen(const std::string& label, std::vector<std::string> flags) {
  std::vector<std::string> args{ "-I", iface() };
  args.insert(args.end(), flags.begin(), flags.end());
  launch(makeRequest(label, "responder", std::move(args), "responder", "log"));
}

std::vector<std::string> ResponderMode::infoLines() const {
  return { "Iface  " + iface(), "Runs in background" };
}
