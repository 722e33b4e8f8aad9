/* @file ShellsMode.cpp
 * @brief netcat listeners
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/ShellsMode.hpp"

#include "core/AppConfig.hpp"

using namespace kpm::modes;

namespace {
  constexpr std::chrono::seconds kListenerTimeout{ 3600 };
}

ShellsMode::ShellsMode(ModeContext ctx) : PayloadMenuMode("Shells", "SHEL", ctx, "shell", true) {
  const auto port = ctx.config.shellPort;
  setItems({
      { "Listen :" + std::to_string(port), [this, port] { listen(port); } },
      { "Listen :443", [this] { listen(443); } },
      { "Listen :80", [this] { listen(80); } },
  });
}

void ShellsMode::listen(std::uint16_t port) {
  const auto p = std::to_string(port);
  launch(makeRequest("Listener :" + p, "nc", { "-lvnp", p }, "shells", "log", kListenerTimeout));
}

std::vector<std::string> ShellsMode::infoLines() const {
  return { "Iface  " + iface(), "Runs in background" };
}
