/* @file main.cpp
 * @brief KaliPiMax entry point: config lookup, signal handling, keyboard simulator
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

// Linux header
#include <unistd.h>

// KaliPiMax headers
#include "core/SystemCoordinator.hpp"
#include "io/KeyboardInput.hpp"
#include "ui/ConsoleRenderer.hpp"

namespace {

  std::atomic<bool> gStop{ false };
  static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");

  extern "C" void onSignal(int) { gStop.store(true); }

  /// argv[1], else $KPM_HOME/config.json, else ./config.json when present.
  std::optional<std::string> findConfig(int argc, char** argv) {
    if (argc > 1)
      return std::string(argv[1]);
    if (const char* home = std::getenv("KPM_HOME")) {
      const auto p = std::filesystem::path(home) / "config.json";
      if (std::filesystem::exists(p))
        return p.string();
    }
    if (std::filesystem::exists("config.json"))
      return std::string("config.json");
    return std::nullopt;
  }

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  kpm::core::AppConfig config;
  const auto path = findConfig(argc, argv);
  if (path) {
    try {
      config = kpm::core::SystemCoordinator::loadConfig(*path);
    } catch (const std::exception& e) {
      std::cerr << e.what() << '\n';
      return EXIT_FAILURE;
    }
  } else {
    std::cerr << "[main] no config.json found, using built-in defaults\n";
  }

  kpm::io::KeyboardInput keyboard;
  if (!keyboard.open(STDIN_FILENO))
    std::cerr << "[main] stdin unavailable, running without input\n";
  kpm::ui::ConsoleRenderer renderer(std::cout, ::isatty(STDOUT_FILENO) == 1);

  try {
    kpm::core::SystemCoordinator coordinator(keyboard, renderer);
    coordinator.initialize(std::move(config));
    coordinator.run(gStop);
  } catch (const std::exception& e) {
    keyboard.close();
    std::cerr << "[main] " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  keyboard.close();
  return EXIT_SUCCESS;
}
