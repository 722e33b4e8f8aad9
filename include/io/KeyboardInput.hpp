#pragma once
/** @file  KeyboardInput.hpp
 *  @brief Terminal keyboard stand-in for the LCD HAT buttons.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h>

#include "io/InputSource.hpp"

namespace kpm {
  namespace io {

    /**
 * @class KeyboardInput
 * @brief Reads a tty (or pipe) in non-canonical mode and decodes key presses.
 *
 *  | key                    | event           |
 *  |------------------------|-----------------|
 *  | ← / a                  | Prev            |
 *  | → / d / 2 (KEY2)       | Next            |
 *  | ↑ / w, ↓ / s           | Up, Down        |
 *  | Enter / space          | Select          |
 *  | x / Backspace / 3 / Esc| Cancel          |
 *  | b / 1 (KEY1)           | ToggleBacklight |
 *
 *  * Restores the saved termios on `close()` / destruction.
 */
    class KeyboardInput : public InputSource {

    public:
      KeyboardInput() = default;
      ~KeyboardInput() override;

      /** @returns false if \p fd is invalid or its termios cannot be changed. */
      bool open(int fd);

      std::optional<ui::InputEvent> poll(std::chrono::milliseconds timeout) override;

      void close();

      KeyboardInput(const KeyboardInput&) = delete;
      KeyboardInput& operator=(const KeyboardInput&) = delete;

    private:
      std::optional<ui::InputEvent> decode();

      int fd_{ -1 };
      bool restoreTermios_{ false };
      termios saved_{};
      std::string rx_buffer_{}; ///< undecoded bytes
    };

  } // namespace io
} // namespace kpm
