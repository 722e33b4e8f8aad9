#pragma once
/** @file  InputEvent.hpp
 *  @brief Discrete front-panel events (buttons + joystick).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstdint>

namespace kpm {
  namespace ui {

    /** Fixed vocabulary emitted by every InputSource. */
    enum class InputEvent : std::uint8_t {
      Prev,
      Next,
      Up,
      Down,
      Select,
      Cancel,
      ToggleBacklight,
    };

    inline const char* toString(InputEvent e) {
      switch (e) {
      case InputEvent::Prev:
        return "PREV";
      case InputEvent::Next:
        return "NEXT";
      case InputEvent::Up:
        return "UP";
      case InputEvent::Down:
        return "DOWN";
      case InputEvent::Select:
        return "SELECT";
      case InputEvent::Cancel:
        return "CANCEL";
      case InputEvent::ToggleBacklight:
        return "TOGGLE_BACKLIGHT";
      default:
        return "Unknown";
      }
    }

  } // namespace ui
} // namespace kpm
