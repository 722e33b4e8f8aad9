#pragma once
/** @file  InputSource.hpp
 *  @brief Abstract producer of front-panel events.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>

#include "ui/InputEvent.hpp"

namespace kpm {
  namespace io {

    /**
 * @class InputSource
 * @brief Polled by the input-handling thread.
 *
 *  * Events come out in physical order; nothing is coalesced or dropped.
 *  * `poll()` returns at most one event and waits no longer than \p timeout.
 */
    class InputSource {
    public:
      virtual ~InputSource() = default;

      virtual std::optional<ui::InputEvent> poll(std::chrono::milliseconds timeout) = 0;
    };

  } // namespace io
} // namespace kpm
