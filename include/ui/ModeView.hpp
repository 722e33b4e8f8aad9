#pragma once
/** @file  ModeView.hpp
 *  @brief Render model a mode publishes for the renderer.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kpm {
  namespace ui {

    struct ModeView {
      std::string title;
      std::string icon;
      std::vector<std::string> lines;      ///< info rows and/or menu entries
      std::optional<std::size_t> selected; ///< highlighted row in `lines`
      std::string status;                  ///< mode-specific status indicator
      std::string footer;                  ///< control hints

      bool operator==(const ModeView&) const = default;
    };

  } // namespace ui
} // namespace kpm
