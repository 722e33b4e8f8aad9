#pragma once
/** @file  ConsoleRenderer.hpp
 *  @brief Text-mode stand-in for the 128×128 LCD.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ui/Renderer.hpp"

namespace kpm {
  namespace ui {

    /**
 * @class ConsoleRenderer
 * @brief Same API shape as the panel driver: clear → drawText → flush.
 *
 *  * Keeps an off-screen frame of `kRows` text rows; `flush()` pushes it.
 *  * Backlight off → one blank frame, then nothing until it comes back on.
 */
    class ConsoleRenderer : public Renderer {
    public:
      static constexpr std::size_t kRows = 16;
      static constexpr std::size_t kCols = 32;
      static constexpr std::size_t kMenuVisible = 7;

      explicit ConsoleRenderer(std::ostream& out, bool ansi = true);

      void draw(const core::StateSnapshot& snapshot) override;

      /// Last frame pushed by flush(), one string per row.
      const std::vector<std::string>& frame() const { return frame_; }

    private:
      /* Text helpers --------------------------------------------------------- */
      void clear();
      void drawText(std::size_t row, const std::string& text);
      void flush();

      std::ostream& out_;
      bool ansi_;
      bool dark_{ false };
      std::vector<std::string> frame_;
    };

  } // namespace ui
} // namespace kpm
