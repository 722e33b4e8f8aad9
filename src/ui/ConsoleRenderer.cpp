/* @file ConsoleRenderer.cpp
 * @brief snapshot → text frame
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "ui/ConsoleRenderer.hpp"

#include <algorithm>

#include "core/StateStore.hpp"

using namespace kpm::ui;

namespace {

  std::string elapsedText(std::chrono::steady_clock::time_point since) {
    const auto s = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::steady_clock::now() - since)
                       .count();
    return std::to_string(std::max<long long>(s, 0)) + "s";
  }

} // namespace

ConsoleRenderer::ConsoleRenderer(std::ostream& out, bool ansi)
    : out_(out), ansi_(ansi), frame_(kRows) {}

void ConsoleRenderer::draw(const kpm::core::StateSnapshot& s) {
  if (!s.backlightOn) {
    if (!dark_) {
      clear();
      flush();
    }
    dark_ = true;
    return;
  }
  dark_ = false;

  clear();
  std::size_t row = 0;

  // payload status bar
  if (!s.payloads.empty()) {
    const auto& p = s.payloads.front();
    std::string bar = "* " + p.label.substr(0, 14) + " (" + elapsedText(p.startedAt) + ")";
    if (s.payloads.size() > 1)
      bar += " +" + std::to_string(s.payloads.size() - 1);
    drawText(row++, bar);
  }

  const auto& v = s.modeView;
  drawText(row++, (v.icon.empty() ? "" : v.icon + " ") + v.title);

  // scroll window keeps the selection visible
  std::size_t first = 0;
  if (v.selected && *v.selected >= kMenuVisible)
    first = *v.selected - kMenuVisible + 1;
  for (std::size_t i = first; i < v.lines.size() && i < first + kMenuVisible; ++i) {
    const bool sel = v.selected && *v.selected == i;
    drawText(row++, (sel ? "> " : "  ") + v.lines[i]);
  }

  if (!v.status.empty())
    drawText(row++, v.status);

  if (!s.alerts.empty() && row < kRows - 1) {
    const auto& a = s.alerts.back();
    drawText(row++, std::string("[") + kpm::core::toString(a.level) + "] " + a.message);
  }

  if (!v.footer.empty())
    drawText(kRows - 1, v.footer);

  flush();
}

void ConsoleRenderer::clear() {
  for (auto& line : frame_)
    line.clear();
}

void ConsoleRenderer::drawText(std::size_t row, const std::string& text) {
  if (row >= kRows)
    return;
  frame_[row] = text.substr(0, kCols);
}

void ConsoleRenderer::flush() {
  if (ansi_)
    out_ << "\x1b[H\x1b[2J";
  for (const auto& line : frame_)
    out_ << line << '\n';
  out_.flush();
}
