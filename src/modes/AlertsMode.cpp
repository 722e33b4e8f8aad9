/* @file AlertsMode.cpp
 * @brief alert journal viewer
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/AlertsMode.hpp"

#include <algorithm>
#include <ctime>

#include "core/StateStore.hpp"

using namespace kpm::modes;
using kpm::ui::InputEvent;

namespace {

  std::string clockTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
  }

} // namespace

AlertsMode::AlertsMode(ModeContext ctx) : Mode("Alerts", "LOG"), ctx_(ctx) {}

std::optional<Transition> AlertsMode::onInput(InputEvent event) {
  switch (event) {
  case InputEvent::Prev:
    return Transition::prev();
  case InputEvent::Next:
    return Transition::next();
  case InputEvent::Up:
    if (offset_ > 0)
      --offset_;
    return std::nullopt;
  case InputEvent::Down: {
    const auto count = ctx_.state.getSnapshot().alerts.size();
    if (offset_ + 1 < count)
      ++offset_;
    return std::nullopt;
  }
  case InputEvent::Select:
    offset_ = 0;
    return std::nullopt;
  case InputEvent::Cancel:
    ctx_.state.clearAlerts();
    offset_ = 0;
    return std::nullopt;
  default:
    return std::nullopt;
  }
}

kpm::ui::ModeView AlertsMode::view() const {
  const auto alerts = ctx_.state.getSnapshot().alerts;

  ui::ModeView v;
  v.title = name();
  v.icon = icon();
  v.footer = "UP/DN:Scroll OK:Top X:Clear";

  if (alerts.empty()) {
    v.lines.emplace_back("No alerts");
    v.status = "0 entries";
    return v;
  }

  // newest first
  const std::size_t start = std::min(offset_, alerts.size() - 1);
  for (std::size_t i = start; i < alerts.size() && v.lines.size() < kVisibleRows; ++i) {
    const auto& a = alerts[alerts.size() - 1 - i];
    v.lines.push_back(std::string("[") + core::toString(a.level) + "] " + clockTime(a.timestamp) +
                      " " + a.message);
  }
  v.status = std::to_string(start + 1) + "/" + std::to_string(alerts.size());
  return v;
}
