/* @file MenuMode.cpp
 * @brief shared menu navigation
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/MenuMode.hpp"

using namespace kpm::modes;
using kpm::ui::InputEvent;

std::optional<Transition> MenuMode::onInput(InputEvent event) {
  switch (event) {
  case InputEvent::Prev:
    return Transition::prev();
  case InputEvent::Next:
    return Transition::next();
  case InputEvent::Up:
    if (!items_.empty())
      selected_ = (selected_ + items_.size() - 1) % items_.size();
    return std::nullopt;
  case InputEvent::Down:
    if (!items_.empty())
      selected_ = (selected_ + 1) % items_.size();
    return std::nullopt;
  case InputEvent::Select:
    if (selected_ < items_.size() && items_[selected_].action)
      items_[selected_].action();
    return std::nullopt;
  default:
    return std::nullopt;
  }
}

kpm::ui::ModeView MenuMode::view() const {
  ui::ModeView v;
  v.title = name();
  v.icon = icon();
  v.lines = infoLines();
  const std::size_t offset = v.lines.size();
  for (const auto& item : items_)
    v.lines.push_back(item.text);
  if (!items_.empty())
    v.selected = offset + selected_;
  v.status = statusLine();
  v.footer = footer();
  return v;
}

void MenuMode::setItems(std::vector<MenuItem> items) {
  items_ = std::move(items);
  if (selected_ >= items_.size())
    selected_ = 0;
}
