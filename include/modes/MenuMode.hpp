#pragma once
/** @file  MenuMode.hpp
 *  @brief Base class for list-driven modes.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "modes/Mode.hpp"

namespace kpm::modes {

  struct MenuItem {
    std::string text;
    std::function<void()> action;
  };

  /**
 * @class MenuMode
 * @brief UP/DOWN move the selection (wrapping), SELECT runs it,
 *        PREV/NEXT cycle modes.
 */
  class MenuMode : public Mode {
  public:
    using Mode::Mode;

    void onEnter() override { selected_ = 0; }
    std::optional<Transition> onInput(ui::InputEvent event) override;
    ui::ModeView view() const override;

    std::size_t selected() const { return selected_; }

  protected:
    void setItems(std::vector<MenuItem> items);

    /// Rows drawn above the menu (metrics etc.).
    virtual std::vector<std::string> infoLines() const { return {}; }
    virtual std::string statusLine() const { return {}; }
    virtual std::string footer() const { return "UP/DN:Sel OK:Run X:Stop"; }

    std::vector<MenuItem> items_;
    std::size_t selected_{ 0 };
  };

} // namespace kpm::modes
