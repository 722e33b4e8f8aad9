#pragma once
/** @file  AlertsMode.hpp
 *  @brief Scrollable view of the alert journal, newest first.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstddef>

#include "modes/Mode.hpp"

namespace kpm::modes {

  /**
 * @class AlertsMode
 * @brief UP/DOWN scroll, SELECT jumps back to the newest entry,
 *        CANCEL clears the journal.
 */
  class AlertsMode : public Mode {
  public:
    explicit AlertsMode(ModeContext ctx);

    void onEnter() override { offset_ = 0; }
    std::optional<Transition> onInput(ui::InputEvent event) override;
    ui::ModeView view() const override;

    static constexpr std::size_t kVisibleRows = 8;

  private:
    ModeContext ctx_;
    std::size_t offset_{ 0 }; ///< rows skipped from the newest entry
  };

} // namespace kpm::modes
