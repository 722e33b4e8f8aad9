#pragma once
/** @file  SystemMode.hpp
 *  @brief Host metrics and housekeeping actions (kill all, clear alerts).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>

#include "io/ProcStats.hpp"
#include "modes/MenuMode.hpp"

namespace kpm::modes {

  /**
 * @class SystemMode
 * @brief Samples /proc every `data_refresh_s` on tick and caches the result in
 *        StateStore. Destructive entries need a second press inside the
 *        confirmation window.
 */
  class SystemMode : public MenuMode {
  public:
    explicit SystemMode(ModeContext ctx, io::ProcStats stats = io::ProcStats{});

    void onEnter() override;
    void onTick(std::chrono::steady_clock::time_point now) override;

  protected:
    std::vector<std::string> infoLines() const override;
    std::string statusLine() const override;
    std::string footer() const override { return "UP/DN:Sel OK:Run"; }

  private:
    void refresh();
    void killAll();
    void clearAlerts();

    ModeContext ctx_;
    io::ProcStats stats_;
    std::chrono::steady_clock::time_point lastRefresh_{};
  };

} // namespace kpm::modes
