#pragma once
/** @file  NmapMode.hpp
 *  @brief Network scans against the configured target range.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/PayloadMenuMode.hpp"

namespace kpm::modes {

  /// Foreground only: leaving the mode with a scan running is refused.
  class NmapMode : public PayloadMenuMode {
  public:
    explicit NmapMode(ModeContext ctx);

  protected:
    std::vector<std::string> infoLines() const override;

  private:
    void scan(const std::string& label, std::vector<std::string> flags,
              std::chrono::seconds timeout = std::chrono::seconds{ 0 });
  };

} // namespace kpm::modes
