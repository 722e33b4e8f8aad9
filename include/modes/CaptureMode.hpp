#pragma once
/** @file  CaptureMode.hpp
 *  @brief Packet capture presets (full pcap, HTTP, DNS).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/PayloadMenuMode.hpp"

namespace kpm::modes {

  class CaptureMode : public PayloadMenuMode {
  public:
    explicit CaptureMode(ModeContext ctx);

  protected:
    std::vector<std::string> infoLines() const override;
  };

} // namespace kpm::modes
