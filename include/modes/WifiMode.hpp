#pragma once
/** @file  WifiMode.hpp
 *  @brief Monitor-mode, survey, deauth and handshake capture on the wifi adapter.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/PayloadMenuMode.hpp"

namespace kpm::modes {

  class WifiMode : public PayloadMenuMode {
  public:
    explicit WifiMode(ModeContext ctx);

  protected:
    std::vector<std::string> infoLines() const override;

  private:
    void enableMonitor();
    void survey();
    void deauth();
    void captureHandshake();
  };

} // namespace kpm::modes
