#pragma once
/** @file  ResponderMode.hpp
 *  @brief LLMNR/NBT-NS poisoning listeners; keeps running in the background.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/PayloadMenuMode.hpp"

namespace kpm::modes {

  class ResponderMode : public PayloadMenuMode {
  public:
    explicit ResponderMode(ModeContext ctx);

  protected:
    std::vector<std::string> infoLines() const override;
    std::string footer() const override { return "UP/DN:Sel OK:Start X:Stop"; }

  private:
    void listen(const std::string& label, std::vector<std::string> flags);
  };

} // namespace kpm::modes
