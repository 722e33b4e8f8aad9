#pragma once
/** @file  ShellsMode.hpp
 *  @brief Reverse-shell listeners; keeps running in the background.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstdint>

#include "modes/PayloadMenuMode.hpp"

namespace kpm::modes {

  class ShellsMode : public PayloadMenuMode {
  public:
    explicit ShellsMode(ModeContext ctx);

  protected:
    std::vector<std::string> infoLines() const override;

  private:
    void listen(std::uint16_t port);
  };

} // namespace kpm::modes
