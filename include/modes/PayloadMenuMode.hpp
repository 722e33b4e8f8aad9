#pragma once
/** @file  PayloadMenuMode.hpp
 *  @brief Menu mode whose entries launch external tools through PayloadManager.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/PayloadTypes.hpp"
#include "modes/MenuMode.hpp"

namespace kpm::modes {

  /**
 * @class PayloadMenuMode
 * @brief Fills in owner / resource class / interface and tracks the last job.
 *
 *  `ResourceBusy` and `SpawnError` propagate to ModeController, which turns
 *  them into alerts.
 */
  class PayloadMenuMode : public MenuMode {
  public:
    PayloadMenuMode(std::string name, std::string icon, ModeContext ctx,
                    std::string resourceClass, bool background);

    bool allowsBackgroundContinuation() const override { return background_; }

  protected:
    /// Owner and resource class are filled in here; returns the new job id.
    core::JobId launch(core::PayloadRequest request);

    static core::PayloadRequest makeRequest(std::string label, std::string command,
                                            std::vector<std::string> args, std::string category,
                                            std::string extension = "txt",
                                            std::chrono::seconds timeout = std::chrono::seconds{ 0 });

    /// Network interface mapped to this mode's resource class.
    std::string iface() const;

    std::string statusLine() const override;

    ModeContext ctx_;
    std::string resourceClass_;

  private:
    bool background_;
    std::optional<core::JobId> lastJob_;
  };

} // namespace kpm::modes
