/* @file PayloadMenuMode.cpp
 * @brief launch helper + running-job status line
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "modes/PayloadMenuMode.hpp"

#include <stdexcept>

#include "core/AppConfig.hpp"
#include "core/PayloadManager.hpp"

using namespace kpm::modes;

PayloadMenuMode::PayloadMenuMode(std::string name, std::string icon, ModeContext ctx,
                                 std::string resourceClass, bool background)
    : MenuMode(std::move(name), std::move(icon)), ctx_(ctx),
      resourceClass_(std::move(resourceClass)), background_(background) {}

kpm::core::JobId PayloadMenuMode::launch(core::PayloadRequest request) {
  request.owner = id();
  if (request.resourceClass.empty())
    request.resourceClass = resourceClass_;
  lastJob_ = ctx_.payloads.start(request);
  return *lastJob_;
}

kpm::core::PayloadRequest PayloadMenuMode::makeRequest(std::string label, std::string command,
                                                       std::vector<std::string> args,
                                                       std::string category, std::string extension,
                                                       std::chrono::seconds timeout) {
  core::PayloadRequest r;
  r.label = std::move(label);
  r.command = std::move(command);
  r.args = std::move(args);
  r.category = std::move(category);
  r.extension = std::move(extension);
  r.timeout = timeout;
  return r;
}

std::string PayloadMenuMode::iface() const { return ctx_.config.interfaceFor(resourceClass_); }

std::string PayloadMenuMode::statusLine() const {
  if (!lastJob_)
    return "Idle [" + iface() + "]";
  try {
    const auto s = ctx_.payloads.status(*lastJob_);
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(s.elapsed).count();
    return std::string(core::toString(s.phase)) + " #" + std::to_string(*lastJob_) + " " +
           std::to_string(secs) + "s";
  } catch (const std::out_of_range&) {
    return "Idle [" + iface() + "]"; // retired from the job history
  }
}
