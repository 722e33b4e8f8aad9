/* @file ModeController.cpp
 * @brief mode FSM + input routing
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/ModeController.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"

using namespace kpm::core;
using kpm::ui::InputEvent;

namespace {

  bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
             return std::tolower(x) == std::tolower(y);
           });
  }

} // namespace

// Handler exceptions end here as alerts.
template <typename Fn> void ModeController::guarded(const char* hook, Fn&& fn) {
  const auto& name = registry_[active_]->name();
  try {
    fn();
  } catch (const ResourceBusy& e) {
    state_.addAlert("Busy: " + e.resourceClass() + " in use", AlertLevel::Warn);
  } catch (const SpawnError& e) {
    state_.addAlert("Spawn failed: " + e.command(), AlertLevel::Error);
  } catch (const StateCorruption& e) {
    // already escalated through ErrorMonitor by PayloadManager
    std::cerr << "[ModeController] " << name << "::" << hook << ": " << e.what() << '\n';
  } catch (const std::exception& e) {
    std::cerr << "[ModeController] " << name << "::" << hook << ": " << e.what() << '\n';
    state_.addAlert(name + " error: " + e.what(), AlertLevel::Error);
  }
}

ModeController::ModeController(Registry registry, StateStore& state, PayloadManager& payloads)
    : registry_(std::move(registry)), state_(state), payloads_(payloads) {
  if (registry_.empty())
    throw std::invalid_argument("[ModeController] empty mode registry");
  for (ModeId i = 0; i < registry_.size(); ++i) {
    if (!registry_[i])
      throw std::invalid_argument("[ModeController] null mode at index " + std::to_string(i));
    registry_[i]->id_ = i;
  }
  entered_.assign(registry_.size(), false);
}

void ModeController::start() {
  if (started_)
    return;
  started_ = true;
  active_ = 0;
  state_.setActiveMode(active_);
  enter(active_);
  publishView();
}

//---input routing-------------------------------------------------------

void ModeController::dispatchInput(InputEvent event) {
  const bool wasDark = !state_.getSnapshot().backlightOn;
  state_.touchInput();
  if (wasDark) {
    state_.setBacklight(true); // wake only, the press is consumed
    return;
  }

  if (event == InputEvent::ToggleBacklight) {
    state_.setBacklight(false);
    return;
  }

  if (event == InputEvent::Cancel && payloads_.hasActiveJob(active_)) {
    guarded("cancel", [&] { payloads_.cancelOwnedBy(active_); });
    publishView();
    return;
  }

  std::optional<modes::Transition> request;
  guarded("onInput", [&] { request = registry_[active_]->onInput(event); });
  if (request)
    apply(*request);
  publishView();
}

void ModeController::tick(std::chrono::steady_clock::time_point now) {
  guarded("onTick", [&] { registry_[active_]->onTick(now); });
  publishView();
}

//---transitions---------------------------------------------------------

bool ModeController::next() { return transitionTo((active_ + 1) % registry_.size()); }

bool ModeController::prev() {
  return transitionTo((active_ + registry_.size() - 1) % registry_.size());
}

bool ModeController::select(ModeId id) {
  if (id >= registry_.size())
    throw std::out_of_range("[ModeController] no mode " + std::to_string(id));
  return transitionTo(id);
}

bool ModeController::selectByName(const std::string& name) {
  for (const auto& m : registry_)
    if (equalsIgnoreCase(m->name(), name))
      return transitionTo(m->id());
  state_.addAlert("Unknown mode: " + name, AlertLevel::Warn);
  return false;
}

bool ModeController::transitionTo(ModeId target) {
  if (target == active_)
    return true;

  auto& current = *registry_[active_];
  if (payloads_.hasActiveJob(active_) && !current.allowsBackgroundContinuation()) {
    state_.addAlert("Payload running - cancel first", AlertLevel::Warn);
    return false;
  }

  exit(active_);
  active_ = target;
  state_.setActiveMode(active_);
  enter(active_);
  publishView();
  return true;
}

void ModeController::apply(const modes::Transition& t) {
  switch (t.kind) {
  case modes::Transition::Kind::Prev:
    prev();
    break;
  case modes::Transition::Kind::Next:
    next();
    break;
  case modes::Transition::Kind::Goto:
    if (t.target < registry_.size())
      transitionTo(t.target);
    else
      state_.addAlert("Unknown mode #" + std::to_string(t.target), AlertLevel::Warn);
    break;
  }
}

//---lifecycle-----------------------------------------------------------

void ModeController::enter(ModeId id) {
  if (entered_.at(id))
    return;
  entered_[id] = true;
  guarded("onEnter", [&] { registry_[id]->onEnter(); });
}

void ModeController::exit(ModeId id) {
  if (!entered_.at(id))
    return;
  entered_[id] = false;
  state_.cancelConfirm();
  guarded("onExit", [&] { registry_[id]->onExit(); });
}

void ModeController::shutdown() {
  if (!started_)
    return;
  exit(active_);
  payloads_.cancelOwnedBy(active_);
  started_ = false;
}

kpm::modes::Mode& ModeController::mode(ModeId id) const { return *registry_.at(id); }

//---helpers-------------------------------------------------------------

void ModeController::publishView() {
  ui::ModeView v;
  guarded("view", [&] { v = registry_[active_]->view(); });
  state_.setModeView(std::move(v));
}
