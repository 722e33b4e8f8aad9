/* @file StateStore.cpp
 * @brief copy-on-write status store: serialized writers, lock-light readers
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/StateStore.hpp"

#include <algorithm>

using namespace kpm::core;

StateStore::StateStore(std::size_t alertCapacity) : log_(alertCapacity) {
  live_.lastInput = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lk(mtx_);
  publishLocked();
}

StateSnapshot StateStore::getSnapshot() const {
  std::shared_ptr<const StateSnapshot> current;
  {
    std::lock_guard<std::mutex> lk(publishMtx_);
    current = published_;
  }
  return *current;
}

template <typename Fn> void StateStore::mutate(Fn&& fn) {
  std::lock_guard<std::mutex> lk(mtx_);
  fn(live_);
  publishLocked();
}

// caller holds mtx_
void StateStore::publishLocked() {
  ++live_.revision;
  auto next = std::make_shared<StateSnapshot>(live_);
  next->alerts = log_.entries();
  std::lock_guard<std::mutex> lk(publishMtx_);
  published_ = std::move(next);
}

void StateStore::setActiveMode(ModeId id) {
  mutate([id](StateSnapshot& s) { s.activeMode = id; });
}

void StateStore::setBacklight(bool on) {
  mutate([on](StateSnapshot& s) { s.backlightOn = on; });
}

void StateStore::touchInput() {
  const auto now = std::chrono::steady_clock::now();
  mutate([now](StateSnapshot& s) { s.lastInput = now; });
}

void StateStore::addAlert(const std::string& message, AlertLevel level) {
  Alert alert{ std::chrono::system_clock::now(), level, message };
  AlertSink sink;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    log_.append(alert);
    publishLocked();
    sink = sink_;
  }
  if (sink)
    sink(alert);
}

void StateStore::clearAlerts() {
  std::lock_guard<std::mutex> lk(mtx_);
  log_.clear();
  publishLocked();
}

void StateStore::recordPayloadUpdate(const PayloadView& update) {
  mutate([&update](StateSnapshot& s) {
    auto it = std::find_if(s.payloads.begin(), s.payloads.end(),
                           [&](const PayloadView& v) { return v.id == update.id; });
    if (isTerminal(update.phase)) {
      if (it != s.payloads.end())
        s.payloads.erase(it);
      s.lastOutcome = update;
      return;
    }
    if (it != s.payloads.end())
      *it = update;
    else
      s.payloads.push_back(update);
  });
}

void StateStore::setSystemMetrics(const SystemMetrics& metrics) {
  mutate([&metrics](StateSnapshot& s) { s.metrics = metrics; });
}

// Unchanged views do not bump the revision, so an idle screen is not redrawn.
void StateStore::setModeView(ui::ModeView view) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (live_.modeView == view)
    return;
  live_.modeView = std::move(view);
  publishLocked();
}

bool StateStore::requestConfirm(const std::string& action, std::chrono::milliseconds window) {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lk(mtx_);
  if (pendingConfirm_ == action && now < confirmExpires_) {
    pendingConfirm_.clear();
    return true;
  }
  pendingConfirm_ = action;
  confirmExpires_ = now + window;
  return false;
}

void StateStore::cancelConfirm() {
  std::lock_guard<std::mutex> lk(mtx_);
  pendingConfirm_.clear();
}

void StateStore::setAlertSink(AlertSink sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = std::move(sink);
}
