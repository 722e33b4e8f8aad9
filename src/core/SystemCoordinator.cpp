/* @file SystemCoordinator.cpp
 * @brief startup wiring, input loop, render thread, orderly shutdown
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/SystemCoordinator.hpp"

// STL headers
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

// third-party
#include <nlohmann/json.hpp>

// KaliPiMax headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ModeController.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"
#include "io/InputSource.hpp"
#include "modes/ModeRegistry.hpp"
#include "ui/Renderer.hpp"

using namespace kpm::core;
using Clock = std::chrono::steady_clock;

const char* kpm::core::toString(SystemCoordinator::State s) {
  switch (s) {
  case SystemCoordinator::State::BOOT:
    return "BOOT";
  case SystemCoordinator::State::INIT:
    return "INIT";
  case SystemCoordinator::State::RUNNING:
    return "RUNNING";
  case SystemCoordinator::State::STOPPING:
    return "STOPPING";
  case SystemCoordinator::State::STOPPED:
    return "STOPPED";
  default:
    return "Unknown";
  }
}

SystemCoordinator::SystemCoordinator(io::InputSource& input, ui::Renderer& renderer)
    : input_(input), renderer_(renderer), errorMonitor_(std::make_shared<ErrorMonitor>()) {}

SystemCoordinator::~SystemCoordinator() { shutdown(); }

AppConfig SystemCoordinator::loadConfig(const std::string& path) {
  ConfigLoader loader(path);
  return parseAppConfig(loader.load());
}

void SystemCoordinator::initialize(AppConfig config) {
  if (currentState_.load() != State::BOOT)
    throw std::logic_error("[SystemCoordinator] initialize() called twice");
  transitionTo(State::INIT);
  config_ = std::move(config);

  bootstrapLoot();

  if (!logger_.startNewRun(config_.logPath.string()))
    std::cerr << "[SystemCoordinator] alert journal disabled (" << config_.logPath << ")\n";

  state_ = std::make_unique<StateStore>(config_.alertCapacity);
  state_->setAlertSink([this](const Alert& a) {
    logger_.log(LogEvent{ a.timestamp, a.level, a.message });
  });

  errorMonitor_->registerEscalation([this](const std::string& reason) { handleError(reason); });

  PayloadManager::Settings settings;
  settings.captureRoot = config_.captureRoot;
  settings.defaultTimeout = config_.defaultTimeout;
  settings.commandTimeouts = config_.timeouts;
  settings.terminationGrace = config_.terminationGrace;
  payloads_ = std::make_unique<PayloadManager>(*state_, errorMonitor_, settings);

  modes::ModeContext ctx{ *state_, *payloads_, config_ };
  controller_ = std::make_unique<ModeController>(modes::buildModeRegistry(ctx), *state_, *payloads_);

  state_->addAlert("KaliPiMax ready", AlertLevel::Ok);
}

void SystemCoordinator::run(const std::atomic<bool>& stopFlag) {
  if (currentState_.load() != State::INIT)
    throw std::logic_error("[SystemCoordinator] run() before initialize()");
  transitionTo(State::RUNNING);

  controller_->start();
  {
    std::lock_guard<std::mutex> lk(renderMtx_);
    renderStop_ = false;
  }
  renderThread_ = std::thread(&SystemCoordinator::renderLoop, this);

  auto nextTick = Clock::now();
  while (!stopFlag.load() && !stopRequested_.load()) {
    if (auto event = input_.poll(config_.inputPoll))
      controller_->dispatchInput(*event);

    const auto now = Clock::now();
    if (now >= nextTick) {
      controller_->tick(now);
      applyBacklightTimeout(now);
      nextTick = now + config_.tick;
    }
  }

  shutdown();
}

void SystemCoordinator::handleError(const std::string& reason) {
  std::cerr << "[SystemCoordinator] fatal: " << reason << '\n';
  logger_.log(LogEvent{ std::chrono::system_clock::now(), AlertLevel::Error, "FATAL " + reason });
  stopRequested_.store(true);
}

void SystemCoordinator::shutdown() {
  const State s = currentState_.load();
  if (s == State::STOPPING || s == State::STOPPED)
    return;
  transitionTo(State::STOPPING);

  if (controller_)
    controller_->shutdown();
  if (payloads_)
    payloads_->shutdown(); // cancels background jobs and joins every watcher

  {
    std::lock_guard<std::mutex> lk(renderMtx_);
    renderStop_ = true;
  }
  renderCv_.notify_all();
  if (renderThread_.joinable())
    renderThread_.join();

  logger_.finishRun();
  transitionTo(State::STOPPED);
}

StateStore& SystemCoordinator::stateStore() {
  if (!state_)
    throw std::logic_error("[SystemCoordinator] not initialized");
  return *state_;
}

PayloadManager& SystemCoordinator::payloads() {
  if (!payloads_)
    throw std::logic_error("[SystemCoordinator] not initialized");
  return *payloads_;
}

ModeController& SystemCoordinator::controller() {
  if (!controller_)
    throw std::logic_error("[SystemCoordinator] not initialized");
  return *controller_;
}

//---private helpers----------------------------------------------------

void SystemCoordinator::transitionTo(State next) {
  const State prev = currentState_.exchange(next);
  std::cerr << "[SystemCoordinator] " << toString(prev) << " -> " << toString(next) << '\n';
}

void SystemCoordinator::bootstrapLoot() {
  for (const auto& category : config_.lootCategories) {
    std::error_code ec;
    std::filesystem::create_directories(config_.captureRoot / category, ec);
    if (ec)
      std::cerr << "[SystemCoordinator] cannot create " << (config_.captureRoot / category)
                << ": " << ec.message() << '\n';
  }
}

void SystemCoordinator::applyBacklightTimeout(Clock::time_point now) {
  if (config_.backlightTimeout.count() == 0)
    return;
  const auto snap = state_->getSnapshot();
  if (snap.backlightOn && now - snap.lastInput >= config_.backlightTimeout)
    state_->setBacklight(false);
}

// Redraws on every new revision, and every frame while a payload runs so the
// elapsed-time counters keep moving.
void SystemCoordinator::renderLoop() {
  std::uint64_t lastRevision = 0;
  for (;;) {
    const auto snap = state_->getSnapshot();
    if (snap.revision != lastRevision || snap.payloadRunning()) {
      try {
        renderer_.draw(snap);
      } catch (const std::exception& e) {
        std::cerr << "[SystemCoordinator] renderer: " << e.what() << '\n';
        logger_.log(LogEvent{ std::chrono::system_clock::now(), AlertLevel::Error,
                              std::string("renderer: ") + e.what() });
      }
      lastRevision = snap.revision;
    }

    const auto interval = snap.payloadRunning() ? config_.renderActive : config_.render;
    std::unique_lock<std::mutex> lk(renderMtx_);
    if (renderCv_.wait_for(lk, interval, [this] { return renderStop_; }))
      return;
  }
}
