#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Wires every subsystem together and owns the input and render loops.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/AppConfig.hpp"
#include "core/Logger.hpp"

namespace kpm {
  namespace io {
    class InputSource;
  } // namespace io
  namespace ui {
    class Renderer;
  } // namespace ui

  namespace core {

    class ErrorMonitor;
    class StateStore;
    class PayloadManager;
    class ModeController;

    /**
 * @class SystemCoordinator
 * @brief BOOT → INIT → RUNNING → STOPPING → STOPPED.
 *
 *  * `run()` is the input-handling thread: poll, dispatch, tick, backlight timeout.
 *  * A separate render thread polls StateStore snapshots at its own cadence.
 *  * A fatal fault escalated through ErrorMonitor ends `run()`.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, RUNNING, STOPPING, STOPPED };

      SystemCoordinator(io::InputSource& input, ui::Renderer& renderer);
      ~SystemCoordinator(); ///< shutdown()

      /// Read and validate a config file. Throws `std::runtime_error`.
      static AppConfig loadConfig(const std::string& path);

      //---public API------------------------------------------------------
      void initialize(AppConfig config); ///< loot tree, logger, subsystems
      void run(const std::atomic<bool>& stopFlag); ///< returns after shutdown()
      void handleError(const std::string& reason);  ///< fatal fault → stop
      void shutdown();

      State state() const { return currentState_.load(); }
      const AppConfig& config() const { return config_; }
      StateStore& stateStore();
      PayloadManager& payloads();
      ModeController& controller();

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void bootstrapLoot();
      void renderLoop();
      void applyBacklightTimeout(std::chrono::steady_clock::time_point now);

      io::InputSource& input_;
      ui::Renderer& renderer_;

      AppConfig config_;
      Logger logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<StateStore> state_;
      std::unique_ptr<PayloadManager> payloads_;
      std::unique_ptr<ModeController> controller_;

      std::thread renderThread_;
      std::mutex renderMtx_;
      std::condition_variable renderCv_;
      bool renderStop_{ false }; ///< guarded by renderMtx_

      std::atomic<bool> stopRequested_{ false };
      std::atomic<State> currentState_{ State::BOOT };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace kpm
