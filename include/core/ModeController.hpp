#pragma once
/** @file  ModeController.hpp
 *  @brief Finite-state machine over the fixed mode registry.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "core/PayloadTypes.hpp"
#include "modes/Mode.hpp"
#include "ui/InputEvent.hpp"

namespace kpm {
  namespace core {

    class StateStore;
    class PayloadManager;

    /**
 * @class ModeController
 * @brief Routes input to the active mode and guards every transition.
 *
 *  * Exactly one mode is active; the registry is fixed after construction.
 *  * Leaving a mode that owns a non-terminal job is refused unless the mode
 *    allows background continuation.
 *  * Handler exceptions become alerts; the input loop never sees them.
 *  * Input-thread only. Not thread-safe.
 */
    class ModeController {

    public:
      using Registry = std::vector<std::unique_ptr<modes::Mode>>;

      /// @throws std::invalid_argument for an empty registry.
      ModeController(Registry registry, StateStore& state, PayloadManager& payloads);
      ~ModeController() = default;

      //---public API------------------------------------------------------
      void start(); ///< enter the first registered mode

      void dispatchInput(ui::InputEvent event);
      void tick(std::chrono::steady_clock::time_point now);

      bool next();
      bool prev();
      bool select(ModeId id);
      bool selectByName(const std::string& name); ///< case-insensitive

      void enter(ModeId id);
      void exit(ModeId id); ///< idempotent

      /// Exit the active mode and cancel the jobs it owns.
      void shutdown();

      ModeId active() const { return active_; }
      std::size_t size() const { return registry_.size(); }
      modes::Mode& mode(ModeId id) const;

      ModeController(const ModeController&) = delete;
      ModeController& operator=(const ModeController&) = delete;

    private:
      bool transitionTo(ModeId target);
      void apply(const modes::Transition& t);
      void publishView();

      template <typename Fn> void guarded(const char* hook, Fn&& fn);

      Registry registry_;
      std::vector<bool> entered_;
      StateStore& state_;
      PayloadManager& payloads_;
      ModeId active_{ 0 };
      bool started_{ false };
    };

  } // namespace core
} // namespace kpm
