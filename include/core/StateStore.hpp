#pragma once
/** @file  StateStore.hpp
 *  @brief Thread-safe application status shared by the input loop, watchers and renderer.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Alert.hpp"
#include "core/AlertLog.hpp"
#include "core/PayloadTypes.hpp"
#include "core/SystemMetrics.hpp"
#include "ui/ModeView.hpp"

namespace kpm {
  namespace core {

    /**
 * @struct StateSnapshot
 * @brief Point-in-time value copy handed to the renderer. Never mutated afterwards.
 */
    struct StateSnapshot {
      std::uint64_t revision{ 0 }; ///< bumped by every mutation
      ModeId activeMode{ 0 };
      bool backlightOn{ true };
      std::chrono::steady_clock::time_point lastInput{};
      std::vector<Alert> alerts;         ///< oldest to newest
      std::vector<PayloadView> payloads; ///< non-terminal jobs only
      std::optional<PayloadView> lastOutcome;
      SystemMetrics metrics;
      ui::ModeView modeView;

      bool payloadRunning() const { return !payloads.empty(); }
    };

    /** @class StateStore
 *  @brief Single source of truth for cross-thread status.
 *
 *  * Writers are serialized by one mutex and publish a fresh immutable snapshot.
 *  * Readers only copy the published pointer, so they never see a torn update.
 *  * Passed explicitly to every component that needs it; there is no global.
 */
    class StateStore {

    public:
      using AlertSink = std::function<void(const Alert&)>;

      explicit StateStore(std::size_t alertCapacity = 50);
      ~StateStore() = default;

      //---reads----------------------------------------------------------
      StateSnapshot getSnapshot() const;

      //---mutations (atomic, serialized)----------------------------------
      void setActiveMode(ModeId id);
      void setBacklight(bool on);
      void touchInput();
      void addAlert(const std::string& message, AlertLevel level = AlertLevel::Info);
      void clearAlerts();

      /// Non-terminal phases upsert the in-flight view; terminal ones move it to lastOutcome.
      void recordPayloadUpdate(const PayloadView& update);

      void setSystemMetrics(const SystemMetrics& metrics);
      void setModeView(ui::ModeView view);

      /**
       * @brief Two-press confirmation for destructive actions.
       * @returns true only for a second request of the same \p action within \p window.
       */
      bool requestConfirm(const std::string& action, std::chrono::milliseconds window);
      void cancelConfirm();

      /// Durable sink, called after the lock is released. Must not block.
      void setAlertSink(AlertSink sink);

      StateStore(const StateStore&) = delete;
      StateStore& operator=(const StateStore&) = delete;

    private:
      template <typename Fn> void mutate(Fn&& fn);
      void publishLocked();

      mutable std::mutex mtx_;        ///< serializes writers
      mutable std::mutex publishMtx_; ///< guards `published_` only
      StateSnapshot live_;            ///< writer-side copy (alerts live in log_)
      AlertLog log_;
      std::shared_ptr<const StateSnapshot> published_;
      AlertSink sink_{};

      std::string pendingConfirm_;
      std::chrono::steady_clock::time_point confirmExpires_{};
    };

  } // namespace core
} // namespace kpm
