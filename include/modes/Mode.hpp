#pragma once
/** @file  Mode.hpp
 *  @brief Abstract base class for every operational screen in the navigation cycle.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

#include "core/PayloadTypes.hpp"
#include "ui/InputEvent.hpp"
#include "ui/ModeView.hpp"

namespace kpm::core { // forward decls only
  class StateStore;
  class PayloadManager;
  struct AppConfig;
  class ModeController;
} // namespace kpm::core

namespace kpm::modes {

  /// Collaborators injected into every mode at construction.
  struct ModeContext {
    core::StateStore& state;
    core::PayloadManager& payloads;
    const core::AppConfig& config;
  };

  /** Navigation a mode may request as the result of an input event. */
  struct Transition {
    enum class Kind { Prev, Next, Goto };

    Kind kind{ Kind::Next };
    core::ModeId target{ 0 }; ///< Goto only

    static Transition prev() { return { Kind::Prev, 0 }; }
    static Transition next() { return { Kind::Next, 0 }; }
    static Transition go(core::ModeId id) { return { Kind::Goto, id }; }
  };

  /**
 * @class Mode
 * @brief Fixed capability interface every concrete mode implements.
 *
 *  * All hooks run on the input-handling thread; none may block on process I/O.
 *  * `onInput()` may call PayloadManager / StateStore and returns an optional
 *    transition request; exceptions are caught by ModeController.
 *  * Instances live in ModeController's registry for the whole process.
 */
  class Mode {
  public:
    Mode(std::string name, std::string icon) : name_(std::move(name)), icon_(std::move(icon)) {}
    virtual ~Mode() = default;

    virtual void onEnter() {}
    virtual void onExit() {}
    virtual std::optional<Transition> onInput(ui::InputEvent event) = 0;
    virtual void onTick(std::chrono::steady_clock::time_point now) { (void)now; }

    /// true → jobs owned by this mode may outlive leaving it.
    virtual bool allowsBackgroundContinuation() const { return false; }

    /// Render model published to StateStore after every hook.
    virtual ui::ModeView view() const = 0;

    const std::string& name() const { return name_; }
    const std::string& icon() const { return icon_; }
    core::ModeId id() const { return id_; }

    Mode(const Mode&) = delete;
    Mode& operator=(const Mode&) = delete;

  private:
    friend class core::ModeController; // assigns the registry index

    std::string name_;
    std::string icon_;
    core::ModeId id_{ core::kNoMode };
  };

} // namespace kpm::modes
