#pragma once
/** @file  Renderer.hpp
 *  @brief Consumer of state snapshots (LCD driver or simulator).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

namespace kpm {
  namespace core {
    struct StateSnapshot;
  } // namespace core

  namespace ui {

    /**
 * @class Renderer
 * @brief Called from the render thread only. Must never mutate state and must
 *        cope with empty alert / job lists.
 */
    class Renderer {
    public:
      virtual ~Renderer() = default;

      virtual void draw(const core::StateSnapshot& snapshot) = 0;
    };

  } // namespace ui
} // namespace kpm
