#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO that overwrites its oldest slot when full.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kpm {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Bounded queue backing both the AlertLog and the Logger hand-off.
 *
 *  * Not thread-safe: owners wrap it in their own mutex.
 *  * `push()` on a full buffer evicts the oldest element.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be non-zero");
      }

      /// @returns true if the oldest element was overwritten.
      bool push(T value) {
        if (size_ == slots_.size()) {
          slots_[head_] = std::move(value);
          head_ = (head_ + 1) % slots_.size();
          return true;
        }
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        ++size_;
        return false;
      }

      /// Removes and returns the oldest element.
      std::optional<T> pop() {
        if (size_ == 0)
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return out;
      }

      /// Index 0 is the oldest element.
      const T& at(std::size_t i) const {
        if (i >= size_)
          throw std::out_of_range("[RingBuffer] index out of range");
        return slots_[(head_ + i) % slots_.size()];
      }

      void clear() {
        head_ = 0;
        size_ = 0;
      }

      std::size_t size() const { return size_; }
      std::size_t capacity() const { return slots_.size(); }
      bool empty() const { return size_ == 0; }
      bool full() const { return size_ == slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 }; ///< slot of the oldest element
      std::size_t size_{ 0 };
    };

  } // namespace core
} // namespace kpm
