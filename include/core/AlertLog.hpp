#pragma once
/** @file  AlertLog.hpp
 *  @brief Bounded, append-only, thread-safe alert journal.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <vector>

#include "core/Alert.hpp"
#include "core/RingBuffer.hpp"

namespace kpm {
  namespace core {

    /**
 * @class AlertLog
 * @brief Keeps the most recent `capacity` alerts; older ones are evicted first.
 *
 *  * Thread-safe (mutex-protected ring buffer).
 *  * Readers get copies, never a view into the live buffer.
 */
    class AlertLog {
    public:
      /// Throws `std::invalid_argument` if \p capacity is zero.
      explicit AlertLog(std::size_t capacity);
      ~AlertLog() = default;

      //---public API------------------------------------------------------
      void append(Alert alert);

      /// Oldest to newest.
      std::vector<Alert> entries() const;

      /// Newest first, at most \p n entries.
      std::vector<Alert> latest(std::size_t n) const;

      std::size_t size() const;
      std::size_t capacity() const;
      void clear();

      AlertLog(const AlertLog&) = delete;
      AlertLog& operator=(const AlertLog&) = delete;

    private:
      mutable std::mutex mtx_;
      RingBuffer<Alert> buffer_;
    };

  } // namespace core
} // namespace kpm
