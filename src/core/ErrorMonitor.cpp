/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"

#include <algorithm>
#include <iostream>

namespace kpm {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lk(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::cerr << "[ErrorMonitor] " << message << '\n';

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        cb = escalation_;
      }
      // called outside the lock: the escalation path may re-enter notifyFailure()
      if (cb)
        cb(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lk(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace kpm
