/* @file AlertLog.cpp
 * @brief mutex-guarded ring buffer of operator alerts
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/AlertLog.hpp"

#include <algorithm>

using namespace kpm::core;

AlertLog::AlertLog(std::size_t capacity) : buffer_(capacity) {}

void AlertLog::append(Alert alert) {
  std::lock_guard<std::mutex> lk(mtx_);
  buffer_.push(std::move(alert));
}

std::vector<Alert> AlertLog::entries() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<Alert> out;
  out.reserve(buffer_.size());
  for (std::size_t i = 0; i < buffer_.size(); ++i)
    out.push_back(buffer_.at(i));
  return out;
}

std::vector<Alert> AlertLog::latest(std::size_t n) const {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::size_t count = std::min(n, buffer_.size());
  std::vector<Alert> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
    out.push_back(buffer_.at(buffer_.size() - 1 - i));
  return out;
}

std::size_t AlertLog::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return buffer_.size();
}

std::size_t AlertLog::capacity() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return buffer_.capacity();
}

void AlertLog::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  buffer_.clear();
}
