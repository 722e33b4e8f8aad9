/* @file Logger.cpp
 * @brief worker-thread CSV journal fed through a bounded ring buffer
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "core/Logger.hpp"

#include <ctime>
#include <iostream>
#include <vector>

#include "core/RingBuffer.hpp"

using namespace kpm::core;

Logger::Logger(std::size_t queueCapacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(queueCapacity)) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  if (running_)
    return true;
  if (!csvFile_.open(path)) {
    std::cerr << "[Logger] cannot open journal " << path << "\n";
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = true;
  }
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

// the running_ check and the push share the worker's lock, so nothing lands
// after the final drain
void Logger::log(const LogEvent& event) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!running_)
      return;
    if (buffer_->push(event))
      ++dropped_;
  }
  cv_.notify_one();
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lk(mtx_); // flip under the waiter's mutex
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();

  std::vector<LogEvent> rest;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    while (auto ev = buffer_->pop())
      rest.push_back(std::move(*ev));
  }
  for (const auto& ev : rest)
    csvFile_.write(formatCsv(ev));
  csvFile_.close();
}

void Logger::workerLoop() {
  std::vector<LogEvent> batch;
  for (;;) {
    bool stopping = false;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this] { return !buffer_->empty() || !running_; });
      while (auto ev = buffer_->pop())
        batch.push_back(std::move(*ev));
      stopping = !running_;
    }

    // file I/O happens outside the queue lock
    for (const auto& ev : batch)
      csvFile_.write(formatCsv(ev));
    if (!batch.empty())
      csvFile_.flush();
    batch.clear();

    if (stopping)
      return;
  }
}

std::string Logger::formatCsv(const LogEvent& event) {
  const std::time_t t = std::chrono::system_clock::to_time_t(event.timestamp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);

  std::string quoted;
  quoted.reserve(event.message.size() + 2);
  for (char c : event.message) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  return std::string(stamp) + ',' + toString(event.level) + ",\"" + quoted + "\"\n";
}
