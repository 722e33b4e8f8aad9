#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV alert journal (runs its own worker thread).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/Alert.hpp"
#include "io/FileLogger.hpp"

namespace kpm {
  namespace core {

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{};
      AlertLevel level{ AlertLevel::Info };
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Durable sink behind StateStore::addAlert.
 *
 *  * `log()` never blocks on I/O: it enqueues into a bounded ring buffer and
 *    drops the oldest queued event if the worker falls behind.
 *  * Only the worker thread touches the file.
 */
    class Logger {

    public:
      explicit Logger(std::size_t queueCapacity = 256);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + launch worker thread
      void log(const LogEvent& event);           ///< enqueue event (non-blocking)
      void finishRun();                          ///< drain + flush + join worker thread

      std::size_t dropped() const { return dropped_.load(); }

      /// `2026-10-19T14:03:22,WARN,"message"` with embedded quotes doubled.
      static std::string formatCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace kpm
