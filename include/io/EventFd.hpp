#pragma once
/** @file  EventFd.hpp
 *  @brief Pollable one-shot wake-up signal (Linux eventfd).
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

namespace kpm {
  namespace io {

    /**
 * @class EventFd
 * @brief Cancellation token a watcher thread can poll next to a process fd.
 *
 *  * `signal()` is safe from any thread; the fd stays readable until `drain()`.
 *  * Non-copyable (sole owner of the fd).
 */
    class EventFd {
    public:
      EventFd(); ///< throws std::system_error if eventfd() fails
      ~EventFd();

      bool signal();
      void drain();
      int fd() const { return fd_; }

      EventFd(const EventFd&) = delete;
      EventFd& operator=(const EventFd&) = delete;

    private:
      int fd_{ -1 };
    };

  } // namespace io
} // namespace kpm
