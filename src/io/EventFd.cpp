/* @file EventFd.cpp
 * @brief eventfd RAII wrapper
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

#include "io/EventFd.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <system_error>

// Linux headers
#include <sys/eventfd.h>
#include <unistd.h>

using namespace kpm::io;

EventFd::EventFd() {
  fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (fd_ < 0)
    throw std::system_error(errno, std::generic_category(), "[EventFd] eventfd");
}

EventFd::~EventFd() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

bool EventFd::signal() {
  const std::uint64_t one = 1;
  for (;;) {
    ssize_t n = ::write(fd_, &one, sizeof(one));
    if (n == static_cast<ssize_t>(sizeof(one)))
      return true;
    if (n == -1 && errno == EINTR)
      continue;
    // EAGAIN means the counter is already saturated, i.e. already signalled
    if (n == -1 && errno == EAGAIN)
      return true;
    std::cerr << "Error " << errno << " from eventfd write: " << strerror(errno) << "\n";
    return false;
  }
}

void EventFd::drain() {
  std::uint64_t value = 0;
  while (::read(fd_, &value, sizeof(value)) == -1 && errno == EINTR) {
  }
}
