/* @file KeyboardInput.cpp
 * @brief raw-mode tty key decoder
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>
#include <thread>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <unistd.h>

// KaliPiMax headers
#include "io/KeyboardInput.hpp"

using namespace kpm::io;
using kpm::ui::InputEvent;

KeyboardInput::~KeyboardInput() { close(); }

bool KeyboardInput::open(int fd) {
  close();
  if (fd < 0)
    return false;

  fd_ = fd;
  if (::isatty(fd_)) {
    if (tcgetattr(fd_, &saved_) != 0) {
      std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
      fd_ = -1;
      return false;
    }
    termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
      std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
      fd_ = -1;
      return false;
    }
    restoreTermios_ = true;
  }
  return true;
}

std::optional<InputEvent> KeyboardInput::poll(std::chrono::milliseconds timeout) {
  if (auto ev = decode())
    return ev;
  if (fd_ < 0) {
    std::this_thread::sleep_for(timeout); // closed source: keep the caller's cadence
    return std::nullopt;
  }

  char temp[64];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      break; // timeout

    if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return decode();
    }
    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, static_cast<std::size_t>(n));
        if (auto ev = decode())
          return ev;
      } else if (n == 0) { // EOF
        close();
        return decode();
      } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }
    }
  }
  return std::nullopt;
}

void KeyboardInput::close() {
  if (fd_ >= 0 && restoreTermios_)
    tcsetattr(fd_, TCSANOW, &saved_);
  restoreTermios_ = false;
  fd_ = -1; // fd is borrowed (stdin / pty), never closed here
}

// Consumes bytes from the front of rx_buffer_ until one maps to an event.
std::optional<InputEvent> KeyboardInput::decode() {
  while (!rx_buffer_.empty()) {
    const char c = rx_buffer_.front();

    if (c == '\x1b') {
      if (rx_buffer_.size() == 1) {
        rx_buffer_.clear();
        return InputEvent::Cancel; // bare Esc
      }
      if (rx_buffer_[1] != '[') {
        rx_buffer_.erase(0, 1);
        return InputEvent::Cancel;
      }
      if (rx_buffer_.size() < 3)
        return std::nullopt; // wait for the rest of the CSI sequence
      const char code = rx_buffer_[2];
      rx_buffer_.erase(0, 3);
      switch (code) {
      case 'A':
        return InputEvent::Up;
      case 'B':
        return InputEvent::Down;
      case 'C':
        return InputEvent::Next;
      case 'D':
        return InputEvent::Prev;
      default:
        continue;
      }
    }

    rx_buffer_.erase(0, 1);
    switch (c) {
    case 'a':
    case 'A':
      return InputEvent::Prev;
    case 'd':
    case 'D':
    case '2':
      return InputEvent::Next;
    case 'w':
    case 'W':
      return InputEvent::Up;
    case 's':
    case 'S':
      return InputEvent::Down;
    case '\r':
    case '\n':
    case ' ':
      return InputEvent::Select;
    case 'x':
    case 'X':
    case '3':
    case 0x7f:
    case 0x08:
      return InputEvent::Cancel;
    case 'b':
    case 'B':
    case '1':
      return InputEvent::ToggleBacklight;
    default:
      break; // unmapped key
    }
  }
  return std::nullopt;
}
