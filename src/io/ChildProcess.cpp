/* @file ChildProcess.cpp
 * @brief posix_spawn based process handle - process group, capture redirect, pidfd waits
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstring> // for strerror
#include <iostream>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

// KaliPiMax headers
#include "io/ChildProcess.hpp"

extern char** environ;

using namespace kpm::io;

ChildProcess::~ChildProcess() {
  if (running()) {
    ::kill(-pid_, SIGKILL);
    while (::waitpid(pid_, &status_, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
  }
  closePidfd();
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const std::string& outputPath) {
  if (pid_ > 0) {
    lastError_ = "process already spawned";
    return false;
  }
  if (argv.empty() || argv.front().empty()) {
    lastError_ = "empty command line";
    return false;
  }

  int outFd = ::open(outputPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0640);
  if (outFd < 0) {
    lastError_ = "open " + outputPath + ": " + strerror(errno);
    std::cerr << "Error " << errno << " from open: " << strerror(errno) << "\n";
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, outFd, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, outFd, STDERR_FILENO);

  // own process group (pgid == pid) so killpg reaches the tool's children
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF);
  posix_spawnattr_setpgroup(&attr, 0);
  sigset_t none;
  sigemptyset(&none);
  posix_spawnattr_setsigmask(&attr, &none);
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGTERM);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGCHLD);
  posix_spawnattr_setsigdefault(&attr, &defaults);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv)
    cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t child = -1;
  const int rc = ::posix_spawnp(&child, cargv[0], &actions, &attr, cargv.data(), environ);

  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);
  ::close(outFd);

  if (rc != 0) {
    lastError_ = strerror(rc);
    return false;
  }

  pid_ = child;
  reaped_ = false;
  statusKnown_ = false;
#ifdef SYS_pidfd_open
  pidfd_ = static_cast<int>(::syscall(SYS_pidfd_open, pid_, 0));
#endif
  return true;
}

// -------------------------------------------------------------------
// ChildProcess::waitExit
// Same shape as a poll()-driven line reader: loop until the deadline,
// retry on EINTR. Exit wins over a simultaneous wake-up.
// -------------------------------------------------------------------
ChildProcess::WaitResult ChildProcess::waitExit(std::chrono::milliseconds timeout, int wakeFd) {
  if (pid_ <= 0)
    return WaitResult::Error;

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  for (;;) {
    if (reaped_ || reap(WNOHANG))
      return WaitResult::Exited;

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() <= 0)
      return WaitResult::TimedOut;

    pollfd fds[2];
    nfds_t n = 0;
    int wakeIdx = -1;
    if (pidfd_ >= 0)
      fds[n++] = pollfd{ pidfd_, POLLIN, 0 };
    if (wakeFd >= 0) {
      wakeIdx = static_cast<int>(n);
      fds[n++] = pollfd{ wakeFd, POLLIN, 0 };
    }

    int ms = static_cast<int>(std::min<long long>(ms_left.count(), 60'000));
    if (pidfd_ < 0)
      ms = std::min(ms, static_cast<int>(kReapSlice.count()));

    int rc = ::poll(fds, n, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      lastError_ = std::string("poll: ") + strerror(errno);
      std::cerr << "poll: " << strerror(errno) << '\n';
      return WaitResult::Error;
    }

    if (wakeIdx >= 0 && (fds[wakeIdx].revents & POLLIN)) {
      if (reap(WNOHANG))
        return WaitResult::Exited;
      return WaitResult::Woken;
    }
  }
}

bool ChildProcess::signalGroup(int sig) {
  // once reaped the pgid is free for reuse
  if (pid_ <= 0 || reaped_)
    return false;
  if (::kill(-pid_, sig) == 0)
    return true;
  if (errno != ESRCH) {
    std::cerr << "Error " << errno << " from kill: " << strerror(errno) << "\n";
    return false;
  }
  // group already gone; the leader itself may still be an unreaped zombie
  return false;
}

std::optional<int> ChildProcess::exitCode() const {
  if (!reaped_ || !statusKnown_ || !WIFEXITED(status_))
    return std::nullopt;
  return WEXITSTATUS(status_);
}

std::optional<int> ChildProcess::termSignal() const {
  if (!reaped_ || !statusKnown_ || !WIFSIGNALED(status_))
    return std::nullopt;
  return WTERMSIG(status_);
}

// -------------------------------------------------------------------
// ChildProcess::reap
// Peeks at the leader's exit with WNOWAIT first. While the zombie is
// unreaped its pid, and so the pgid, cannot be reused, which is the only
// window where killing the group is safe. Leftovers are SIGKILLed there,
// then the zombie is collected.
// -------------------------------------------------------------------
bool ChildProcess::reap(int options) {
  if (reaped_)
    return true;

  siginfo_t info{};
  for (;;) {
    info.si_pid = 0;
    if (::waitid(P_PID, static_cast<id_t>(pid_), &info,
                 WEXITED | WNOWAIT | (options & WNOHANG)) == 0)
      break;
    if (errno == EINTR)
      continue;
    if (errno == ECHILD) {
      // someone else reaped it (SIGCHLD set to SIG_IGN); exit status is lost
      reaped_ = true;
      statusKnown_ = false;
      closePidfd();
      return true;
    }
    lastError_ = std::string("waitid: ") + strerror(errno);
    std::cerr << "waitid: " << strerror(errno) << '\n';
    return false;
  }
  if (info.si_pid == 0)
    return false; // still running (WNOHANG)

  if (::kill(-pid_, SIGKILL) == -1 && errno != ESRCH)
    std::cerr << "Error " << errno << " from kill: " << strerror(errno) << "\n";

  for (;;) {
    pid_t r = ::waitpid(pid_, &status_, 0);
    if (r == pid_) {
      reaped_ = true;
      statusKnown_ = true;
      closePidfd();
      return true;
    }
    if (errno == EINTR)
      continue;
    lastError_ = std::string("waitpid: ") + strerror(errno);
    std::cerr << "waitpid: " << strerror(errno) << '\n';
    reaped_ = true;
    statusKnown_ = false;
    closePidfd();
    return true;
  }
}

void ChildProcess::closePidfd() {
  if (pidfd_ >= 0)
    ::close(pidfd_);
  pidfd_ = -1;
}
