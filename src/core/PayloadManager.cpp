/* @file PayloadManager.cpp
 * @brief per-job watcher threads, exclusive resource classes, two-phase termination
 *
 * © 2026 KaliPiMax — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

// KaliPiMax headers
#include "core/Errors.hpp"
#include "core/PayloadManager.hpp"
#include "core/StateStore.hpp"
#include "io/ChildProcess.hpp"
#include "io/EventFd.hpp"

using namespace kpm::core;

namespace {

  using Clock = std::chrono::steady_clock;

  /// What ended (or is ending) a job. First one recorded wins.
  enum class Cause { None, Exit, Cancel, Timeout };

  constexpr int kKillReapAttempts = 5;

  std::string fileTimestamp() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
  }

} // namespace

struct PayloadManager::Job {
  JobId id{ 0 };
  PayloadRequest request;        ///< immutable once the job is in jobs_
  std::chrono::seconds timeout{ 0 };
  std::unique_ptr<io::ChildProcess> process; ///< touched by the watcher only once running
  io::EventFd wakeup;            ///< cancellation token polled by the watcher
  std::thread watcher;           ///< assigned under the manager lock

  mutable std::mutex mtx; ///< guards everything below
  mutable std::condition_variable cv;
  JobPhase phase{ JobPhase::Pending };
  Cause cause{ Cause::None };
  std::optional<int> exitCode;
  std::string detail;
  std::filesystem::path output;
  Clock::time_point startedAt{};
  Clock::time_point finishedAt{};
  bool settled{ false }; ///< terminal phase published to StateStore
};

namespace {

  PayloadView viewOf(const PayloadRequest& req, JobId id, JobPhase phase,
                     Clock::time_point startedAt, std::string detail) {
    PayloadView v;
    v.id = id;
    v.label = req.label;
    v.owner = req.owner;
    v.resourceClass = req.resourceClass;
    v.phase = phase;
    v.startedAt = startedAt;
    v.detail = std::move(detail);
    return v;
  }

} // namespace

PayloadManager::PayloadManager(StateStore& state, std::shared_ptr<ErrorMonitor> errorMonitor,
                               Settings settings, ProcessFactory processFactory)
    : state_(state), errorMonitor_(std::move(errorMonitor)), settings_(std::move(settings)),
      processFactory_(std::move(processFactory)) {
  if (!processFactory_)
    processFactory_ = [] { return std::make_unique<io::ChildProcess>(); };
  if (!errorMonitor_)
    throw std::invalid_argument("[PayloadManager] error monitor is nullptr");
  if (settings_.defaultTimeout.count() <= 0)
    throw std::invalid_argument("[PayloadManager] default timeout must be positive");
}

PayloadManager::~PayloadManager() { shutdown(); }

JobId PayloadManager::start(const PayloadRequest& request) {
  if (request.command.empty())
    throw std::invalid_argument("[PayloadManager] empty command");

  auto job = std::make_shared<Job>();
  job->request = request;
  if (job->request.label.empty())
    job->request.label = request.command;
  job->timeout = timeoutFor(request);
  job->process = processFactory_();
  if (!job->process)
    throw std::runtime_error("[PayloadManager] process factory returned nullptr");

  const std::string& rc = job->request.resourceClass;
  std::vector<std::shared_ptr<Job>> retired;
  std::string corruption;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shuttingDown_)
      throw std::runtime_error("[PayloadManager] shutting down, start rejected");

    if (!rc.empty()) {
      auto held = holders_.find(rc);
      if (held != holders_.end()) {
        auto holder = jobs_.find(held->second);
        if (holder != jobs_.end()) {
          std::lock_guard<std::mutex> jl(holder->second->mtx);
          if (!isTerminal(holder->second->phase))
            throw ResourceBusy(rc, held->second);
        }
        corruption = "[PayloadManager] resource '" + rc + "' still mapped to finished job " +
                     std::to_string(held->second);
      }
    }

    if (corruption.empty()) {
      job->id = nextId_++;
      jobs_.emplace(job->id, job);
      if (!rc.empty())
        holders_[rc] = job->id;
      retireHistoryLocked(retired);
    }
  }

  for (auto& old : retired)
    if (old->watcher.joinable())
      old->watcher.join();

  if (!corruption.empty()) {
    reportCorruption(corruption);
    throw StateCorruption(corruption);
  }

  // --- spawn outside every lock ---
  std::vector<std::string> argv;
  argv.reserve(request.args.size() + 1);
  argv.push_back(request.command);
  argv.insert(argv.end(), request.args.begin(), request.args.end());

  std::filesystem::path output;
  std::string reason;
  bool spawned = false;
  try {
    output = makeOutputPath(job->id, job->request);
    spawned = job->process->spawn(argv, output.string());
    if (!spawned)
      reason = job->process->lastError();
  } catch (const std::filesystem::filesystem_error& e) {
    reason = e.what();
  }

  if (!spawned) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      jobs_.erase(job->id);
      auto it = rc.empty() ? holders_.end() : holders_.find(rc);
      if (it != holders_.end() && it->second == job->id)
        holders_.erase(it);
    }
    std::error_code ec;
    if (!output.empty())
      std::filesystem::remove(output, ec);
    throw SpawnError(request.command, reason);
  }

  Clock::time_point startedAt;
  {
    std::lock_guard<std::mutex> jl(job->mtx);
    job->output = output;
    job->startedAt = Clock::now();
    startedAt = job->startedAt;
    job->phase = JobPhase::Running;
  }
  state_.recordPayloadUpdate(
      viewOf(job->request, job->id, JobPhase::Running, startedAt, output.string()));
  state_.addAlert("Started: " + job->request.label, AlertLevel::Info);

  std::string launchError;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shuttingDown_) {
      launchError = "shutdown";
    } else {
      try {
        job->watcher = std::thread(&PayloadManager::watch, this, job);
      } catch (const std::system_error& e) {
        launchError = std::string("no watcher thread: ") + e.what();
      }
    }
  }
  if (!launchError.empty()) {
    stopProcess(*job);
    commit(*job, launchError == "shutdown" ? JobPhase::Cancelled : JobPhase::Failed,
           job->process->exitCode(), launchError);
  }
  return job->id;
}

void PayloadManager::cancel(JobId id) {
  auto job = find(id);
  {
    std::lock_guard<std::mutex> jl(job->mtx);
    if (isTerminal(job->phase) || job->cause != Cause::None)
      return;
    job->cause = Cause::Cancel;
  }
  job->wakeup.signal();
  state_.addAlert("Cancelling: " + job->request.label, AlertLevel::Warn);
}

JobStatus PayloadManager::status(JobId id) const {
  auto job = find(id);
  std::lock_guard<std::mutex> jl(job->mtx);
  JobStatus s;
  s.phase = job->phase;
  s.exitCode = job->exitCode;
  if (job->phase != JobPhase::Pending) {
    const auto end = isTerminal(job->phase) ? job->finishedAt : Clock::now();
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - job->startedAt);
  }
  return s;
}

std::filesystem::path PayloadManager::outputPath(JobId id) const {
  auto job = find(id);
  std::lock_guard<std::mutex> jl(job->mtx);
  return job->output;
}

bool PayloadManager::waitFor(JobId id, std::chrono::milliseconds timeout) const {
  auto job = find(id);
  std::unique_lock<std::mutex> jl(job->mtx);
  return job->cv.wait_for(jl, timeout, [&job] { return job->settled; });
}

void PayloadManager::cancelOwnedBy(ModeId owner) {
  std::vector<JobId> ids;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& [id, job] : jobs_) {
      if (job->request.owner != owner)
        continue;
      std::lock_guard<std::mutex> jl(job->mtx);
      if (!isTerminal(job->phase))
        ids.push_back(id);
    }
  }
  for (JobId id : ids)
    cancel(id);
}

void PayloadManager::cancelAll() {
  for (JobId id : activeJobs())
    cancel(id);
}

bool PayloadManager::hasActiveJob(ModeId owner) const {
  std::lock_guard<std::mutex> lk(mtx_);
  for (const auto& [id, job] : jobs_) {
    if (job->request.owner != owner)
      continue;
    std::lock_guard<std::mutex> jl(job->mtx);
    if (!isTerminal(job->phase))
      return true;
  }
  return false;
}

std::vector<JobId> PayloadManager::activeJobs() const {
  std::vector<JobId> ids;
  std::lock_guard<std::mutex> lk(mtx_);
  for (const auto& [id, job] : jobs_) {
    std::lock_guard<std::mutex> jl(job->mtx);
    if (!isTerminal(job->phase))
      ids.push_back(id);
  }
  return ids;
}

void PayloadManager::setTerminationHook(TerminationHook hook) {
  std::lock_guard<std::mutex> lk(mtx_);
  terminationHook_ = std::move(hook);
}

void PayloadManager::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    shuttingDown_ = true;
  }
  cancelAll();

  std::vector<std::shared_ptr<Job>> all;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& kv : jobs_)
      all.push_back(kv.second);
  }
  for (auto& job : all)
    if (job->watcher.joinable())
      job->watcher.join();
}

std::shared_ptr<PayloadManager::Job> PayloadManager::find(JobId id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    throw std::out_of_range("[PayloadManager] unknown job " + std::to_string(id));
  return it->second;
}

// -------------------------------------------------------------------
// PayloadManager::watch
// Runs on the job's own thread until the job is terminal. Never throws:
// anything unexpected ends the job as FAILED.
// -------------------------------------------------------------------
void PayloadManager::watch(std::shared_ptr<Job> job) {
  try {
    const auto deadline = job->startedAt + job->timeout;

    for (;;) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (left.count() < 0)
        left = std::chrono::milliseconds{ 0 };

      const auto result = job->process->waitExit(left, job->wakeup.fd());

      if (result == io::ChildProcess::WaitResult::Error) {
        bool cancelled = false;
        {
          std::lock_guard<std::mutex> jl(job->mtx);
          cancelled = job->cause == Cause::Cancel;
        }
        stopProcess(*job);
        if (cancelled)
          commit(*job, JobPhase::Cancelled, job->process->exitCode(), "cancelled");
        else
          commit(*job, JobPhase::Failed, std::nullopt,
                 "wait failed: " + job->process->lastError());
        return;
      }

      Cause cause = Cause::None;
      {
        std::lock_guard<std::mutex> jl(job->mtx);
        if (job->cause == Cause::None) {
          if (result == io::ChildProcess::WaitResult::Exited)
            job->cause = Cause::Exit;
          else if (result == io::ChildProcess::WaitResult::TimedOut)
            job->cause = Cause::Timeout;
        }
        cause = job->cause;
      }

      switch (cause) {
      case Cause::None:
        continue;
      case Cause::Cancel:
        stopProcess(*job);
        commit(*job, JobPhase::Cancelled, job->process->exitCode(), "cancelled");
        return;
      case Cause::Timeout:
        stopProcess(*job);
        commit(*job, JobPhase::TimedOut, std::nullopt,
               "timeout " + std::to_string(job->timeout.count()) + "s");
        return;
      case Cause::Exit:
        break;
      }

      // the reap already swept whatever the leader left in its group
      if (auto code = job->process->exitCode()) {
        if (*code == 0)
          commit(*job, JobPhase::Completed, code, "exit 0");
        else
          commit(*job, JobPhase::Failed, code, "exit " + std::to_string(*code));
      } else if (auto sig = job->process->termSignal()) {
        commit(*job, JobPhase::Failed, std::nullopt, "signal " + std::to_string(*sig));
      } else {
        commit(*job, JobPhase::Failed, std::nullopt, "exit status lost");
      }
      return;
    }
  } catch (const std::exception& e) {
    std::cerr << "[PayloadManager] watcher for job " << job->id << ": " << e.what() << '\n';
    if (job->process->running())
      stopProcess(*job);
    commit(*job, JobPhase::Failed, std::nullopt, std::string("watcher error: ") + e.what());
  }
}

// SIGTERM to the group, bounded grace period, then SIGKILL.
void PayloadManager::stopProcess(Job& job) {
  if (job.process->reaped())
    return;

  job.process->signalGroup(SIGTERM);
  notifyStage(job.id, TerminationStage::GracefulStop);
  if (job.process->waitExit(settings_.terminationGrace) == io::ChildProcess::WaitResult::Exited)
    return;

  job.process->signalGroup(SIGKILL);
  notifyStage(job.id, TerminationStage::ForceKill);
  for (int attempt = 0; attempt < kKillReapAttempts; ++attempt) {
    if (job.process->waitExit(std::chrono::seconds{ 1 }) == io::ChildProcess::WaitResult::Exited)
      return;
  }
  std::cerr << "[PayloadManager] job " << job.id << " (pid " << job.process->pid()
            << ") still alive after SIGKILL\n";
}

bool PayloadManager::commit(Job& job, JobPhase phase, std::optional<int> exitCode,
                            std::string detail) {
  std::string corruption;
  Clock::time_point startedAt;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    {
      std::lock_guard<std::mutex> jl(job.mtx);
      if (isTerminal(job.phase))
        return false;
      job.phase = phase;
      job.exitCode = exitCode;
      job.detail = detail;
      job.finishedAt = Clock::now();
      startedAt = job.startedAt;
    }
    const std::string& rc = job.request.resourceClass;
    if (!rc.empty()) {
      auto it = holders_.find(rc);
      if (it != holders_.end() && it->second == job.id)
        holders_.erase(it);
      else
        corruption = "[PayloadManager] job " + std::to_string(job.id) + " released resource '" +
                     rc + "' it did not hold";
    }
  }

  state_.recordPayloadUpdate(viewOf(job.request, job.id, phase, startedAt, detail));
  announce(job, phase, exitCode);
  if (!corruption.empty())
    reportCorruption(corruption);

  {
    std::lock_guard<std::mutex> jl(job.mtx);
    job.settled = true;
  }
  job.cv.notify_all();
  return true;
}

void PayloadManager::announce(const Job& job, JobPhase phase, const std::optional<int>& exitCode) {
  const std::string& label = job.request.label;
  switch (phase) {
  case JobPhase::Completed:
    state_.addAlert(label + " complete", AlertLevel::Ok);
    break;
  case JobPhase::Failed:
    state_.addAlert(label + " failed" +
                        (exitCode ? " (exit " + std::to_string(*exitCode) + ")" : std::string{}),
                    AlertLevel::Error);
    break;
  case JobPhase::TimedOut:
    state_.addAlert(label + " timed out (" + std::to_string(job.timeout.count()) + "s)",
                    AlertLevel::Warn);
    break;
  case JobPhase::Cancelled:
    state_.addAlert("Cancelled: " + label, AlertLevel::Warn);
    break;
  default:
    break;
  }
}

void PayloadManager::notifyStage(JobId id, TerminationStage stage) {
  TerminationHook hook;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    hook = terminationHook_;
  }
  if (hook)
    hook(id, stage);
}

void PayloadManager::reportCorruption(const std::string& message) {
  std::cerr << message << '\n';
  state_.addAlert(message, AlertLevel::Error);
  errorMonitor_->notifyFailure(message);
}

std::chrono::seconds PayloadManager::timeoutFor(const PayloadRequest& request) const {
  if (request.timeout.count() > 0)
    return request.timeout;
  auto it = settings_.commandTimeouts.find(request.command);
  if (it != settings_.commandTimeouts.end() && it->second.count() > 0)
    return it->second;
  return settings_.defaultTimeout;
}

std::filesystem::path PayloadManager::makeOutputPath(JobId id,
                                                     const PayloadRequest& request) const {
  const std::string category = request.category.empty() ? "misc" : request.category;
  const std::string ext = request.extension.empty() ? "txt" : request.extension;
  auto dir = settings_.captureRoot / category;
  std::filesystem::create_directories(dir);
  return dir / (std::to_string(id) + "-" + fileTimestamp() + "." + ext);
}

// caller holds mtx_; drops the oldest settled jobs beyond historyLimit
void PayloadManager::retireHistoryLocked(std::vector<std::shared_ptr<Job>>& retired) {
  std::size_t excess =
      jobs_.size() > settings_.historyLimit ? jobs_.size() - settings_.historyLimit : 0;
  for (auto it = jobs_.begin(); it != jobs_.end() && excess > 0;) {
    bool settled = false;
    {
      std::lock_guard<std::mutex> jl(it->second->mtx);
      settled = it->second->settled;
    }
    if (settled) {
      retired.push_back(it->second);
      it = jobs_.erase(it);
      --excess;
    } else {
      ++it;
    }
  }
}
