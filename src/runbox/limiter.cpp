#include "limiter.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/syscall.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>

void ApplyLimits(const ResourceLimits& lim, int64_t grace_period, SandboxOptions& opt) {
  // the watchdog terminates at wall_time (+grace); the jail timer is only a backstop
  opt.wall_time = lim.wall_time + grace_period + kJailTimeMargin;
  opt.cpu_time = lim.cpu_time;
  if (opt.cpu_time < 0) opt.cpu_time = 0;
  opt.rss = lim.memory;
  opt.proc_num = lim.max_processes;
  opt.file_num = kMaxOpenFiles;
  // files written into the workdir; captured stdout/stderr are capped separately
  opt.fsize = (lim.max_output + 1023) / 1024;
  if (opt.fsize == 0) opt.fsize = 1;
  // files on the workdir tmpfs are accounted in the cgroup, so we need to extend the RSS limit
  // ResourceExceeded check on peak memory still uses the original limit
  if (opt.rss) opt.rss += opt.fsize + kMemoryMargin;
}

bool KillUid(int uid, int sig) {
  if (uid <= 0) return false; // never kill(-1) as root
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("KillUid fork failed: uid={} errno={} {}", uid, errno, strerror(errno));
    return false;
  }
  if (pid == 0) {
    // raw syscalls: glibc's setuid synchronizes threads that do not exist after fork
    if (syscall(SYS_setresgid, uid, uid, uid) < 0 || syscall(SYS_setresuid, uid, uid, uid) < 0) _exit(1);
    kill(-1, sig);
    _exit(0);
  }
  int status;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

Watchdog::Watchdog(int64_t wall_time, int64_t grace_period, Signaller signaller) :
    start_(Clock::now()),
    deadline_(start_ + std::chrono::microseconds(wall_time)),
    grace_(std::chrono::microseconds(grace_period)),
    signaller_(std::move(signaller)),
    state_(State::RUNNING),
    reason_(Termination::NONE) {}

void Watchdog::Escalate(Clock::time_point now) {
  switch (state_) {
    case State::RUNNING: {
      spdlog::debug("Watchdog: SIGTERM reason={}", reason_ == Termination::CANCELLED ? "cancel" : "timeout");
      signaller_(SIGTERM);
      state_ = State::TERMINATING;
      kill_at_ = now + grace_;
      if (kill_at_ <= now) Escalate(now);
      break;
    }
    case State::TERMINATING: {
      spdlog::debug("Watchdog: SIGKILL");
      signaller_(SIGKILL);
      state_ = State::KILLED;
      break;
    }
    case State::KILLED:
      break;
  }
}

void Watchdog::Cancel() {
  if (state_ != State::RUNNING) return;
  reason_ = Termination::CANCELLED;
  Escalate(Clock::now());
}

void Watchdog::Tick() {
  auto now = Clock::now();
  if (state_ == State::RUNNING && now >= deadline_) {
    reason_ = Termination::WALL_TIMEOUT;
    Escalate(now);
  } else if (state_ == State::TERMINATING && now >= kill_at_) {
    Escalate(now);
  }
}

int Watchdog::NextWakeupMs() const {
  Clock::time_point target;
  switch (state_) {
    case State::RUNNING: target = deadline_; break;
    case State::TERMINATING: target = kill_at_; break;
    case State::KILLED: return -1;
  }
  auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(target - Clock::now()).count();
  // round up so that Tick() after the wakeup sees the deadline passed
  return std::max<int64_t>(0, diff + 1);
}

int64_t Watchdog::ElapsedUs() const {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start_).count();
}
