#ifndef RUNBOX_LIMITER_H_
#define RUNBOX_LIMITER_H_

#include <chrono>
#include <functional>

#include <runbox/execution.h>
#include "sandbox.h"

// margin added to the jail's own wall-time limit; it only fires if the watchdog failed
constexpr int64_t kJailTimeMargin = 1'000'000; // us
constexpr int kMaxOpenFiles = 128;
// cgroup limit is set this much above the requested memory so that a breach can be told apart
constexpr int64_t kMemoryMargin = 1024; // KiB

// Translate the contract limits into jail settings (rlimits, cgroup, backstop timer)
void ApplyLimits(const ResourceLimits&, int64_t grace_period, SandboxOptions&);

// Send sig to every process owned by uid (forks a short-lived child that drops to uid)
bool KillUid(int uid, int sig);

// Supervising timer of one isolated run.
// Escalation: at the deadline (or on cancellation) send SIGTERM, after the grace window SIGKILL.
class Watchdog {
 public:
  using Clock = std::chrono::steady_clock;
  using Signaller = std::function<void(int sig)>;

  enum class State { RUNNING, TERMINATING, KILLED };

  Watchdog(int64_t wall_time, int64_t grace_period, Signaller signaller);

  // Request termination now; the reason becomes CANCELLED unless the deadline already passed
  void Cancel();
  // Advance the state machine; call whenever the supervising loop wakes up
  void Tick();
  // Milliseconds until the next escalation step (-1 if nothing is pending)
  int NextWakeupMs() const;

  State GetState() const { return state_; }
  bool Fired() const { return state_ != State::RUNNING; }
  // WALL_TIMEOUT, CANCELLED or NONE
  Termination Reason() const { return reason_; }
  int64_t ElapsedUs() const;

 private:
  void Escalate(Clock::time_point now);

  const Clock::time_point start_;
  const Clock::time_point deadline_;
  const Clock::duration grace_;
  Clock::time_point kill_at_;
  Signaller signaller_;
  State state_;
  Termination reason_;
};

#endif  // RUNBOX_LIMITER_H_
