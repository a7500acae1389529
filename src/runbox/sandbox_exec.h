#ifndef RUNBOX_SANDBOX_EXEC_H_
#define RUNBOX_SANDBOX_EXEC_H_

#include <atomic>

#include "sandbox.h"
#include "limiter.h"
#include "collector.h"

// We separate this from sandbox.h because this function needs logging and the supervising loop,
//   while sandbox.h is also compiled into the helper and needs to be kept as small as possible

// Fork runbox-sandbox-exec, hand it opt, and supervise the jailed run until the helper reports back.
// input_fd becomes the jail's stdin; stdout/stderr are captured into outcome (merged into outcome.err
// if merge_output). The watchdog is ticked while waiting and cancel is polled.
// Descriptor numbers in opt are filled in here.
void SandboxExec(SandboxOptions& opt, int input_fd, bool merge_output,
                 Watchdog& watchdog, const std::atomic_bool& cancel, RunOutcome& outcome);

#endif  // RUNBOX_SANDBOX_EXEC_H_
