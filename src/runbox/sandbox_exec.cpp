#include "sandbox_exec.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>

#include "utils.h"

namespace {

// descriptor layout of the helper process
constexpr int kHelperRequestFd = 0, kHelperResultFd = 1;
constexpr int kJailInputFd = 3, kJailOutputFd = 4, kJailErrorFd = 5;
constexpr int kHelperFdEnd = 6;
// sources are first moved above this so that dup2 never clobbers a pending one
constexpr int kStagingFd = 10;

constexpr int kPollIntervalMs = 50;
// wait for output pipes to reach EOF after the helper reported
constexpr int kDrainTimeoutMs = 500;

inline int64_t ToUs(const struct timeval& v) {
  return (int64_t)v.tv_sec * 1'000'000 + v.tv_usec;
}

struct Pipe {
  int rd = -1, wr = -1;
  bool Open() {
    int fd[2];
    if (pipe2(fd, O_CLOEXEC) < 0) return false;
    rd = fd[0], wr = fd[1];
    return true;
  }
  void CloseRead() {
    if (rd >= 0) close(rd);
    rd = -1;
  }
  void CloseWrite() {
    if (wr >= 0) close(wr);
    wr = -1;
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
};

bool WriteAll(int fd, const void* buf, size_t size) {
  auto ptr = static_cast<const uint8_t*>(buf);
  while (size) {
    ssize_t r = write(fd, ptr, size);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r, size -= r;
  }
  return true;
}

// only async-signal-safe calls from here on
[[noreturn]] void ExecHelper(const char* helper, const int (&src)[5]) {
  static constexpr int kTarget[5] = {
      kHelperRequestFd, kHelperResultFd, kJailInputFd, kJailOutputFd, kJailErrorFd};
  int staged[5];
  for (int i = 0; i < 5; i++) {
    if ((staged[i] = fcntl(src[i], F_DUPFD, kStagingFd)) < 0) _exit(1);
  }
  for (int i = 0; i < 5; i++) {
    if (dup2(staged[i], kTarget[i]) < 0) _exit(1);
  }
  // fd 2 stays: the helper has nothing to say there except on crashes
  CloseFrom(kHelperFdEnd);
  execl(helper, helper, nullptr);
  _exit(1);
}

} // namespace

void SandboxExec(SandboxOptions& opt, int input_fd, bool merge_output,
                 Watchdog& watchdog, const std::atomic_bool& cancel, RunOutcome& outcome) {
  opt.fd_input = kJailInputFd;
  opt.fd_output = kJailOutputFd;
  opt.fd_error = kJailErrorFd;
  const auto vec = opt.Serialize();
  const auto helper = SandboxHelperPath();

  Pipe request, result, out, err;
  pid_t pid;
  if (!request.Open() || !result.Open() || (!merge_output && !out.Open()) || !err.Open()) goto err;
  spdlog::debug("cjail_exec pid={} uid={} boxdir={} command={}",
                getpid(), opt.uid, opt.boxdir, fmt::format("{}", opt.command));
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    const int src[5] = {request.rd, result.wr, input_fd, merge_output ? err.wr : out.wr, err.wr};
    ExecHelper(helper.c_str(), src);
  }
  request.CloseRead();
  result.CloseWrite();
  out.CloseWrite();
  err.CloseWrite();
  {
    int64_t size = vec.size();
    if (!WriteAll(request.wr, &size, sizeof(size)) || !WriteAll(request.wr, vec.data(), vec.size())) {
      // the helper died before reading; it will be reaped below
      spdlog::warn("Failed sending sandbox options: errno={} {}", errno, strerror(errno));
    }
    request.CloseWrite();
  }
  {
    struct pollfd fds[3] = {
      {result.rd, POLLIN, 0},
      {out.rd, POLLIN, 0}, // -1 (ignored by poll) if merged
      {err.rd, POLLIN, 0},
    };
    OutputBuffer* sinks[3] = {nullptr, &outcome.out, &outcome.err};
    char buf[65536];
    size_t result_got = 0;
    bool reported = false;
    auto drain_until = Watchdog::Clock::now();
    auto AnyOpen = [&]() {
      return std::any_of(fds, fds + 3, [](const struct pollfd& p) { return p.fd >= 0; });
    };
    while (AnyOpen()) {
      int timeout;
      if (!reported) {
        if (cancel.load() && !watchdog.Fired()) watchdog.Cancel();
        watchdog.Tick();
        int next = watchdog.NextWakeupMs();
        timeout = next < 0 ? kPollIntervalMs : std::min(next, kPollIntervalMs);
      } else {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            drain_until - Watchdog::Clock::now()).count();
        if (left <= 0) {
          spdlog::debug("Output pipes still open after the jail exited; giving up draining");
          break;
        }
        timeout = left;
      }
      int r = poll(fds, 3, timeout);
      if (r < 0) {
        if (errno == EINTR) continue;
        spdlog::warn("poll failed: errno={} {}", errno, strerror(errno));
        break;
      }
      for (int i = 0; i < 3; i++) {
        if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        size_t want = i == 0 ? sizeof(outcome.jail) - result_got : sizeof(buf);
        ssize_t n = read(fds[i].fd, buf, want);
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) {
          fds[i].fd = -1;
          continue;
        }
        if (i) {
          sinks[i]->Append(buf, n);
          continue;
        }
        memcpy(reinterpret_cast<char*>(&outcome.jail) + result_got, buf, n);
        result_got += n;
        if (result_got == sizeof(outcome.jail)) {
          reported = true;
          outcome.wall_us = watchdog.ElapsedUs();
          drain_until = Watchdog::Clock::now() + std::chrono::milliseconds(kDrainTimeoutMs);
          fds[0].fd = -1;
        }
      }
    }
    if (!reported) outcome.wall_us = watchdog.ElapsedUs();
    outcome.watchdog = watchdog.Reason();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) break;
    }
    if (!reported) {
      spdlog::warn("Sandbox helper exited without reporting: helper={} status={}", helper.c_str(), status);
      outcome.sandbox_error = true;
      outcome.sandbox_errno = EPROTO;
      return;
    }
  }
  if (outcome.jail.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", outcome.jail.oomkill, strerror(outcome.jail.oomkill));
    outcome.sandbox_error = true;
    outcome.sandbox_errno = outcome.jail.oomkill;
    return;
  }
  // prefer the jail's own measurement; it excludes helper start-up
  if (int64_t jail_us = ToUs(outcome.jail.time); jail_us > 0) outcome.wall_us = jail_us;
  return;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  outcome.sandbox_error = true;
  outcome.sandbox_errno = errno;
  outcome.jail.timekill = -1;
}
