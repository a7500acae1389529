#include "box.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <mutex>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "limiter.h"
#include "paths.h"
#include "sandbox.h"
#include "sandbox_exec.h"
#include "utils.h"

namespace {

constexpr fs::perms kPerm755 = fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPerm644 = fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

std::mutex uid_mtx;
std::vector<int> uid_pool;
bool uid_pool_ready = false;

int AcquireUid() {
  std::lock_guard lck(uid_mtx);
  if (!uid_pool_ready) {
    // hand out low uids first
    for (int i = kSandboxUidCount - 1; i >= 0; i--) uid_pool.push_back(i + kSandboxUidBase);
    uid_pool_ready = true;
  }
  if (uid_pool.empty()) return -1;
  int uid = uid_pool.back();
  uid_pool.pop_back();
  return uid;
}

void ReleaseUid(int uid) {
  std::lock_guard lck(uid_mtx);
  uid_pool.push_back(uid);
}

} // namespace

int SandboxesInUse() {
  std::lock_guard lck(uid_mtx);
  return uid_pool_ready ? kSandboxUidCount - (int)uid_pool.size() : 0;
}

Sandbox::Sandbox(long id, int uid, const ServiceConfig& config) :
    id_(id), uid_(uid), root_(SandboxPath(id)),
    grace_period_(config.grace_period),
    share_network_(config.share_network),
    mounted_(false) {}

std::unique_ptr<Sandbox> Sandbox::Create(long id, const ServiceConfig& config,
                                         const std::vector<std::string>& extra_dirs, int64_t workdir_kib) {
  int uid = AcquireUid();
  if (uid < 0) {
    spdlog::warn("No sandbox uid available: id={}", id);
    return nullptr;
  }
  if (std::error_code ec; fs::exists(SandboxPath(id), ec)) {
    spdlog::warn("Sandbox directory already exists: id={} path={}", id, SandboxPath(id).c_str());
    ReleaseUid(uid);
    return nullptr;
  }
  SandboxOptions opt;
  opt.boxdir = SandboxPath(id);
  opt.dirs = config.bind_dirs;
  opt.dirs.insert(opt.dirs.end(), extra_dirs.begin(), extra_dirs.end());
  // from here on the destructor cleans up whatever was created
  std::unique_ptr<Sandbox> box(new Sandbox(id, uid, config));
  if (!CreateDirs(box->root_, kPerm755)) return nullptr;
  opt.FilterDirs();
  box->dirs_ = std::move(opt.dirs);
  auto workdir = box->Workdir();
  if (!CreateDirs(workdir, fs::perms::all)) return nullptr;
  if (!MountTmpfs(workdir, workdir_kib)) return nullptr;
  box->mounted_ = true;
  spdlog::debug("Sandbox created: id={} uid={} root={} dirs={}", id, uid, box->root_.c_str(), box->dirs_);
  return box;
}

Sandbox::~Sandbox() {
  spdlog::debug("Sandbox teardown: id={} uid={}", id_, uid_);
  // processes that escaped the jail's own cleanup (background, double-forked)
  if (!KillUid(uid_, SIGKILL)) spdlog::warn("Failed killing processes of uid {}", uid_);
  if (mounted_) IGNORE_RETURN(Umount(Workdir()));
  IGNORE_RETURN(RemoveAll(root_));
  if (std::error_code ec; fs::exists(SandboxInput(id_), ec)) IGNORE_RETURN(RemoveAll(SandboxInput(id_)));
  ReleaseUid(uid_);
}

fs::path Sandbox::Workdir() const {
  return ::Workdir(fs::path(root_));
}

bool Sandbox::WriteFile(const std::string& name, const std::string& content) {
  return ::WriteFile(Workdir() / name, content, kPerm644);
}

bool Sandbox::HasFile(const std::string& name) const {
  std::error_code ec;
  return fs::is_regular_file(Workdir() / name, ec);
}

RunOutcome Sandbox::RunIsolated(const std::vector<std::string>& command, const std::vector<std::string>& env,
                                const ResourceLimits& limits, const std::string& stdin_data,
                                int64_t capture_cap, bool merge_output, const std::atomic_bool& cancel) {
  RunOutcome outcome(capture_cap, capture_cap);
  SandboxOptions opt;
  opt.boxdir = root_;
  opt.command = command;
  opt.envs = env;
  opt.workdir = ::Workdir(fs::path("/"));
  opt.uid = opt.gid = uid_;
  opt.share_network = share_network_;
  opt.dirs = dirs_;
  ApplyLimits(limits, grace_period_, opt);

  // stdin lives outside the jail root; the jail only gets an open descriptor
  auto input = SandboxInput(id_);
  if (!::WriteFile(input, stdin_data, fs::perms::owner_read | fs::perms::owner_write)) {
    outcome.sandbox_error = true;
    outcome.sandbox_errno = errno;
    return outcome;
  }
  int input_fd = open(input.c_str(), O_RDONLY | O_CLOEXEC);
  int open_errno = errno;
  IGNORE_RETURN(RemoveAll(input));
  if (input_fd < 0) {
    spdlog::warn("Failed opening {}: {}", input.c_str(), strerror(open_errno));
    outcome.sandbox_error = true;
    outcome.sandbox_errno = open_errno;
    return outcome;
  }

  Watchdog watchdog(limits.wall_time, grace_period_, [uid = uid_](int sig) {
    if (!KillUid(uid, sig)) spdlog::warn("Failed signalling uid {} with {}", uid, sig);
  });
  SandboxExec(opt, input_fd, merge_output, watchdog, cancel, outcome);
  close(input_fd);
  // nothing of this run may survive into the next one
  IGNORE_RETURN(KillUid(uid_, SIGKILL));
  return outcome;
}
