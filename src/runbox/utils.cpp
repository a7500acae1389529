#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <atomic>
#include <cstring>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, minfd, ~0U, 0) == 0) return 0;
#endif
  // kernels before 5.9; no allocation allowed here
  struct rlimit rl;
  if (getrlimit(RLIMIT_NOFILE, &rl) < 0) return -1;
  int maxfd = rl.rlim_cur == RLIM_INFINITY ? 65536 : (int)rl.rlim_cur;
  for (int fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(ExecStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecStatusToDesc, ExecStatus, ENUM_EXEC_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(ExecError, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecErrorName, ExecError, ENUM_EXEC_ERROR_)
#undef X

#define X(...) X_RETURN_ARG1(Termination, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TerminationName, Termination, ENUM_TERMINATION_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kExecStatusNameTable[] = {
#define X(name, abr, desc) abr,
  ENUM_EXEC_STATUS_
#undef X
};

const char* ExecStatusName(ExecStatus status) {
  return kExecStatusNameTable[(int)status];
}

nlohmann::json ToJson(const ExecutionResult& res) {
  nlohmann::json ret = {
    {"status", ExecStatusName(res.status)},
    {"stdout", res.stdout_data},
    {"stderr", res.stderr_data},
    {"exit_code", res.exit_code},
    {"duration_ms", res.duration_ms},
    {"stats", {
      {"termination", TerminationName(res.termination)},
      {"signal", res.term_signal},
      {"compile_ms", res.compile_ms},
      {"cpu_ms", res.cpu_ms},
      {"max_rss_kib", res.memory_kib},
      {"stdout_truncated", res.stdout_truncated},
      {"stderr_truncated", res.stderr_truncated},
    }},
  };
  if (res.diagnostic.line || res.diagnostic.message.size()) {
    ret["diagnostic"] = {
      {"line", res.diagnostic.line},
      {"message", res.diagnostic.message},
    };
  }
  return ret;
}

nlohmann::json ToJson(const ExecutionResponse& resp) {
  nlohmann::json ret = {{"id", resp.id}};
  if (resp.error != ExecError::NONE) {
    ret["error"] = ExecErrorName(resp.error);
    ret["message"] = resp.message;
  }
  // a cancelled running execution still carries what it produced
  if (resp.error == ExecError::NONE || resp.error == ExecError::CANCELLED) {
    ret["result"] = ToJson(resp.result);
  }
  return ret;
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + "k,mode=777").c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  // lazy: a process that escaped the kill may still hold a cwd inside
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}
