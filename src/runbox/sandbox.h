#ifndef RUNBOX_SANDBOX_H_
#define RUNBOX_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
// Owns the argv/env/mount arrays a cjail_ctx points into
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }

  friend class SandboxOptions;
};

// Everything the helper needs to start one jailed process tree.
// Built by the service, serialized over a pipe to runbox-sandbox-exec, turned into a cjail_ctx there.
class SandboxOptions {
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  std::string workdir; // inside box (relative to boxdir but start with /)
  int fd_input, fd_output, fd_error; // descriptor numbers as seen by the helper
  int uid, gid;
  bool share_network;
  int64_t wall_time, cpu_time; // us
  int64_t rss; // KiB
  int proc_num;
  int file_num;
  int64_t fsize; // KiB
  std::vector<std::string> dirs; // bind-mounted read-only from the host

  SandboxOptions() :
      fd_input(-1), fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      share_network(false),
      wall_time(0), cpu_time(0),
      rss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}

  // drop directories missing on the host and create their mount points inside boxdir
  void FilterDirs();
  // host-endian; both ends are built from the same tree
  std::vector<uint8_t> Serialize() const;
  // false on a truncated or foreign message; *this is unspecified then
  bool Deserialize(const std::vector<uint8_t>& serial);
  // the context refers to the strings of this object; keep both alive together
  void ToCJailCtx(CJailCtxClass&) const;

 private:
  template <class Opt, class Visitor> static void VisitFields(Opt&, Visitor&);
};

#endif  // RUNBOX_SANDBOX_H_
