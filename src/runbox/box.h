#ifndef RUNBOX_BOX_H_
#define RUNBOX_BOX_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <runbox/config.h>
#include <runbox/execution.h>

#include "collector.h"

namespace fs = std::filesystem;

// One isolated execution environment: a box directory used as the jail root, a tmpfs
// workdir inside it, and a uid of its own. Exclusively owned; the destructor is the teardown.
class Sandbox {
  const long id_;
  const int uid_;
  const fs::path root_;
  const int64_t grace_period_;
  const bool share_network_;
  std::vector<std::string> dirs_; // bind mounts whose mount points exist in root_
  bool mounted_;

  Sandbox(long id, int uid, const ServiceConfig& config);
 public:
  // Returns nullptr if the environment cannot be set up; nothing is left behind in that case
  static std::unique_ptr<Sandbox> Create(long id, const ServiceConfig& config,
                                         const std::vector<std::string>& extra_dirs, int64_t workdir_kib);
  ~Sandbox();
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  long Id() const { return id_; }
  int Uid() const { return uid_; }
  const fs::path& Root() const { return root_; }
  fs::path Workdir() const;

  // Put a file into the workdir, readable (not writable) by the sandbox uid
  bool WriteFile(const std::string& name, const std::string& content);
  bool HasFile(const std::string& name) const;

  // Run command (argv; the executable is resolved with env's PATH) in the jail with workdir as cwd.
  // stdout/stderr are captured up to capture_cap bytes each; with merge_output both go to outcome.err.
  // The caller's cancel flag triggers the same escalation as the wall-clock deadline.
  RunOutcome RunIsolated(const std::vector<std::string>& command, const std::vector<std::string>& env,
                         const ResourceLimits& limits, const std::string& stdin_data,
                         int64_t capture_cap, bool merge_output, const std::atomic_bool& cancel);
};

// number of uids currently handed out (for tests and introspection)
int SandboxesInUse();

#endif  // RUNBOX_BOX_H_
