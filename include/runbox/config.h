#ifndef INCLUDE_RUNBOX_CONFIG_H_
#define INCLUDE_RUNBOX_CONFIG_H_

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include "execution.h"

class ToolchainRegistry;

// every live sandbox runs under its own uid (and gid) taken from this range
constexpr int kSandboxUidBase = 50000, kSandboxUidCount = 100;

struct ServiceConfig {
  int parallel; // worker pool size
  size_t queue_depth; // 0 = reject as soon as every worker is busy
  int64_t max_source; // bytes
  int64_t max_stdin; // bytes
  ResourceLimits ceiling; // server-enforced maximum of any limit
  int64_t grace_period; // us between graceful and forceful termination
  bool share_network;
  std::vector<std::string> bind_dirs; // read-only system directories inside the box

  ServiceConfig() :
      parallel(1),
      queue_depth(16),
      max_source(64 * 1024),
      max_stdin(8 * 1024 * 1024),
      ceiling(30'000'000, 30'000'000, 1024 * 1024, 64, 4 * 1024 * 1024),
      grace_period(300'000),
      share_network(false),
      bind_dirs{"/usr", "/lib", "/lib64", "/lib32", "/bin", "/etc/alternatives"} {}
};

// Reads the INI file at path; languages listed in it are registered into registry
// on top of whatever it already holds. Returns false if the file cannot be read.
bool LoadConfig(const std::filesystem::path& path, ServiceConfig&, ToolchainRegistry&);

#endif  // INCLUDE_RUNBOX_CONFIG_H_
