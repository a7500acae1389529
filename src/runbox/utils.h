#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

// close every descriptor >= minfd; async-signal-safe, usable between fork and exec
int CloseFrom(int minfd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// create (or truncate) path with the given content; perms applied afterwards
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

#endif  // RUNBOX_UTILS_H_
