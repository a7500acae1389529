#include "paths.h"

#include "utils.h"

fs::path kBoxRoot = "/tmp/runbox";

namespace internal {
fs::path kDataDir = fs::path(RUNBOX_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

fs::path SandboxHelperPath() {
  return internal::kDataDir / "runbox-sandbox-exec";
}

fs::path SandboxPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}
fs::path SandboxWorkdir(long id) {
  return Workdir(SandboxPath(id));
}
fs::path SandboxInput(long id) {
  return kBoxRoot / (PadInt(id, 6) + ".in");
}
fs::path InsideWorkdir(const std::string& name) {
  return Workdir("/") / name;
}
