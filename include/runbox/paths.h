#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// privileged helper that invokes cjail; installed in the data dir
fs::path SandboxHelperPath();

#endif  // INCLUDE_RUNBOX_PATHS_H_
