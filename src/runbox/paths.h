#ifndef RUNBOX_PATHS_H_
#define RUNBOX_PATHS_H_

#include <runbox/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// host-side layout of one sandbox:
//   <box_root>/<id>/          chroot of the jail (bind mount points only, owned by root)
//   <box_root>/<id>/workdir/  tmpfs, writable by the sandbox uid
//   <box_root>/<id>.in        stdin of the current run, outside the jail
fs::path SandboxPath(long id);
fs::path SandboxWorkdir(long id);
fs::path SandboxInput(long id);
// in-box path of a file of the workdir
fs::path InsideWorkdir(const std::string& name);

#endif  // RUNBOX_PATHS_H_
