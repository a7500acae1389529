// runbox-sandbox-exec: runs exactly one cjail_exec and reports the result.
// protocol: stdin = (int64 size, serialized SandboxOptions); stdout = struct cjail_result
// The jail descriptors (input/output/error) are inherited from the service.
#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

namespace {

bool ReadAll(int fd, void* buf, size_t size) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (size) {
    ssize_t r = read(fd, ptr, size);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r, size -= r;
  }
  return true;
}

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

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  int64_t sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0 || sz > (64 << 20)) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  SandboxOptions opt;
  if (!opt.Deserialize(buf)) return 1;
  struct cjail_result res = SandboxExec(opt);
  if (!WriteAll(1, &res, sizeof(res))) return 1;
}
