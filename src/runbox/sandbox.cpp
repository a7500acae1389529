#include "sandbox.h"

#include <cstring>
#include <filesystem>
#include <type_traits>

namespace fs = std::filesystem;

namespace {

constexpr int64_t kOptionsMagic = 0x31584f4252; // "RBOX1"

// every scalar travels as int64, strings and lists are length-prefixed
class Encoder {
  std::vector<uint8_t>& buf_;

  void Raw(const void* ptr, size_t size) {
    auto p = static_cast<const uint8_t*>(ptr);
    buf_.insert(buf_.end(), p, p + size);
  }
 public:
  explicit Encoder(std::vector<uint8_t>& buf) : buf_(buf) {}

  template <class T>
  std::enable_if_t<std::is_arithmetic_v<T>> operator()(const T& val) {
    int64_t x = val;
    Raw(&x, sizeof(x));
  }
  void operator()(const std::string& str) {
    (*this)((int64_t)str.size());
    Raw(str.data(), str.size());
  }
  void operator()(const std::vector<std::string>& vec) {
    (*this)((int64_t)vec.size());
    for (auto& i : vec) (*this)(i);
  }
};

class Decoder {
  const std::vector<uint8_t>& buf_;
  size_t cur_;
  bool ok_;

  const uint8_t* Take(int64_t size) {
    if (!ok_ || size < 0 || (uint64_t)size > buf_.size() - cur_) {
      ok_ = false;
      return nullptr;
    }
    const uint8_t* ret = buf_.data() + cur_;
    cur_ += size;
    return ret;
  }
 public:
  explicit Decoder(const std::vector<uint8_t>& buf) : buf_(buf), cur_(0), ok_(true) {}
  bool Ok() const { return ok_; }
  bool AtEnd() const { return cur_ == buf_.size(); }

  template <class T>
  std::enable_if_t<std::is_arithmetic_v<T>> operator()(T& val) {
    int64_t x = 0;
    if (auto p = Take(sizeof(x))) memcpy(&x, p, sizeof(x));
    val = static_cast<T>(x);
  }
  void operator()(std::string& str) {
    int64_t size = 0;
    (*this)(size);
    auto p = Take(size);
    if (p) {
      str.assign(reinterpret_cast<const char*>(p), size);
    } else {
      str.clear();
    }
  }
  void operator()(std::vector<std::string>& vec) {
    int64_t size = 0;
    (*this)(size);
    // each element takes at least its length prefix
    if (size < 0 || (uint64_t)size > (buf_.size() - cur_) / sizeof(int64_t)) {
      ok_ = false;
      size = 0;
    }
    vec.resize(size);
    for (auto& i : vec) (*this)(i);
  }
};

char kBindMount[] = "bind";

} // namespace

template <class Opt, class Visitor>
void SandboxOptions::VisitFields(Opt& opt, Visitor& v) {
  v(opt.boxdir);
  v(opt.command);
  v(opt.envs);
  v(opt.workdir);
  v(opt.fd_input);
  v(opt.fd_output);
  v(opt.fd_error);
  v(opt.uid);
  v(opt.gid);
  v(opt.share_network);
  v(opt.wall_time);
  v(opt.cpu_time);
  v(opt.rss);
  v(opt.proc_num);
  v(opt.file_num);
  v(opt.fsize);
  v(opt.dirs);
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  Encoder enc(ret);
  enc(kOptionsMagic);
  VisitFields(*this, enc);
  return ret;
}

bool SandboxOptions::Deserialize(const std::vector<uint8_t>& serial) {
  Decoder dec(serial);
  int64_t magic = 0;
  dec(magic);
  if (!dec.Ok() || magic != kOptionsMagic) return false;
  VisitFields(*this, dec);
  return dec.Ok() && dec.AtEnd();
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> kept;
  for (auto& dir : dirs) {
    std::error_code ec;
    if (!fs::path(dir).is_absolute() || !fs::is_directory(dir, ec)) continue;
    fs::create_directories(fs::path(boxdir) / fs::path(dir).relative_path(), ec);
    if (!ec) kept.push_back(dir);
  }
  dirs = std::move(kept);
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = share_network;
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;

  ret.argv_buf_.clear();
  for (auto& i : command) ret.argv_buf_.push_back(i.c_str());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  ret.env_buf_.clear();
  for (auto& i : envs) ret.env_buf_.push_back(i.c_str());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.c_str());
  ctx.working_dir = const_cast<char*>(workdir.c_str());

  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0;
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // address space is left unlimited; memory is accounted by the cgroup
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;

  // mnt_list_add keeps pointers into mnt_buf_, so it must not reallocate
  ret.mnt_buf_.clear();
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    struct jail_mount_ctx& mnt = ret.mnt_buf_.emplace_back();
    mnt.type = kBindMount;
    mnt.source = mnt.target = const_cast<char*>(i.c_str());
    mnt.fstype = mnt.data = nullptr;
    mnt.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
