#include "collector.h"

#include <signal.h>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <vector>
#include <algorithm>
#include <string_view>

#include <spdlog/spdlog.h>
#include <runbox/utils.h>

namespace {

inline int64_t ToUs(const struct timeval& v) {
  return (int64_t)v.tv_sec * 1'000'000 + v.tv_usec;
}

inline int64_t CpuUs(const struct cjail_result& res) {
  return ToUs(res.rus.ru_utime) + ToUs(res.rus.ru_stime);
}

inline bool KilledBySignal(const struct cjail_result& res) {
  return res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED;
}

// std::regex recurses per character; longer lines are only matched on their prefix
constexpr size_t kMaxDiagnosticLine = 1024;

inline bool MemoryExceeded(const struct cjail_result& res, const ResourceLimits& lim) {
  return lim.memory && res.rus.ru_maxrss > lim.memory;
}

std::vector<std::string_view> SplitLines(const std::string& str) {
  std::vector<std::string_view> ret;
  for (size_t pos = 0; pos < str.size();) {
    size_t nxt = str.find('\n', pos);
    if (nxt == std::string::npos) nxt = str.size();
    ret.emplace_back(str.data() + pos, nxt - pos);
    pos = nxt + 1;
  }
  return ret;
}

inline bool StartsWith(std::string_view str, std::string_view prefix) {
  return str.substr(0, prefix.size()) == prefix;
}

std::string_view TrimLeft(std::string_view str) {
  size_t pos = str.find_first_not_of(" \t");
  return pos == std::string_view::npos ? std::string_view() : str.substr(pos);
}

// 0 unless str starts with a positive number
int LeadingNumber(std::string_view str) {
  int ret = 0;
  for (size_t i = 0; i < str.size() && i < 9 && isdigit((unsigned char)str[i]); i++) {
    ret = ret * 10 + (str[i] - '0');
  }
  return ret;
}

// "TypeError: ...", "java.lang.ArithmeticException", ...
bool IsErrorHeadline(std::string_view line) {
  std::string_view name = line.substr(0, line.find(':'));
  if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) {
        return isalnum((unsigned char)c) || c == '_' || c == '.' || c == '$';
      })) {
    return false;
  }
  auto EndsWith = [&](std::string_view suffix) {
    return name.size() >= suffix.size() && name.substr(name.size() - suffix.size()) == suffix;
  };
  return EndsWith("Error") || EndsWith("Exception");
}

// line number following "<...>/<source_file>:" somewhere in line
int LocationIn(std::string_view line, const std::string& source_file) {
  const std::string key = source_file + ":";
  for (size_t pos = line.find(key); pos != std::string_view::npos; pos = line.find(key, pos + 1)) {
    if (pos && line[pos - 1] != '/' && line[pos - 1] != '(') continue;
    if (int ret = LeadingNumber(line.substr(pos + key.size()))) return ret;
  }
  return 0;
}

// Traceback (most recent call last):
//   File "/workdir/main.py", line 3, in <module>
//     print(1 / 0)
// ZeroDivisionError: division by zero
ExecutionResult::Diagnostic PythonTrace(const std::vector<std::string_view>& lines,
                                        const std::string& source_file) {
  static const std::string kFile = "File \"", kLine = "\", line ";
  ExecutionResult::Diagnostic ret;
  bool traceback = false;
  std::string_view last;
  for (auto line : lines) {
    if (StartsWith(line, "Traceback (most recent call last)")) {
      traceback = true;
      continue;
    }
    std::string_view trimmed = TrimLeft(line);
    if (StartsWith(trimmed, kFile)) {
      size_t pos = trimmed.find(kLine);
      if (pos == std::string_view::npos) continue;
      std::string_view path = trimmed.substr(kFile.size(), pos - kFile.size());
      if (path == source_file || (path.size() > source_file.size() &&
          path.substr(path.size() - source_file.size() - 1) == "/" + source_file)) {
        traceback = true;
        // innermost frame of the program comes last
        ret.line = LeadingNumber(trimmed.substr(pos + kLine.size()));
      }
      continue;
    }
    if (line.size() && line[0] != ' ' && line[0] != '\t') last = line;
  }
  if (!traceback) return ExecutionResult::Diagnostic();
  ret.message = std::string(last);
  return ret;
}

// /workdir/main.js:3
//     throw new Error("boom");
//     ^
//
// Error: boom
//     at Object.<anonymous> (/workdir/main.js:3:11)
ExecutionResult::Diagnostic NodeTrace(const std::vector<std::string_view>& lines,
                                      const std::string& source_file) {
  ExecutionResult::Diagnostic ret;
  bool found = false;
  for (auto line : lines) {
    if (!found && IsErrorHeadline(line)) {
      found = true;
      ret.message = std::string(line);
      continue;
    }
    if (ret.line) continue;
    std::string_view trimmed = TrimLeft(line);
    // the header line of the throw site, or the first stack frame in the program
    if (StartsWith(trimmed, "at ") || trimmed.size() == line.size()) ret.line = LocationIn(trimmed, source_file);
  }
  if (!found) return ExecutionResult::Diagnostic();
  return ret;
}

// Exception in thread "main" java.lang.ArithmeticException: / by zero
//         at Main.main(Main.java:3)
ExecutionResult::Diagnostic JvmTrace(const std::vector<std::string_view>& lines,
                                     const std::string& source_file) {
  static const std::string kHeadline = "Exception in thread \"main\" ";
  ExecutionResult::Diagnostic ret;
  bool found = false;
  for (auto line : lines) {
    if (!found) {
      if (StartsWith(line, kHeadline)) {
        found = true;
        ret.message = std::string(line.substr(kHeadline.size()));
      }
      continue;
    }
    std::string_view trimmed = TrimLeft(line);
    if (!StartsWith(trimmed, "at ")) break;
    if ((ret.line = LocationIn(trimmed, source_file))) break;
  }
  return ret;
}

} // namespace

void OutputBuffer::Append(const char* buf, size_t len) {
  total_ += len;
  size_t room = (int64_t)data_.size() < cap_ ? cap_ - data_.size() : 0;
  if (len > room) truncated_ = true;
  data_.append(buf, std::min(room, len));
}

Termination ClassifyTermination(const RunOutcome& out, const ResourceLimits& lim) {
  const struct cjail_result& res = out.jail;
  if (out.sandbox_error || res.timekill == -1) {
    // timekill = -1 means SandboxExec error (see sandbox_main.cpp)
    return Termination::SANDBOX_ERROR;
  }
  // the supervising timer fired first: the exit status is only a consequence of our signal
  if (out.watchdog == Termination::CANCELLED) return Termination::CANCELLED;
  if (out.watchdog == Termination::WALL_TIMEOUT) return Termination::WALL_TIMEOUT;
  // oomkill = -1 means failed to read oom (see cjail/cjail.h)
  if (res.oomkill > 0) return Termination::MEMORY_LIMIT;
  if (res.timekill) {
    // jail timer covers both the CPU limit and the wall-time backstop; wall clock takes precedence
    if (lim.wall_time && out.wall_us >= lim.wall_time) return Termination::WALL_TIMEOUT;
    return lim.cpu_time && CpuUs(res) >= lim.cpu_time ? Termination::CPU_LIMIT : Termination::WALL_TIMEOUT;
  }
  if (KilledBySignal(res)) {
    switch (res.info.si_status) {
      case SIGXCPU: return Termination::CPU_LIMIT;
      case SIGXFSZ: return Termination::OUTPUT_LIMIT;
    }
    // out of memory will likely cause SIGSEGV or std::bad_alloc (SIGABRT), so we check it before SIG
    if (MemoryExceeded(res, lim)) return Termination::MEMORY_LIMIT;
    return Termination::SIGNALED;
  }
  if (res.info.si_status != 0 && MemoryExceeded(res, lim)) return Termination::MEMORY_LIMIT;
  if (lim.cpu_time && CpuUs(res) > lim.cpu_time) return Termination::CPU_LIMIT;
  return Termination::EXITED;
}

ExecStatus RunStatus(Termination term, int exit_code) {
  switch (term) {
    case Termination::NONE: [[fallthrough]];
    case Termination::SANDBOX_ERROR: return ExecStatus::INTERNAL_ERROR;
    case Termination::WALL_TIMEOUT: return ExecStatus::TIMEOUT;
    case Termination::CPU_LIMIT: [[fallthrough]];
    case Termination::MEMORY_LIMIT: [[fallthrough]];
    case Termination::OUTPUT_LIMIT: return ExecStatus::RESOURCE_EXCEEDED;
    case Termination::SIGNALED: [[fallthrough]];
    case Termination::CANCELLED: return ExecStatus::RUNTIME_ERROR;
    case Termination::EXITED: return exit_code == 0 ? ExecStatus::SUCCESS : ExecStatus::RUNTIME_ERROR;
  }
  __builtin_unreachable();
}

void CollectRun(RunOutcome&& out, const ResourceLimits& lim, ExecutionResult& result) {
  const struct cjail_result& res = out.jail;
  Termination term = ClassifyTermination(out, lim);
  result.termination = term;
  if (term == Termination::SANDBOX_ERROR) {
    spdlog::warn("Sandbox failed during run: errno={} {}", out.sandbox_errno, strerror(out.sandbox_errno));
    result.exit_code = -1;
  } else if (KilledBySignal(res)) {
    result.term_signal = res.info.si_status;
    result.exit_code = 128 + res.info.si_status;
  } else {
    result.exit_code = res.info.si_status;
  }
  result.status = RunStatus(term, result.exit_code);
  result.duration_ms = out.wall_us / 1000;
  result.cpu_ms = CpuUs(res) / 1000;
  result.memory_kib = res.rus.ru_maxrss;
  result.stdout_truncated = out.out.Truncated();
  result.stderr_truncated = out.err.Truncated();
  result.stdout_data = out.out.Take();
  result.stderr_data = out.err.Take();
  spdlog::info("Run finished: code={} status={} termination={} result={} wall_ms={} cpu_ms={} rss={}",
               res.info.si_code, res.info.si_status, TerminationName(term), ExecStatusName(result.status),
               result.duration_ms, result.cpu_ms, result.memory_kib);
}

bool CollectCompile(RunOutcome&& out, const ResourceLimits& lim, bool program_exists,
                    const std::string& source_file, ExecutionResult& result) {
  const struct cjail_result& res = out.jail;
  Termination term = ClassifyTermination(out, lim);
  result.compile_ms = out.wall_us / 1000;
  if (term == Termination::SANDBOX_ERROR) {
    spdlog::warn("Sandbox failed during compile: errno={} {}", out.sandbox_errno, strerror(out.sandbox_errno));
    result.status = ExecStatus::INTERNAL_ERROR;
    result.termination = term;
    return false;
  }
  if (term == Termination::EXITED && res.info.si_status == 0 && program_exists) return true;

  // a cancelled execution is reported the same way in either phase
  result.status = term == Termination::CANCELLED ? RunStatus(term, 0) : ExecStatus::COMPILE_ERROR;
  result.termination = term;
  result.duration_ms = result.compile_ms;
  result.exit_code = KilledBySignal(res) ? 128 + res.info.si_status : res.info.si_status;
  // compiler writes both streams into the same pipe
  bool truncated = out.err.Truncated();
  std::string message = FilterDiagnostics(out.err.Take(), source_file);
  switch (term) {
    case Termination::WALL_TIMEOUT: message += "\n[Compilation timed out]"; break;
    case Termination::CPU_LIMIT: [[fallthrough]];
    case Termination::MEMORY_LIMIT: [[fallthrough]];
    case Termination::OUTPUT_LIMIT: message += "\n[Compilation exceeded resource limits]"; break;
    case Termination::CANCELLED: message += "\n[Compilation cancelled]"; break;
    default: break;
  }
  result.diagnostic = ParseDiagnostic(message, source_file);
  result.stderr_data = std::move(message);
  result.stderr_truncated = truncated;
  spdlog::info("Compilation failed: code={} status={} termination={} result={} line={}",
               res.info.si_code, res.info.si_status, TerminationName(term), ExecStatusName(result.status),
               result.diagnostic.line);
  spdlog::debug("Message: {}", result.stderr_data);
  return false;
}

std::string FilterDiagnostics(const std::string& message, const std::string& source_file) {
  // drop everything from an "In file included from" line up to the next line about the source;
  // scanned line by line so that the cost stays linear in the compiler output
  static const std::string kIncluded = "In file included from";
  static const std::string kRemoved = "[Error messages from headers removed]";
  const std::string source = "/workdir/" + source_file;
  std::string ret;
  bool skipping = false;
  for (size_t pos = 0; pos < message.size();) {
    size_t nxt = message.find('\n', pos);
    size_t end = nxt == std::string::npos ? message.size() : nxt + 1;
    if (skipping && message.compare(pos, source.size(), source) == 0) {
      skipping = false;
      ret += '\n';
    }
    if (!skipping && message.compare(pos, kIncluded.size(), kIncluded) == 0) {
      skipping = true;
      ret += kRemoved;
    }
    if (!skipping) ret.append(message, pos, end - pos);
    pos = end;
  }
  return ret;
}

ExecutionResult::Diagnostic ParseDiagnostic(const std::string& message, const std::string& source_file) {
  // gcc, javac: "<path>:<line>:[<col>:] error: <msg>"; go: "./<path>:<line>:<col>: <msg>";
  // rustc: "error: <msg>" followed by "--> <path>:<line>:<col>"
  static const std::regex kLocation("^(?:\\s*--> )?(?:\\S*/)?([^\\s:/]+):(\\d+)(?::\\d+)?:?\\s*(.*)$");
  ExecutionResult::Diagnostic ret, fallback;
  std::string prev, line;
  size_t pos = 0;
  while (pos < message.size()) {
    size_t nxt = message.find('\n', pos);
    if (nxt == std::string::npos) nxt = message.size();
    line = message.substr(pos, std::min(nxt - pos, kMaxDiagnosticLine));
    pos = nxt + 1;
    std::smatch match;
    if (std::regex_match(line, match, kLocation) && match[1].str() == source_file) {
      std::string text = match[3].str();
      if (text.empty()) text = prev;
      int lineno = (int)std::strtol(match[2].str().c_str(), nullptr, 10);
      if (text.find("error") != std::string::npos) {
        ret.line = lineno;
        ret.message = std::move(text);
        return ret;
      }
      if (!fallback.line && text.compare(0, 7, "warning") != 0 && text.compare(0, 4, "note") != 0 &&
          text.compare(0, 2, "In") != 0) {
        fallback.line = lineno;
        fallback.message = std::move(text);
      }
    }
    prev = std::move(line);
  }
  return fallback;
}

ExecutionResult::Diagnostic ParseRuntimeDiagnostic(const std::string& stderr_data, TraceFormat format,
                                                   const std::string& source_file) {
  std::vector<std::string_view> lines = SplitLines(stderr_data);
  switch (format) {
    case TraceFormat::NONE: return ExecutionResult::Diagnostic();
    case TraceFormat::PYTHON: return PythonTrace(lines, source_file);
    case TraceFormat::NODE: return NodeTrace(lines, source_file);
    case TraceFormat::JVM: return JvmTrace(lines, source_file);
  }
  __builtin_unreachable();
}
