#ifndef RUNBOX_COLLECTOR_H_
#define RUNBOX_COLLECTOR_H_

#include <string>
#include <cstdint>

#include <cjail/cjail.h>
#include <runbox/execution.h>
#include <runbox/toolchain.h>

// Capped capture of one output stream; bytes past the cap are counted and dropped
class OutputBuffer {
  int64_t cap_;
  int64_t total_;
  bool truncated_;
  std::string data_;
 public:
  explicit OutputBuffer(int64_t cap) : cap_(cap), total_(0), truncated_(false) {}

  void Append(const char* buf, size_t len);
  const std::string& Data() const { return data_; }
  std::string Take() { return std::move(data_); }
  int64_t Total() const { return total_; }
  bool Truncated() const { return truncated_; }
};

// Raw observations of one isolated run, before classification
struct RunOutcome {
  bool sandbox_error;
  int sandbox_errno;
  Termination watchdog; // NONE, WALL_TIMEOUT or CANCELLED
  struct cjail_result jail;
  int64_t wall_us; // measured by the supervising timer
  OutputBuffer out, err;

  RunOutcome(int64_t out_cap, int64_t err_cap) :
      sandbox_error(false), sandbox_errno(0), watchdog(Termination::NONE),
      jail{}, wall_us(0), out(out_cap), err(err_cap) {}
};

Termination ClassifyTermination(const RunOutcome&, const ResourceLimits&);
// Run phase: maps the termination reason and exit status to exactly one status
ExecStatus RunStatus(Termination, int exit_code);

// Fill result from the run phase
void CollectRun(RunOutcome&&, const ResourceLimits&, ExecutionResult&);
// Fill result from the compile phase; returns true if compilation succeeded.
// Diagnostics (stdout and stderr of the compiler) go to stderr_data.
bool CollectCompile(RunOutcome&&, const ResourceLimits&, bool program_exists,
                    const std::string& source_file, ExecutionResult&);

// Collapse "In file included from" chains of system headers
std::string FilterDiagnostics(const std::string& message, const std::string& source_file);
// First "<source_file>:<line>:...error..." of a compiler output
ExecutionResult::Diagnostic ParseDiagnostic(const std::string& message, const std::string& source_file);

// Line and message of an uncaught error report (traceback, stack trace) in a program's stderr;
// line is that of the innermost frame in source_file
ExecutionResult::Diagnostic ParseRuntimeDiagnostic(const std::string& stderr_data, TraceFormat,
                                                   const std::string& source_file);

#endif  // RUNBOX_COLLECTOR_H_
