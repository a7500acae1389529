#ifndef INCLUDE_RUNBOX_EXECUTION_H_
#define INCLUDE_RUNBOX_EXECUTION_H_

#include <string>
#include <optional>
#include <cstdint>

// exactly one of these is set on every result
#define ENUM_EXEC_STATUS_ \
  X(SUCCESS, "Success", "Program exited normally") \
  X(COMPILE_ERROR, "CompileError", "Compile Error") \
  X(RUNTIME_ERROR, "RuntimeError", "Runtime Error (exited with nonzero status or signal)") \
  X(TIMEOUT, "Timeout", "Wall Clock Time Limit Exceeded") \
  X(RESOURCE_EXCEEDED, "ResourceExceeded", "Resource Limit Exceeded") \
  X(INTERNAL_ERROR, "InternalError", "Sandbox Infrastructure Error")
enum class ExecStatus {
#define X(name, abr, desc) name,
  ENUM_EXEC_STATUS_
#undef X
};

// how the last sandboxed process ended; used for classification and logging
#define ENUM_TERMINATION_ \
  X(NONE) \
  X(EXITED) \
  X(SIGNALED) \
  X(WALL_TIMEOUT) \
  X(CPU_LIMIT) \
  X(MEMORY_LIMIT) \
  X(OUTPUT_LIMIT) \
  X(CANCELLED) \
  X(SANDBOX_ERROR)
enum class Termination {
#define X(name) name,
  ENUM_TERMINATION_
#undef X
};

// errors of requests that never produced a result
#define ENUM_EXEC_ERROR_ \
  X(NONE, "") \
  X(INVALID_INPUT, "InvalidInput") \
  X(UNSUPPORTED_LANGUAGE, "UnsupportedLanguage") \
  X(OVERLOADED, "Overloaded") \
  X(CANCELLED, "Cancelled")
enum class ExecError {
#define X(name, abr) name,
  ENUM_EXEC_ERROR_
#undef X
};

struct ResourceLimits {
  int64_t wall_time; // us
  int64_t cpu_time; // us
  int64_t memory; // KiB
  int max_processes;
  int64_t max_output; // bytes, per stream

  ResourceLimits() :
      wall_time(0), cpu_time(0), memory(0), max_processes(0), max_output(0) {}
  ResourceLimits(int64_t wall_time, int64_t cpu_time, int64_t memory, int max_processes, int64_t max_output) :
      wall_time(wall_time), cpu_time(cpu_time), memory(memory),
      max_processes(max_processes), max_output(max_output) {}
};

// Caller-supplied partial override; unset fields keep the language default
struct LimitOverride {
  std::optional<int64_t> wall_time; // us
  std::optional<int64_t> cpu_time; // us
  std::optional<int64_t> memory; // KiB
  std::optional<int> max_processes;
  std::optional<int64_t> max_output; // bytes
};

// Tighten-only merge: override may not exceed ceiling, and unset fields take defaults.
// Returns false if any given override is non-positive.
bool ApplyLimitOverride(const ResourceLimits& defaults, const ResourceLimits& ceiling,
                        const LimitOverride& over, ResourceLimits& out);
// Clamp every field of lim to ceiling (fields of ceiling that are 0 mean unlimited;
//   fields of lim that are 0 take the ceiling)
ResourceLimits ClampLimits(const ResourceLimits& lim, const ResourceLimits& ceiling);

class ExecutionRequest {
 public:
  // caller correlation identity; assigned by the scheduler when 0
  long id;
  std::string language;
  std::string source_code;
  std::string stdin_data;
  ResourceLimits limits; // effective limits, already clamped

  ExecutionRequest() : id(0) {}
};

class ExecutionResult {
 public:
  struct Diagnostic {
    int line; // 0 if unknown
    std::string message;
    Diagnostic() : line(0) {}
  };

  ExecStatus status;
  Termination termination;
  std::string stdout_data, stderr_data;
  bool stdout_truncated, stderr_truncated;
  int exit_code; // 128 + signal if killed by a signal
  int term_signal; // 0 if exited normally
  int64_t duration_ms; // run phase (compile phase for CompileError)
  int64_t compile_ms;
  int64_t cpu_ms;
  int64_t memory_kib; // peak RSS
  Diagnostic diagnostic; // first compiler error, or the uncaught error of a RuntimeError

  ExecutionResult() :
      status(ExecStatus::INTERNAL_ERROR), termination(Termination::NONE),
      stdout_truncated(false), stderr_truncated(false),
      exit_code(0), term_signal(0), duration_ms(0), compile_ms(0),
      cpu_ms(0), memory_kib(0) {}
};

class ExecutionResponse {
 public:
  long id;
  ExecError error;
  std::string message; // human-readable reason when error != NONE
  ExecutionResult result; // meaningful only when error == NONE

  ExecutionResponse() : id(0), error(ExecError::NONE) {}
  bool Ok() const { return error == ExecError::NONE; }

  static ExecutionResponse Rejected(long id, ExecError err, std::string msg) {
    ExecutionResponse ret;
    ret.id = id;
    ret.error = err;
    ret.message = std::move(msg);
    return ret;
  }
};

#endif  // INCLUDE_RUNBOX_EXECUTION_H_
