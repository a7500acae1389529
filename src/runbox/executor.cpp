#include <runbox/executor.h>

#include <signal.h>
#include <sys/stat.h>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <runbox/utils.h>

#include "box.h"

namespace {

// tmpfs size of the workdir: source, compile output and whatever the program writes
constexpr int64_t kWorkdirExtraKiB = 16 * 1024;

} // namespace

Executor::Executor(ServiceConfig&& config, ToolchainRegistry&& registry) :
    config_(std::move(config)),
    registry_(std::move(registry)),
    // each running execution holds one sandbox uid
    scheduler_(std::min(config_.parallel, kSandboxUidCount), config_.queue_depth,
               [this](const ExecutionRequest& req, const std::atomic_bool& cancel) {
                 return RunExecution(req, cancel);
               }) {
  // a helper dying early must not take the service down with it
  signal(SIGPIPE, SIG_IGN);
  umask(0022);
}

ExecutionResponse Executor::Execute(const std::string& language, std::string source_code, std::string stdin_data,
                                    const LimitOverride& limits, long id) {
  const Toolchain* toolchain = registry_.Find(language);
  if (!toolchain) {
    spdlog::info("Execution rejected: id={} language={} reason=unsupported", id, language);
    return ExecutionResponse::Rejected(id, ExecError::UNSUPPORTED_LANGUAGE, "unsupported language: " + language);
  }
  if ((int64_t)source_code.size() > config_.max_source) {
    spdlog::info("Execution rejected: id={} source_size={} reason=too large", id, source_code.size());
    return ExecutionResponse::Rejected(id, ExecError::INVALID_INPUT,
        "source exceeds " + std::to_string(config_.max_source) + " bytes");
  }
  if ((int64_t)stdin_data.size() > config_.max_stdin) {
    spdlog::info("Execution rejected: id={} stdin_size={} reason=too large", id, stdin_data.size());
    return ExecutionResponse::Rejected(id, ExecError::INVALID_INPUT,
        "stdin exceeds " + std::to_string(config_.max_stdin) + " bytes");
  }
  ExecutionRequest req;
  if (!ApplyLimitOverride(toolchain->Spec().run_limits, config_.ceiling, limits, req.limits)) {
    return ExecutionResponse::Rejected(id, ExecError::INVALID_INPUT, "resource limits must be positive");
  }
  req.id = id;
  req.language = language;
  req.source_code = std::move(source_code);
  req.stdin_data = std::move(stdin_data);
  return scheduler_.Submit(std::move(req));
}

ExecutionResult Executor::RunExecution(const ExecutionRequest& req, const std::atomic_bool& cancel) const {
  ExecutionResult result;
  const Toolchain* toolchain = registry_.Find(req.language);
  if (!toolchain) return result;
  const ToolchainSpec& spec = toolchain->Spec();
  int64_t output_kib = std::max(spec.compile_limits.max_output, req.limits.max_output) / 1024;
  int64_t workdir_kib = output_kib + (int64_t)req.source_code.size() / 1024 + kWorkdirExtraKiB;
  {
    auto box = Sandbox::Create(req.id, config_, spec.bind_dirs, workdir_kib);
    if (!box) {
      spdlog::warn("Failed creating sandbox: id={}", req.id);
      return result;
    }
    if (!toolchain->Prepare(*box, req)) return result;
    if (toolchain->Compile(*box, req, result, cancel)) {
      toolchain->Run(*box, req, result, cancel);
    }
    // box is torn down here, before the result leaves the worker
  }
  spdlog::info("Execution finished: id={} language={} status={} compile_ms={} duration_ms={}",
               req.id, req.language, ExecStatusName(result.status), result.compile_ms, result.duration_ms);
  return result;
}
