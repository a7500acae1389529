#ifndef INCLUDE_RUNBOX_EXECUTOR_H_
#define INCLUDE_RUNBOX_EXECUTOR_H_

#include <atomic>
#include <string>

#include "config.h"
#include "execution.h"
#include "scheduler.h"
#include "toolchain.h"

// Core entry point: validate -> admit -> sandbox -> compile -> run -> collect -> teardown
class Executor {
  const ServiceConfig config_;
  const ToolchainRegistry registry_;
  Scheduler scheduler_;

  ExecutionResult RunExecution(const ExecutionRequest&, const std::atomic_bool& cancel) const;
 public:
  Executor(ServiceConfig&& config, ToolchainRegistry&& registry);

  // Synchronous; always returns a terminal result or a rejection
  ExecutionResponse Execute(const std::string& language, std::string source_code, std::string stdin_data,
                            const LimitOverride& limits = {}, long id = 0);
  bool Cancel(long id) { return scheduler_.Cancel(id); }

  const Scheduler& GetScheduler() const { return scheduler_; }
};

#endif  // INCLUDE_RUNBOX_EXECUTOR_H_
