#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>

#include <nlohmann/json_fwd.hpp>
#include "execution.h"

long GetUniqueExecutionId();

const char* ExecStatusToDesc(ExecStatus);
const char* ExecStatusName(ExecStatus);
const char* ExecErrorName(ExecError);
// logging
const char* TerminationName(Termination);

nlohmann::json ToJson(const ExecutionResult&);
nlohmann::json ToJson(const ExecutionResponse&);

#endif  // INCLUDE_RUNBOX_UTILS_H_
