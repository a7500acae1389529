#include <runbox/execution.h>

#include <algorithm>

namespace {

// an unset (non-positive) field falls back to the ceiling itself
template <class T> inline T ClampField(T val, T ceiling) {
  if (ceiling <= 0) return val;
  return val > 0 ? std::min(val, ceiling) : ceiling;
}

template <class T> inline bool Override(const std::optional<T>& over, T ceiling, T& field) {
  if (!over) return true;
  if (*over <= 0) return false;
  field = ClampField(*over, ceiling);
  return true;
}

} // namespace

ResourceLimits ClampLimits(const ResourceLimits& lim, const ResourceLimits& ceiling) {
  ResourceLimits ret = lim;
  ret.wall_time = ClampField(lim.wall_time, ceiling.wall_time);
  ret.cpu_time = ClampField(lim.cpu_time, ceiling.cpu_time);
  ret.memory = ClampField(lim.memory, ceiling.memory);
  ret.max_processes = ClampField(lim.max_processes, ceiling.max_processes);
  ret.max_output = ClampField(lim.max_output, ceiling.max_output);
  return ret;
}

bool ApplyLimitOverride(const ResourceLimits& defaults, const ResourceLimits& ceiling,
                        const LimitOverride& over, ResourceLimits& out) {
  ResourceLimits ret = ClampLimits(defaults, ceiling);
  if (!Override(over.wall_time, ceiling.wall_time, ret.wall_time) ||
      !Override(over.cpu_time, ceiling.cpu_time, ret.cpu_time) ||
      !Override(over.memory, ceiling.memory, ret.memory) ||
      !Override(over.max_processes, ceiling.max_processes, ret.max_processes) ||
      !Override(over.max_output, ceiling.max_output, ret.max_output)) {
    return false;
  }
  out = ret;
  return true;
}
