#include <runbox/config.h>

#include <fstream>
#include <sstream>
#include <algorithm>

#include <tortellini.hh>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include <runbox/toolchain.h>

namespace {

// comma or whitespace separated
std::vector<std::string> SplitList(std::string str) {
  std::replace(str.begin(), str.end(), ',', ' ');
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string token; sin >> token;) ret.push_back(std::move(token));
  return ret;
}

// ';' separated, since values themselves may contain commas
std::vector<std::string> SplitEnv(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string token; std::getline(sin, token, ';');) {
    token.erase(0, token.find_first_not_of(" \t"));
    token.erase(token.find_last_not_of(" \t") + 1);
    if (token.size()) ret.push_back(std::move(token));
  }
  return ret;
}

// keys: <prefix>wall_time_ms, <prefix>cpu_time_ms, <prefix>memory_mb, <prefix>max_processes, <prefix>max_output_kib
void ParseLimits(tortellini::ini& ini, const std::string& sec, const std::string& prefix, ResourceLimits& lim) {
  lim.wall_time = (ini[sec][prefix + "wall_time_ms"] | (long)(lim.wall_time / 1000)) * 1000L;
  lim.cpu_time = (ini[sec][prefix + "cpu_time_ms"] | (long)(lim.cpu_time / 1000)) * 1000L;
  lim.memory = (ini[sec][prefix + "memory_mb"] | (long)(lim.memory / 1024)) * 1024L;
  lim.max_processes = ini[sec][prefix + "max_processes"] | lim.max_processes;
  lim.max_output = (ini[sec][prefix + "max_output_kib"] | (long)(lim.max_output / 1024)) * 1024L;
}

// a language limit of 0 would mean unlimited memory or an immediate timeout
bool ValidLimits(const ResourceLimits& lim) {
  return lim.wall_time > 0 && lim.cpu_time > 0 && lim.memory > 0 && lim.max_processes > 0 && lim.max_output > 0;
}

bool ParseLanguage(tortellini::ini& ini, const std::string& name, ToolchainRegistry& registry) {
  ToolchainSpec spec;
  if (auto toolchain = registry.Find(name)) spec = toolchain->Spec();
  spec.name = name;
  spec.extension = ini[name]["extension"] | spec.extension;
  if (std::string val = ini[name]["extensions"] | ""; val.size()) spec.extra_extensions = SplitList(val);
  spec.source_file = ini[name]["source_file"] | spec.source_file;
  spec.program_file = ini[name]["program_file"] | spec.program_file;
  if (std::string val = ini[name]["compile"] | ""; val.size()) {
    spec.compile_command = val == "none" ? std::vector<std::string>() : SplitCommand(val);
  }
  if (std::string val = ini[name]["run"] | ""; val.size()) spec.run_command = SplitCommand(val);
  if (std::string val = ini[name]["env"] | ""; val.size()) spec.env = SplitEnv(val);
  if (std::string val = ini[name]["bind_dirs"] | ""; val.size()) spec.bind_dirs = SplitList(val);
  if (std::string val = ini[name]["runtime_trace"] | ""; val.size()) {
    auto format = ParseTraceFormat(val);
    if (!format) {
      spdlog::error("Language {}: unknown runtime_trace {}", name, val);
      return false;
    }
    spec.runtime_trace = *format;
  }
  ParseLimits(ini, name, "", spec.run_limits);
  ParseLimits(ini, name, "compile_", spec.compile_limits);

  if (spec.run_command.empty() || spec.source_file.empty()) {
    spdlog::error("Language {} needs at least run and source_file", name);
    return false;
  }
  if (!ValidLimits(spec.run_limits) || !ValidLimits(spec.compile_limits)) {
    spdlog::error("Language {}: every limit must be positive", name);
    return false;
  }
  if (spec.source_file.find('/') != std::string::npos || spec.program_file.find('/') != std::string::npos) {
    spdlog::error("Language {}: file names must not contain '/'", name);
    return false;
  }
  if (spec.program_file.empty()) spec.program_file = spec.source_file;
  spdlog::debug("Language {}: compile={} run={}", name, spec.compile_command, spec.run_command);
  registry.Register(std::move(spec));
  return true;
}

} // namespace

bool LoadConfig(const std::filesystem::path& path, ServiceConfig& config, ToolchainRegistry& registry) {
  std::ifstream fin(path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  config.parallel = ini[""]["parallel"] | config.parallel;
  long queue_depth = ini[""]["queue_depth"] | (long)config.queue_depth;
  config.max_source = (ini[""]["max_source_kib"] | (long)(config.max_source / 1024)) * 1024L;
  config.max_stdin = (ini[""]["max_stdin_kib"] | (long)(config.max_stdin / 1024)) * 1024L;
  config.grace_period = (ini[""]["grace_ms"] | (long)(config.grace_period / 1000)) * 1000L;
  config.share_network = ini[""]["share_network"] | config.share_network;
  if (std::string val = ini[""]["bind_dirs"] | ""; val.size()) config.bind_dirs = SplitList(val);
  auto& ceil = config.ceiling;
  ceil.wall_time = (ini[""]["max_wall_time_ms"] | (long)(ceil.wall_time / 1000)) * 1000L;
  ceil.cpu_time = (ini[""]["max_cpu_time_ms"] | (long)(ceil.cpu_time / 1000)) * 1000L;
  ceil.memory = (ini[""]["max_memory_mb"] | (long)(ceil.memory / 1024)) * 1024L;
  ceil.max_processes = ini[""]["max_processes"] | ceil.max_processes;
  ceil.max_output = (ini[""]["max_output_kib"] | (long)(ceil.max_output / 1024)) * 1024L;

  // every running execution holds one uid of the sandbox range
  if (config.parallel < 1 || config.parallel > kSandboxUidCount || queue_depth < 0 ||
      config.max_source <= 0 || config.max_stdin < 0 || config.grace_period < 0) {
    spdlog::error("Invalid global configuration: parallel={} queue_depth={} max_source={} max_stdin={} "
                  "grace_period={}", config.parallel, queue_depth, config.max_source, config.max_stdin,
                  config.grace_period);
    return false;
  }
  if (ceil.wall_time < 0 || ceil.cpu_time < 0 || ceil.memory < 0 || ceil.max_processes < 0 ||
      ceil.max_output < 0) {
    spdlog::error("Invalid ceiling: limits must not be negative (0 means no ceiling)");
    return false;
  }
  config.queue_depth = queue_depth;
  std::string languages = ini[""]["languages"] | "";
  for (auto& name : SplitList(languages)) {
    if (!ParseLanguage(ini, name, registry)) return false;
  }
  spdlog::info("Configuration loaded: path={} parallel={} queue_depth={} languages={}",
               path.c_str(), config.parallel, config.queue_depth, registry.Languages());
  return true;
}
