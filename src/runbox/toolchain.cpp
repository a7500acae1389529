#include <runbox/toolchain.h>

#include <sstream>
#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "box.h"
#include "collector.h"
#include "paths.h"

namespace {

const std::vector<std::string> kDefaultEnv = {
  "PATH=/usr/local/bin:/usr/bin:/bin",
  "HOME=/workdir",
  "LANG=C.UTF-8",
};

constexpr int64_t kMiB = 1024; // in KiB
constexpr int64_t kSecond = 1'000'000; // in us

// run: wall, cpu, memory, processes, output bytes per stream
const ResourceLimits kNativeRunLimits(10 * kSecond, 10 * kSecond, 256 * kMiB, 32, 1 << 20);
const ResourceLimits kScriptRunLimits(10 * kSecond, 10 * kSecond, 128 * kMiB, 32, 1 << 20);
const ResourceLimits kVmRunLimits(15 * kSecond, 15 * kSecond, 512 * kMiB, 64, 1 << 20);
// compile: output is the size of files the compiler may write
const ResourceLimits kCompileLimits(30 * kSecond, 30 * kSecond, 1024 * kMiB, 64, 64 << 20);

// replace every occurrence of key in str
void Substitute(std::string& str, const std::string& key, const std::string& value) {
  for (size_t pos = 0; (pos = str.find(key, pos)) != std::string::npos; pos += value.size()) {
    str.replace(pos, key.size(), value);
  }
}

std::string EnvKey(const std::string& entry) {
  return entry.substr(0, entry.find('='));
}

} // namespace

static const char* kTraceFormatNameTable[] = {
#define X(name, abr) abr,
  ENUM_TRACE_FORMAT_
#undef X
};

const char* TraceFormatName(TraceFormat format) {
  return kTraceFormatNameTable[(int)format];
}

std::optional<TraceFormat> ParseTraceFormat(const std::string& name) {
#define X(val, abr) if (name == abr) return TraceFormat::val;
  ENUM_TRACE_FORMAT_
#undef X
  return std::nullopt;
}

std::vector<std::string> SplitCommand(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string token; sin >> token;) ret.push_back(std::move(token));
  return ret;
}

std::vector<std::string> Toolchain::Expand(const std::vector<std::string>& command) const {
  const std::string source = InsideWorkdir(spec_.source_file);
  const std::string program = InsideWorkdir(spec_.program_file);
  const std::string workdir = Workdir(fs::path("/"));
  std::vector<std::string> ret = command;
  for (auto& arg : ret) {
    Substitute(arg, "{source}", source);
    Substitute(arg, "{program}", program);
    Substitute(arg, "{workdir}", workdir);
  }
  return ret;
}

std::vector<std::string> Toolchain::Environment() const {
  std::vector<std::string> ret = kDefaultEnv;
  for (auto& entry : spec_.env) {
    auto key = EnvKey(entry);
    auto it = std::find_if(ret.begin(), ret.end(), [&](const std::string& i) { return EnvKey(i) == key; });
    if (it != ret.end()) {
      *it = entry;
    } else {
      ret.push_back(entry);
    }
  }
  return ret;
}

bool Toolchain::Prepare(Sandbox& box, const ExecutionRequest& req) const {
  if (!box.WriteFile(spec_.source_file, req.source_code)) {
    spdlog::warn("Failed writing source: id={} language={}", req.id, Name());
    return false;
  }
  return true;
}

bool CompiledToolchain::Compile(Sandbox& box, const ExecutionRequest& req, ExecutionResult& result,
                                const std::atomic_bool& cancel) const {
  spdlog::info("Compile start: id={} language={}", req.id, Name());
  // diagnostics are capped like any other output of the request
  RunOutcome outcome = box.RunIsolated(CompileCommand(), Environment(), spec_.compile_limits, "",
                                       req.limits.max_output, true, cancel);
  return CollectCompile(std::move(outcome), spec_.compile_limits, box.HasFile(spec_.program_file),
                        spec_.source_file, result);
}

void Toolchain::Run(Sandbox& box, const ExecutionRequest& req, ExecutionResult& result,
                    const std::atomic_bool& cancel) const {
  spdlog::info("Run start: id={} language={} wall_us={} memory_kib={}",
               req.id, Name(), req.limits.wall_time, req.limits.memory);
  RunOutcome outcome = box.RunIsolated(RunCommand(), Environment(), req.limits, req.stdin_data,
                                       req.limits.max_output, false, cancel);
  CollectRun(std::move(outcome), req.limits, result);
  if (result.status == ExecStatus::RUNTIME_ERROR && result.termination != Termination::CANCELLED &&
      spec_.runtime_trace != TraceFormat::NONE) {
    result.diagnostic = ParseRuntimeDiagnostic(result.stderr_data, spec_.runtime_trace, spec_.source_file);
    spdlog::debug("Runtime diagnostic: id={} line={} message={}",
                  req.id, result.diagnostic.line, result.diagnostic.message);
  }
}

std::unique_ptr<Toolchain> MakeToolchain(ToolchainSpec&& spec) {
  if (spec.compile_command.empty()) return std::make_unique<InterpretedToolchain>(std::move(spec));
  return std::make_unique<CompiledToolchain>(std::move(spec));
}

void ToolchainRegistry::Register(ToolchainSpec&& spec) {
  std::string name = spec.name;
  spdlog::debug("Register toolchain: language={} compiled={}", name, !spec.compile_command.empty());
  toolchains_[name] = MakeToolchain(std::move(spec));
}

const Toolchain* ToolchainRegistry::Find(const std::string& language) const {
  auto it = toolchains_.find(language);
  return it == toolchains_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ToolchainRegistry::Languages() const {
  std::vector<std::string> ret;
  for (auto& i : toolchains_) ret.push_back(i.first);
  return ret;
}

std::optional<std::string> ToolchainRegistry::DetectLanguage(const std::string& filename) const {
  std::string ext = fs::path(filename).extension();
  if (ext.empty()) return std::nullopt;
  // primary extensions win over alternative ones
  for (auto& [name, toolchain] : toolchains_) {
    if (toolchain->Spec().extension == ext) return name;
  }
  for (auto& [name, toolchain] : toolchains_) {
    auto& extra = toolchain->Spec().extra_extensions;
    if (std::find(extra.begin(), extra.end(), ext) != extra.end()) return name;
  }
  return std::nullopt;
}

std::vector<ToolchainSpec> BuiltinToolchains() {
  std::vector<ToolchainSpec> ret;
  {
    ToolchainSpec spec;
    spec.name = "cpp";
    spec.extension = ".cpp";
    spec.extra_extensions = {".cc", ".cxx", ".c++"};
    spec.source_file = "main.cpp";
    spec.program_file = "main";
    spec.compile_command = {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w", "-o", "{program}", "{source}"};
    spec.run_command = {"{program}"};
    spec.run_limits = kNativeRunLimits;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "c";
    spec.extension = ".c";
    spec.source_file = "main.c";
    spec.program_file = "main";
    spec.compile_command = {"/usr/bin/env", "gcc", "-std=c17", "-O2", "-w", "-o", "{program}", "{source}", "-lm"};
    spec.run_command = {"{program}"};
    spec.run_limits = kNativeRunLimits;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "python";
    spec.extension = ".py";
    spec.extra_extensions = {".py3"};
    spec.source_file = "main.py";
    spec.program_file = "main.py";
    spec.run_command = {"/usr/bin/env", "python3", "-u", "{source}"};
    spec.env = {"PYTHONDONTWRITEBYTECODE=1"};
    spec.run_limits = kScriptRunLimits;
    spec.runtime_trace = TraceFormat::PYTHON;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "javascript";
    spec.extension = ".js";
    spec.extra_extensions = {".mjs", ".cjs"};
    spec.source_file = "main.js";
    spec.program_file = "main.js";
    spec.run_command = {"/usr/bin/env", "node", "{source}"};
    spec.run_limits = kVmRunLimits;
    spec.runtime_trace = TraceFormat::NODE;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "java";
    spec.extension = ".java";
    // public class must be named Main
    spec.source_file = "Main.java";
    spec.program_file = "Main.class";
    spec.compile_command = {"/usr/bin/env", "javac", "-encoding", "UTF-8", "-d", "{workdir}", "{source}"};
    spec.run_command = {"/usr/bin/env", "java", "-Xss64m", "-XX:+UseSerialGC", "-cp", "{workdir}", "Main"};
    spec.bind_dirs = {"/etc/java-17-openjdk", "/etc/java-21-openjdk"};
    spec.run_limits = kVmRunLimits;
    spec.runtime_trace = TraceFormat::JVM;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "go";
    spec.extension = ".go";
    spec.source_file = "main.go";
    spec.program_file = "main";
    spec.compile_command = {"/usr/bin/env", "go", "build", "-o", "{program}", "{source}"};
    spec.run_command = {"{program}"};
    spec.env = {
      "PATH=/usr/local/go/bin:/usr/local/bin:/usr/bin:/bin",
      "GOCACHE=/workdir/.cache/go-build",
      "GOPATH=/workdir/go",
      "GO111MODULE=off",
      "CGO_ENABLED=0",
    };
    spec.bind_dirs = {"/usr/local/go"};
    spec.run_limits = kNativeRunLimits;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  {
    ToolchainSpec spec;
    spec.name = "rust";
    spec.extension = ".rs";
    spec.source_file = "main.rs";
    spec.program_file = "main";
    spec.compile_command = {"/usr/bin/env", "rustc", "-O", "--edition", "2021", "-o", "{program}", "{source}"};
    spec.run_command = {"{program}"};
    spec.run_limits = kNativeRunLimits;
    spec.compile_limits = kCompileLimits;
    ret.push_back(std::move(spec));
  }
  return ret;
}

ToolchainRegistry BuiltinRegistry() {
  ToolchainRegistry ret;
  for (auto& spec : BuiltinToolchains()) ret.Register(std::move(spec));
  return ret;
}
