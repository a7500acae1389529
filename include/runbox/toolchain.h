#ifndef INCLUDE_RUNBOX_TOOLCHAIN_H_
#define INCLUDE_RUNBOX_TOOLCHAIN_H_

#include <map>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "execution.h"

// how an interpreter or VM reports an uncaught error on stderr
#define ENUM_TRACE_FORMAT_ \
  X(NONE, "none") \
  X(PYTHON, "python") \
  X(NODE, "node") \
  X(JVM, "jvm")
enum class TraceFormat {
#define X(name, abr) name,
  ENUM_TRACE_FORMAT_
#undef X
};

// Commands may contain these placeholders; they are replaced by in-box paths
//   {source}  - canonical source file
//   {program} - compile output
//   {workdir} - working directory
struct ToolchainSpec {
  std::string name; // language id used in requests
  std::string extension; // with leading dot
  std::vector<std::string> extra_extensions; // for DetectLanguage only
  std::string source_file; // canonical name inside workdir
  std::string program_file; // compile output inside workdir
  std::vector<std::string> compile_command; // empty for interpreted languages
  std::vector<std::string> run_command;
  std::vector<std::string> env; // KEY=VALUE, appended to the default environment
  std::vector<std::string> bind_dirs; // extra read-only directories
  ResourceLimits run_limits; // defaults; clamped by the service ceiling
  ResourceLimits compile_limits;
  TraceFormat runtime_trace = TraceFormat::NONE; // RuntimeError diagnostics
};

class Sandbox;

class Toolchain {
 protected:
  const ToolchainSpec spec_;

  std::vector<std::string> Expand(const std::vector<std::string>& command) const;
 public:
  explicit Toolchain(ToolchainSpec&& spec) : spec_(std::move(spec)) {}
  virtual ~Toolchain() = default;

  const ToolchainSpec& Spec() const { return spec_; }
  const std::string& Name() const { return spec_.name; }
  virtual bool IsCompiled() const = 0;

  std::vector<std::string> CompileCommand() const { return Expand(spec_.compile_command); }
  std::vector<std::string> RunCommand() const { return Expand(spec_.run_command); }
  // default environment with the entries of ToolchainSpec::env replacing those of the same key
  std::vector<std::string> Environment() const;

  // Writes the source into the sandbox under its canonical name
  bool Prepare(Sandbox&, const ExecutionRequest&) const;
  // Returns false if execution must stop; result is filled in that case
  virtual bool Compile(Sandbox&, const ExecutionRequest&, ExecutionResult&,
                       const std::atomic_bool& cancel) const = 0;
  void Run(Sandbox&, const ExecutionRequest&, ExecutionResult&, const std::atomic_bool& cancel) const;
};

class CompiledToolchain : public Toolchain {
 public:
  using Toolchain::Toolchain;
  bool IsCompiled() const override { return true; }
  bool Compile(Sandbox&, const ExecutionRequest&, ExecutionResult&,
               const std::atomic_bool& cancel) const override;
};

class InterpretedToolchain : public Toolchain {
 public:
  using Toolchain::Toolchain;
  bool IsCompiled() const override { return false; }
  bool Compile(Sandbox&, const ExecutionRequest&, ExecutionResult&,
               const std::atomic_bool&) const override { return true; }
};

std::unique_ptr<Toolchain> MakeToolchain(ToolchainSpec&&);

// Read-only after startup; safe to share between workers
class ToolchainRegistry {
  std::map<std::string, std::unique_ptr<Toolchain>> toolchains_;
 public:
  ToolchainRegistry() = default;
  ToolchainRegistry(ToolchainRegistry&&) = default;
  ToolchainRegistry& operator=(ToolchainRegistry&&) = default;

  // replaces an existing entry of the same name
  void Register(ToolchainSpec&&);
  const Toolchain* Find(const std::string& language) const;
  std::vector<std::string> Languages() const;
  std::optional<std::string> DetectLanguage(const std::string& filename) const;
  size_t size() const { return toolchains_.size(); }
};

std::vector<ToolchainSpec> BuiltinToolchains();
ToolchainRegistry BuiltinRegistry();

const char* TraceFormatName(TraceFormat);
std::optional<TraceFormat> ParseTraceFormat(const std::string&);

// Whitespace-separated command line
std::vector<std::string> SplitCommand(const std::string&);

#endif  // INCLUDE_RUNBOX_TOOLCHAIN_H_
