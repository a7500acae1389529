#include <signal.h>
#include <cerrno>
#include <thread>
#include <gtest/gtest.h>

#include "collector.h"

namespace {

const ResourceLimits kLimits(1'000'000, 1'000'000, 65536, 16, 1024);

RunOutcome Exited(int status, long maxrss = 1024) {
  RunOutcome ret(1024, 1024);
  ret.jail.info.si_code = CLD_EXITED;
  ret.jail.info.si_status = status;
  ret.jail.rus.ru_maxrss = maxrss;
  ret.wall_us = 10'000;
  return ret;
}

RunOutcome Killed(int sig, long maxrss = 1024) {
  RunOutcome ret = Exited(0, maxrss);
  ret.jail.info.si_code = CLD_KILLED;
  ret.jail.info.si_status = sig;
  return ret;
}

struct TermParam {
  std::string name;
  RunOutcome outcome;
  Termination termination;
  ExecStatus status;
};

std::string ParamName(const ::testing::TestParamInfo<TermParam>& info) {
  return info.param.name;
}

std::vector<TermParam> TermParams() {
  std::vector<TermParam> ret;
  ret.push_back({"exit_zero", Exited(0), Termination::EXITED, ExecStatus::SUCCESS});
  ret.push_back({"exit_nonzero", Exited(3), Termination::EXITED, ExecStatus::RUNTIME_ERROR});
  ret.push_back({"segv", Killed(SIGSEGV), Termination::SIGNALED, ExecStatus::RUNTIME_ERROR});
  ret.push_back({"segv_over_memory", Killed(SIGSEGV, 70000), Termination::MEMORY_LIMIT,
                 ExecStatus::RESOURCE_EXCEEDED});
  ret.push_back({"abort_over_memory", Exited(134, 70000), Termination::MEMORY_LIMIT,
                 ExecStatus::RESOURCE_EXCEEDED});
  ret.push_back({"xcpu", Killed(SIGXCPU), Termination::CPU_LIMIT, ExecStatus::RESOURCE_EXCEEDED});
  ret.push_back({"xfsz", Killed(SIGXFSZ), Termination::OUTPUT_LIMIT, ExecStatus::RESOURCE_EXCEEDED});
  {
    RunOutcome out = Killed(SIGKILL);
    out.jail.oomkill = 1;
    ret.push_back({"oom", std::move(out), Termination::MEMORY_LIMIT, ExecStatus::RESOURCE_EXCEEDED});
  }
  {
    // oomkill = -1: the jail could not read the oom counter
    RunOutcome out = Exited(0);
    out.jail.oomkill = -1;
    ret.push_back({"oom_unknown", std::move(out), Termination::EXITED, ExecStatus::SUCCESS});
  }
  {
    RunOutcome out = Killed(SIGKILL);
    out.watchdog = Termination::WALL_TIMEOUT;
    ret.push_back({"watchdog_timeout", std::move(out), Termination::WALL_TIMEOUT, ExecStatus::TIMEOUT});
  }
  {
    // exit status after our SIGTERM does not matter
    RunOutcome out = Exited(0);
    out.watchdog = Termination::WALL_TIMEOUT;
    ret.push_back({"watchdog_timeout_clean_exit", std::move(out), Termination::WALL_TIMEOUT, ExecStatus::TIMEOUT});
  }
  {
    RunOutcome out = Killed(SIGTERM);
    out.watchdog = Termination::CANCELLED;
    ret.push_back({"cancelled", std::move(out), Termination::CANCELLED, ExecStatus::RUNTIME_ERROR});
  }
  {
    RunOutcome out = Killed(SIGKILL);
    out.jail.timekill = 1;
    out.jail.rus.ru_utime.tv_sec = 1;
    ret.push_back({"jail_cpu_limit", std::move(out), Termination::CPU_LIMIT, ExecStatus::RESOURCE_EXCEEDED});
  }
  {
    RunOutcome out = Killed(SIGKILL);
    out.jail.timekill = 1;
    out.wall_us = 2'000'000;
    ret.push_back({"jail_wall_limit", std::move(out), Termination::WALL_TIMEOUT, ExecStatus::TIMEOUT});
  }
  {
    RunOutcome out = Exited(0);
    out.jail.timekill = -1;
    out.jail.oomkill = ENOENT;
    ret.push_back({"helper_error", std::move(out), Termination::SANDBOX_ERROR, ExecStatus::INTERNAL_ERROR});
  }
  {
    RunOutcome out = Exited(0);
    out.sandbox_error = true;
    ret.push_back({"helper_lost", std::move(out), Termination::SANDBOX_ERROR, ExecStatus::INTERNAL_ERROR});
  }
  return ret;
}

} // namespace

TEST(OutputBuffer, KeepsEverythingBelowCap) {
  OutputBuffer buf(10);
  buf.Append("hello", 5);
  buf.Append("world", 5);
  EXPECT_EQ(buf.Data(), "helloworld");
  EXPECT_FALSE(buf.Truncated());
  EXPECT_EQ(buf.Total(), 10);
}

TEST(OutputBuffer, TruncatesAtExactlyCap) {
  OutputBuffer buf(8);
  buf.Append("hello", 5);
  buf.Append("world", 5);
  buf.Append("again", 5);
  EXPECT_EQ(buf.Data(), "hellowor");
  EXPECT_TRUE(buf.Truncated());
  EXPECT_EQ(buf.Total(), 15);
}

TEST(OutputBuffer, ZeroCap) {
  OutputBuffer buf(0);
  buf.Append("x", 1);
  EXPECT_EQ(buf.Data(), "");
  EXPECT_TRUE(buf.Truncated());
}

class Classification : public testing::TestWithParam<TermParam> {};
TEST_P(Classification, Term) {
  auto& param = GetParam();
  EXPECT_EQ(ClassifyTermination(param.outcome, kLimits), param.termination);
  RunOutcome outcome = param.outcome;
  ExecutionResult result;
  CollectRun(std::move(outcome), kLimits, result);
  EXPECT_EQ(result.termination, param.termination);
  EXPECT_EQ(result.status, param.status);
}
INSTANTIATE_TEST_SUITE_P(RunPhase, Classification, testing::ValuesIn(TermParams()), ParamName);

TEST(CollectRun, ExitCodeOfSignal) {
  ExecutionResult result;
  CollectRun(Killed(SIGSEGV), kLimits, result);
  EXPECT_EQ(result.status, ExecStatus::RUNTIME_ERROR);
  EXPECT_EQ(result.term_signal, SIGSEGV);
  EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
}

TEST(CollectRun, PartialOutputKept) {
  RunOutcome out = Killed(SIGKILL);
  out.watchdog = Termination::WALL_TIMEOUT;
  out.out.Append("partial", 7);
  out.err.Append("warn", 4);
  ExecutionResult result;
  CollectRun(std::move(out), kLimits, result);
  EXPECT_EQ(result.status, ExecStatus::TIMEOUT);
  EXPECT_EQ(result.stdout_data, "partial");
  EXPECT_EQ(result.stderr_data, "warn");
  EXPECT_EQ(result.duration_ms, 10);
}

TEST(CollectCompile, Success) {
  ExecutionResult result;
  EXPECT_TRUE(CollectCompile(Exited(0), kLimits, true, "main.cpp", result));
  EXPECT_EQ(result.compile_ms, 10);
}

TEST(CollectCompile, MissingProgram) {
  ExecutionResult result;
  EXPECT_FALSE(CollectCompile(Exited(0), kLimits, false, "main.cpp", result));
  EXPECT_EQ(result.status, ExecStatus::COMPILE_ERROR);
}

TEST(CollectCompile, Diagnostics) {
  RunOutcome out = Exited(1);
  std::string msg = "/workdir/main.cpp: In function 'int main()':\n"
                    "/workdir/main.cpp:3:5: error: 'x' was not declared in this scope\n";
  out.err.Append(msg.data(), msg.size());
  ExecutionResult result;
  EXPECT_FALSE(CollectCompile(std::move(out), kLimits, false, "main.cpp", result));
  EXPECT_EQ(result.status, ExecStatus::COMPILE_ERROR);
  EXPECT_EQ(result.stderr_data, msg);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.diagnostic.line, 3);
  EXPECT_EQ(result.diagnostic.message, "error: 'x' was not declared in this scope");
}

TEST(CollectCompile, Timeout) {
  RunOutcome out = Killed(SIGKILL);
  out.watchdog = Termination::WALL_TIMEOUT;
  ExecutionResult result;
  EXPECT_FALSE(CollectCompile(std::move(out), kLimits, false, "main.cpp", result));
  EXPECT_EQ(result.status, ExecStatus::COMPILE_ERROR);
  EXPECT_EQ(result.termination, Termination::WALL_TIMEOUT);
  EXPECT_NE(result.stderr_data.find("timed out"), std::string::npos);
}

TEST(CollectCompile, CancelledLikeRun) {
  RunOutcome out = Killed(SIGTERM);
  out.watchdog = Termination::CANCELLED;
  out.err.Append("partial", 7);
  ExecutionResult result;
  EXPECT_FALSE(CollectCompile(std::move(out), kLimits, false, "main.cpp", result));
  EXPECT_EQ(result.termination, Termination::CANCELLED);
  EXPECT_EQ(result.status, RunStatus(Termination::CANCELLED, 0));
  EXPECT_EQ(result.status, ExecStatus::RUNTIME_ERROR);
  EXPECT_EQ(result.stderr_data.compare(0, 7, "partial"), 0);
}

TEST(CollectCompile, SandboxError) {
  RunOutcome out = Exited(0);
  out.sandbox_error = true;
  ExecutionResult result;
  EXPECT_FALSE(CollectCompile(std::move(out), kLimits, true, "main.cpp", result));
  EXPECT_EQ(result.status, ExecStatus::INTERNAL_ERROR);
}

TEST(Diagnostics, HeaderChainRemoved) {
  std::string msg = "In file included from /usr/include/c++/12/vector:64,\n"
                    "                 from /workdir/main.cpp:1:\n"
                    "/usr/include/c++/12/bits/stl_vector.h:10: error: something deep\n"
                    "/workdir/main.cpp:5:3: error: no match\n";
  std::string filtered = FilterDiagnostics(msg, "main.cpp");
  EXPECT_EQ(filtered, "[Error messages from headers removed]\n/workdir/main.cpp:5:3: error: no match\n");
  EXPECT_EQ(ParseDiagnostic(filtered, "main.cpp").line, 5);
}

TEST(Diagnostics, Javac) {
  auto diag = ParseDiagnostic("/workdir/Main.java:4: error: ';' expected\n    int x = 1\n", "Main.java");
  EXPECT_EQ(diag.line, 4);
  EXPECT_EQ(diag.message, "error: ';' expected");
}

TEST(Diagnostics, Rustc) {
  std::string msg = "error[E0425]: cannot find value `y` in this scope\n"
                    " --> /workdir/main.rs:2:20\n"
                    "  |\n";
  auto diag = ParseDiagnostic(msg, "main.rs");
  EXPECT_EQ(diag.line, 2);
  EXPECT_EQ(diag.message, "error[E0425]: cannot find value `y` in this scope");
}

TEST(Diagnostics, Go) {
  std::string msg = "# command-line-arguments\n/workdir/main.go:6:2: undefined: y\n";
  auto diag = ParseDiagnostic(msg, "main.go");
  EXPECT_EQ(diag.line, 6);
  EXPECT_EQ(diag.message, "undefined: y");
}

TEST(Diagnostics, OtherFileIgnored) {
  auto diag = ParseDiagnostic("/usr/include/stdio.h:12:1: error: oops\n", "main.c");
  EXPECT_EQ(diag.line, 0);
  EXPECT_EQ(diag.message, "");
}

TEST(Diagnostics, LargeHeaderOnlyOutput) {
  std::string msg = "In file included from /usr/include/x86_64-linux-gnu/c++/12/bits/stdc++.h:33,\n"
                    "                 from /workdir/main.cpp:2:\n";
  while (msg.size() < (2 << 20)) {
    msg += "/usr/include/c++/12/bits/stl_algobase.h:10:7: error: expected unqualified-id before ')' token\n";
  }
  std::string filtered;
  ExecutionResult::Diagnostic diag;
  // compile results are collected on scheduler workers
  std::thread worker([&] {
    filtered = FilterDiagnostics(msg, "main.cpp");
    diag = ParseDiagnostic(msg, "main.cpp");
  });
  worker.join();
  EXPECT_EQ(filtered, "[Error messages from headers removed]");
  EXPECT_EQ(diag.line, 0);
}

TEST(Diagnostics, LongSingleLine) {
  std::string msg = "/workdir/main.cpp:7:1: error: " + std::string(1 << 20, 'x') + "\n";
  std::string filtered;
  ExecutionResult::Diagnostic diag;
  std::thread worker([&] {
    filtered = FilterDiagnostics(msg, "main.cpp");
    diag = ParseDiagnostic(msg, "main.cpp");
  });
  worker.join();
  EXPECT_EQ(filtered, msg);
  EXPECT_EQ(diag.line, 7);
  EXPECT_EQ(diag.message.compare(0, 7, "error: "), 0);
}

TEST(Diagnostics, SeveralHeaderChains) {
  std::string msg = "In file included from a.h:1,\n"
                    "/workdir/main.cpp:1:1: error: first\n"
                    "In file included from b.h:2,\n"
                    "b.h:3: error: deep\n"
                    "/workdir/main.cpp:9:1: error: second\n";
  EXPECT_EQ(FilterDiagnostics(msg, "main.cpp"),
            "[Error messages from headers removed]\n/workdir/main.cpp:1:1: error: first\n"
            "[Error messages from headers removed]\n/workdir/main.cpp:9:1: error: second\n");
}

namespace {

struct TraceParam {
  std::string name;
  TraceFormat format;
  std::string source_file;
  std::string stderr_data;
  int line;
  std::string message;
};

std::string TraceParamName(const ::testing::TestParamInfo<TraceParam>& info) {
  return info.param.name;
}

std::vector<TraceParam> TraceParams() {
  std::vector<TraceParam> ret;
  ret.push_back({"python_zero_division", TraceFormat::PYTHON, "main.py",
                 "Traceback (most recent call last):\n"
                 "  File \"/workdir/main.py\", line 5, in <module>\n"
                 "    main()\n"
                 "  File \"/workdir/main.py\", line 3, in main\n"
                 "    print(1 / 0)\n"
                 "          ~~^~~\n"
                 "ZeroDivisionError: division by zero\n",
                 3, "ZeroDivisionError: division by zero"});
  ret.push_back({"python_library_frame", TraceFormat::PYTHON, "main.py",
                 "Traceback (most recent call last):\n"
                 "  File \"/workdir/main.py\", line 2, in <module>\n"
                 "    json.loads('x')\n"
                 "  File \"/usr/lib/python3.11/json/__init__.py\", line 346, in loads\n"
                 "    return _default_decoder.decode(s)\n"
                 "json.decoder.JSONDecodeError: Expecting value: line 1 column 1 (char 0)\n",
                 2, "json.decoder.JSONDecodeError: Expecting value: line 1 column 1 (char 0)"});
  ret.push_back({"python_syntax_error", TraceFormat::PYTHON, "main.py",
                 "  File \"/workdir/main.py\", line 1\n"
                 "    print(\n"
                 "         ^\n"
                 "SyntaxError: '(' was never closed\n",
                 1, "SyntaxError: '(' was never closed"});
  ret.push_back({"python_plain_stderr", TraceFormat::PYTHON, "main.py", "something went wrong\n", 0, ""});
  ret.push_back({"node_throw", TraceFormat::NODE, "main.js",
                 "/workdir/main.js:4\n"
                 "  throw new Error(\"boom\");\n"
                 "  ^\n"
                 "\n"
                 "Error: boom\n"
                 "    at f (/workdir/main.js:4:9)\n"
                 "    at Object.<anonymous> (/workdir/main.js:6:1)\n"
                 "    at Module._compile (node:internal/modules/cjs/loader:1256:14)\n"
                 "\n"
                 "Node.js v18.19.1\n",
                 4, "Error: boom"});
  ret.push_back({"node_type_error", TraceFormat::NODE, "main.js",
                 "TypeError: Cannot read properties of undefined (reading 'x')\n"
                 "    at Object.<anonymous> (/workdir/main.js:2:15)\n",
                 2, "TypeError: Cannot read properties of undefined (reading 'x')"});
  ret.push_back({"jvm_exception", TraceFormat::JVM, "Main.java",
                 "Exception in thread \"main\" java.lang.NumberFormatException: For input string: \"x\"\n"
                 "\tat java.base/java.lang.Integer.parseInt(Integer.java:652)\n"
                 "\tat Main.main(Main.java:7)\n",
                 7, "java.lang.NumberFormatException: For input string: \"x\""});
  ret.push_back({"jvm_no_trace", TraceFormat::JVM, "Main.java", "Killed\n", 0, ""});
  ret.push_back({"none", TraceFormat::NONE, "main.cpp",
                 "Traceback (most recent call last):\nValueError: x\n", 0, ""});
  return ret;
}

} // namespace

class RuntimeDiagnostics : public testing::TestWithParam<TraceParam> {};
TEST_P(RuntimeDiagnostics, Parse) {
  auto& param = GetParam();
  auto diag = ParseRuntimeDiagnostic(param.stderr_data, param.format, param.source_file);
  EXPECT_EQ(diag.line, param.line);
  EXPECT_EQ(diag.message, param.message);
}
INSTANTIATE_TEST_SUITE_P(Traces, RuntimeDiagnostics, testing::ValuesIn(TraceParams()), TraceParamName);
