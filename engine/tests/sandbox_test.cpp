#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "capture/output_buffer.h"
#include "logging/trace.h"
#include "policy/policy.h"
#include "sandbox/process_sandbox.h"
#include "session/session.h"
#include "validator/validator.h"

using namespace analysis_sandbox;
using json = nlohmann::json;

namespace {

const char* kPython = "/usr/bin/python3";

bool HavePython() {
  return ::access(kPython, X_OK) == 0;
}

ExecutionContext SalesContext() {
  ExecutionContext context;
  context.data_frame = {{"region", {"north", "south", "east"}}, {"sales", {10, 20, 30}}};
  return context;
}

struct QuietTracer {
  QuietTracer() { Tracer::SetEnabled(false); }
  ~QuietTracer() { Tracer::SetEnabled(true); }
};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Functional tests also run on hosts without namespaces, Landlock or seccomp
SandboxOptions PortableOptions() {
  SandboxOptions options;
  options.require_network_isolation = false;
  options.require_filesystem_isolation = false;
  options.require_process_isolation = false;
  return options;
}

// Runtime guards off, so only the kernel-level confinement stands in the way
ExecutionResult RunUnguarded(const std::string& code) {
  Policy open_policy = Policy::Default();
  open_policy.forbidden_callables.clear();
  open_policy.forbidden_modules.clear();
  ProcessSandbox sandbox(open_policy);
  auto result = sandbox.Execute(code, SalesContext(), {}, nullptr, nullptr);
  if (result.error_kind() == ErrorKind::kInternalError &&
      Contains(result.error->message, "isolation unavailable")) {
    SKIP(result.error->message);
  }
  return result;
}

}  // namespace

TEST_CASE("ProcessSandbox runs code", "[sandbox]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  ProcessSandbox sandbox(policy, PortableOptions());
  const ExecutionContext context = SalesContext();

  SECTION("Output and variables are captured") {
    auto result = sandbox.Execute("result = 2 + 2\nprint(result)", context, {}, nullptr, nullptr);
    INFO(result.output);
    REQUIRE(result.success);
    REQUIRE(Contains(result.output, "4"));
    REQUIRE(result.variables["result"] == 4);
    REQUIRE_FALSE(result.variables.contains("df"));
    REQUIRE(result.execution_time > 0.0);
    REQUIRE_FALSE(result.timestamp.empty());
  }

  SECTION("The data frame is bound without third-party packages") {
    auto result = sandbox.Execute("print(len(df['sales']))", context, {}, nullptr, nullptr);
    REQUIRE(result.success);
    REQUIRE(Contains(result.output, "3"));
  }

  SECTION("Extra values are bound by name") {
    ExecutionContext with_values = SalesContext();
    with_values.values["threshold"] = 21;
    auto result = sandbox.Execute("doubled = threshold * 2", with_values, {}, nullptr, nullptr);
    REQUIRE(result.success);
    REQUIRE(result.variables["doubled"] == 42);
    REQUIRE_FALSE(result.variables.contains("threshold"));
  }

  SECTION("Only plain, public, bounded variables are returned") {
    const std::string code =
        "a = 1\n"
        "b = [1, 2.5, 'x', None]\n"
        "c = {'k': True}\n"
        "_hidden = 3\n"
        "import math\n"
        "def f():\n"
        "    return 1\n"
        "big = 'x' * 20000\n"
        "s = {1, 2}\n";
    auto result = sandbox.Execute(code, context, {}, nullptr, nullptr);
    REQUIRE(result.success);
    REQUIRE(result.variables == json({{"a", 1}, {"b", {1, 2.5, "x", nullptr}}, {"c", {{"k", true}}}}));
  }

  SECTION("Runtime exceptions keep output printed before the failure") {
    auto result = sandbox.Execute("print('before')\nraise ValueError('boom')", context, {}, nullptr, nullptr);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(result.error->message == "ValueError: boom");
    REQUIRE(result.error->exception_type == "ValueError");
    REQUIRE(Contains(result.error->traceback, "ValueError: boom"));
    REQUIRE(Contains(result.output, "before"));
  }

  SECTION("Explicit exit is a runtime failure") {
    auto result = sandbox.Execute("raise SystemExit(3)", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(result.error->message == "SystemExit: 3");
  }

  SECTION("Runtime guard blocks a forbidden import missed statically") {
    auto result = sandbox.Execute("m = __builtins__['__import__']('socket')", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
  }

  SECTION("Forbidden builtins are absent at runtime") {
    auto result = sandbox.Execute("x = open", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "NameError"));
  }
}

TEST_CASE("ProcessSandbox enforces limits", "[sandbox]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  const ExecutionContext context = SalesContext();

  SECTION("Wall-clock timeout") {
    ProcessSandbox sandbox(policy, PortableOptions());
    ExecutionLimits limits;
    limits.timeout_seconds = 1;
    auto result = sandbox.Execute("while True: pass", context, limits, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kTimeout);
    REQUIRE(result.error->message == "Execution exceeded timeout of 1 seconds");
    REQUIRE(result.execution_time < 4.0);
    REQUIRE(result.variables.empty());
  }

  SECTION("Memory limit") {
    ProcessSandbox sandbox(policy, PortableOptions());
    ExecutionLimits limits;
    limits.max_memory_mb = 256;
    auto result = sandbox.Execute("block = bytearray(2 * 1024 * 1024 * 1024)", context, limits, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kResourceExceeded);
    REQUIRE(result.variables.empty());
  }

  SECTION("Output is truncated with a marker") {
    SandboxOptions options = PortableOptions();
    options.max_output_bytes = 64;
    ProcessSandbox sandbox(policy, options);
    auto result = sandbox.Execute("print('x' * 5000)\nok = True", context, {}, nullptr, nullptr);
    REQUIRE(result.success);
    REQUIRE(Contains(result.output, TruncationMarker(64)));
    REQUIRE(result.output.size() == 64 + TruncationMarker(64).size());
    REQUIRE(result.variables["ok"] == true);
  }

  SECTION("Oversized result envelope") {
    SandboxOptions options = PortableOptions();
    options.max_result_bytes = 1024;
    ProcessSandbox sandbox(policy, options);
    auto result = sandbox.Execute("rows = list(range(1000))", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kResourceExceeded);
  }

  SECTION("Cancellation stops a running worker") {
    ProcessSandbox sandbox(policy, PortableOptions());
    CancellationToken cancel;
    std::thread canceller([&cancel] {
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
      cancel.Cancel();
    });
    auto result = sandbox.Execute("while True: pass", context, {}, &cancel, nullptr);
    canceller.join();
    REQUIRE(result.error_kind() == ErrorKind::kCancelled);
    REQUIRE(result.execution_time < 10.0);
  }

  SECTION("Scratch directory is the working directory and is removed") {
    const std::filesystem::path root = std::filesystem::absolute("sandbox-scratch-root");
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    SandboxOptions options = PortableOptions();
    options.scratch_root = root.string();
    ProcessSandbox sandbox(policy, options);
    auto result = sandbox.Execute(
        "import io\nwith io.open('scratch-notes.txt', 'w') as f:\n    f.write('hi')\n"
        "with io.open('scratch-notes.txt') as f:\n    text = f.read()",
        context, {}, nullptr, nullptr);
    INFO(result.output);
    REQUIRE(result.success);
    REQUIRE(result.variables["text"] == "hi");
    REQUIRE_FALSE(std::filesystem::exists("scratch-notes.txt"));
    REQUIRE(std::filesystem::is_empty(root));
    std::filesystem::remove_all(root);
  }
}

TEST_CASE("ProcessSandbox setup failures", "[sandbox]") {
  QuietTracer quiet;
  Policy policy = Policy::Default();
  const ExecutionContext context = SalesContext();

  SECTION("Missing interpreter") {
    SandboxOptions options = PortableOptions();
    options.interpreter = "/nonexistent/bin/python3";
    ProcessSandbox sandbox(policy, options);
    auto result = sandbox.Execute("print(1)", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kInternalError);
    REQUIRE(result.error->message == "Python interpreter not found: /nonexistent/bin/python3");
    REQUIRE_FALSE(result.timestamp.empty());
  }

  SECTION("Already cancelled") {
    ProcessSandbox sandbox(policy, PortableOptions());
    CancellationToken cancel;
    cancel.Cancel();
    auto result = sandbox.Execute("print(1)", context, {}, &cancel, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kCancelled);
  }
}

TEST_CASE("End-to-end through the orchestrator", "[sandbox][session]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);
  ProcessSandbox sandbox(policy, PortableOptions());
  SessionOrchestrator orchestrator(validator, sandbox);
  const ExecutionContext context = SalesContext();

  CodeUnit first;
  first.id = "q-0";
  first.code = "```python\ntotal = sum(df['sales'])\nprint(total)\n```";
  CodeUnit second;
  second.id = "q-1";
  second.code = "import subprocess\nsubprocess.run(['ls'])";
  CodeUnit third;
  third.id = "q-2";
  third.code = "print(max(df['sales']))";

  auto results = orchestrator.RunAll({first, second, third}, context, {});
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].success);
  REQUIRE(Contains(results[0].output, "60"));
  REQUIRE(results[0].variables["total"] == 60);
  REQUIRE(results[1].error_kind() == ErrorKind::kForbiddenModule);
  REQUIRE(results[2].success);
  REQUIRE(Contains(results[2].output, "30"));
}

TEST_CASE("Runaway loop through the orchestrator", "[sandbox][session]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  CodeValidator validator(policy);
  ProcessSandbox sandbox(policy, PortableOptions());
  SessionOrchestrator orchestrator(validator, sandbox);

  CodeUnit unit;
  unit.id = "loop";
  unit.code = "while True: pass";
  ExecutionLimits limits;
  limits.timeout_seconds = 1;

  const auto start = std::chrono::steady_clock::now();
  auto result = orchestrator.RunOne(unit, SalesContext(), limits);
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  REQUIRE_FALSE(result.success);
  REQUIRE(result.error_kind() == ErrorKind::kTimeout);
  REQUIRE(elapsed < 4.0);
}

TEST_CASE("Forbidden modules stay unreachable through allowed ones", "[sandbox]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  ProcessSandbox sandbox(policy, PortableOptions());
  const ExecutionContext context = SalesContext();

  SECTION("Module attribute of an allowed module") {
    auto result = sandbox.Execute("import random\nm = random._os", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "Access to module 'os' is not allowed"));
  }

  SECTION("From-import of a module attribute") {
    auto result = sandbox.Execute("from random import _os", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "ImportError"));
  }

  SECTION("Nested module attribute") {
    auto result = sandbox.Execute("import email.utils\nm = email.utils.os", context, {}, nullptr, nullptr);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "Access to module 'os' is not allowed"));
  }

  SECTION("Allowed modules keep working") {
    auto result = sandbox.Execute(
        "import random\nimport statistics\nrandom.seed(1)\n"
        "pick = random.randint(1, 3)\nmid = statistics.median([1, 2, 3])",
        context, {}, nullptr, nullptr);
    REQUIRE(result.success);
    REQUIRE(result.variables["mid"] == 2);
  }

  SECTION("Host signalling through an allowed module") {
    CodeValidator validator(policy);
    SessionOrchestrator orchestrator(validator, sandbox);
    CodeUnit unit;
    unit.id = "signal";
    unit.code = "import random\nm = random._os\nm.kill(m.getppid(), 0)";
    auto result = orchestrator.RunOne(unit, context, {});
    REQUIRE_FALSE(result.success);
    REQUIRE(Contains(result.error->message, "Access to module 'os' is not allowed"));
  }
}

TEST_CASE("Worker is confined by the kernel", "[sandbox][isolation]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;

  SECTION("Signalling the host is denied") {
    auto result = RunUnguarded("import os\nos.kill(os.getppid(), 0)");
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "PermissionError"));
  }

  SECTION("Signalling itself is allowed") {
    auto result = RunUnguarded("import os\nos.kill(os.getpid(), 0)\nok = True");
    REQUIRE(result.success);
  }

  SECTION("Forking is denied") {
    auto result = RunUnguarded("import os\npid = os.fork()\nif pid == 0:\n    os._exit(0)");
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "PermissionError"));
  }

  SECTION("Executing another program is denied") {
    auto result = RunUnguarded("import os\nos.execv('/bin/true', ['true'])");
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "PermissionError"));
  }

  SECTION("Subprocesses cannot start") {
    auto result = RunUnguarded("import subprocess\nsubprocess.run(['/bin/true'])");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
  }

  SECTION("Network is unreachable") {
    auto result = RunUnguarded(
        "import socket\ns = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "s.settimeout(2)\ns.connect(('1.1.1.1', 80))");
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
  }

  SECTION("Writes outside the scratch directory are denied") {
    const std::filesystem::path target =
        std::filesystem::absolute("outside-scratch-" + std::to_string(::getpid()) + ".txt");
    auto result = RunUnguarded("open(r'" + target.string() + "', 'w').write('x')");
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(Contains(result.error->message, "PermissionError"));
    REQUIRE_FALSE(std::filesystem::exists(target));
  }

  SECTION("Writes inside the scratch directory are allowed") {
    auto result = RunUnguarded(
        "with open('notes.txt', 'w') as f:\n    f.write('x')\n"
        "with open('notes.txt') as f:\n    text = f.read()");
    REQUIRE(result.success);
    REQUIRE(result.variables["text"] == "x");
  }
}

TEST_CASE("Output is streamed while the code runs", "[sandbox]") {
  if (!HavePython()) {
    SKIP("python3 is not installed");
  }
  QuietTracer quiet;
  Policy policy = Policy::Default();
  const ExecutionContext context = SalesContext();

  std::string streamed_out;
  std::string streamed_err;
  OutputCallback collect = [&](OutputStream stream, const std::string& chunk) {
    (stream == OutputStream::kStdout ? streamed_out : streamed_err) += chunk;
  };

  SECTION("Chunks add up to the captured output") {
    ProcessSandbox sandbox(policy, PortableOptions());
    auto result = sandbox.Execute("print('first')\nprint('second')", context, {}, nullptr, collect);
    REQUIRE(result.success);
    REQUIRE(streamed_out == "first\nsecond\n");
    REQUIRE(Contains(result.output, streamed_out));
  }

  SECTION("Standard error is tagged") {
    ProcessSandbox sandbox(policy, PortableOptions());
    auto result = sandbox.Execute("import warnings\nwarnings.warn('careful')", context, {}, nullptr,
                                  collect);
    REQUIRE(result.success);
    REQUIRE(Contains(streamed_err, "careful"));
    REQUIRE_FALSE(Contains(streamed_out, "careful"));
  }

  SECTION("Streaming stops at the output cap") {
    SandboxOptions options = PortableOptions();
    options.max_output_bytes = 8;
    ProcessSandbox sandbox(policy, options);
    auto result = sandbox.Execute("print('x' * 5000)", context, {}, nullptr, collect);
    REQUIRE(result.success);
    REQUIRE(streamed_out == "xxxxxxxx");
  }

  SECTION("A failing callback does not fail the run") {
    ProcessSandbox sandbox(policy, PortableOptions());
    int calls = 0;
    OutputCallback failing = [&calls](OutputStream, const std::string&) {
      ++calls;
      throw std::runtime_error("listener gone");
    };
    auto result = sandbox.Execute("print('a')\nok = True", context, {}, nullptr, failing);
    REQUIRE(result.success);
    REQUIRE(calls == 1);
    REQUIRE(Contains(result.output, "a"));
  }
}
