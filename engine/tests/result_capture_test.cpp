#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <regex>
#include <string>

#include <nlohmann/json.hpp>

#include "capture/envelope.h"
#include "capture/output_buffer.h"
#include "capture/result_json.h"
#include "sandbox/harness.h"

using namespace analysis_sandbox;
using json = nlohmann::json;

TEST_CASE("Output buffer", "[capture]") {
  SECTION("Under the cap nothing changes") {
    OutputBuffer buffer(16);
    buffer.Append("hello\n");
    buffer.Append("world\n");
    REQUIRE_FALSE(buffer.truncated());
    REQUIRE(buffer.Text() == "hello\nworld\n");
  }

  SECTION("Overflow is dropped and marked") {
    OutputBuffer buffer(8);
    buffer.Append("0123456789");
    buffer.Append("abc");
    REQUIRE(buffer.truncated());
    REQUIRE(buffer.total_bytes() == 13);
    REQUIRE(buffer.data() == "01234567");
    REQUIRE(buffer.Text() == "01234567\n\n[Output truncated - exceeded 8 bytes]");
  }

  SECTION("Exactly at the cap is not truncated") {
    OutputBuffer buffer(4);
    buffer.Append("abcd");
    REQUIRE_FALSE(buffer.truncated());
    REQUIRE(buffer.Text() == "abcd");
  }

  SECTION("Truncation never splits a UTF-8 sequence") {
    OutputBuffer buffer(4);
    buffer.Append("ab\xC3\xA9\xC3\xA9");  // "abéé"
    REQUIRE(buffer.truncated());
    REQUIRE(buffer.Text() == "ab\xC3\xA9" + TruncationMarker(4));

    OutputBuffer split(3);
    split.Append("ab\xC3\xA9");
    REQUIRE(split.Text() == "ab" + TruncationMarker(3));
  }
}

TEST_CASE("Variable filtering", "[capture]") {
  SECTION("Plain JSON values are kept") {
    json vars = {{"a", 1}, {"b", "text"}, {"c", {1, 2.5, nullptr}}, {"d", {{"k", true}}}};
    REQUIRE(FilterVariables(vars, kMaxVariableChars) == vars);
  }

  SECTION("Private names and oversized values are dropped") {
    json vars = {{"_hidden", 1}, {"big", std::string(kMaxVariableChars, 'x')}, {"ok", 2}};
    json kept = FilterVariables(vars, kMaxVariableChars);
    REQUIRE(kept == json{{"ok", 2}});
  }

  SECTION("Non-object input yields nothing") {
    REQUIRE(FilterVariables(json::array({1, 2}), 100) == json::object());
  }

  SECTION("Depth is bounded") {
    json nested = 1;
    for (int i = 0; i < 40; ++i) nested = json::array({nested});
    REQUIRE_FALSE(IsPlainJson(nested));
    REQUIRE(IsPlainJson(json::array({json::array({1})})));
  }
}

TEST_CASE("Envelope application", "[capture]") {
  SECTION("Successful envelope") {
    ExecutionResult result;
    std::string error;
    auto envelope = json::parse(R"({
      "status": "ok", "error": null,
      "images": ["iVBORw0KGgo=", "not base64!"],
      "figures": [{"type": "plotly", "name": "fig", "data": {"data": []}}, {"name": "no type"}],
      "variables": {"result": 4, "_private": 1}
    })");
    REQUIRE(ApplyEnvelope(envelope, result, &error));
    REQUIRE(result.success);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(result.images == std::vector<std::string>{"iVBORw0KGgo="});
    REQUIRE(result.figures.size() == 1);
    REQUIRE(result.figures[0]["name"] == "fig");
    REQUIRE(result.variables == json{{"result", 4}});
  }

  SECTION("Runtime exception keeps artifacts") {
    ExecutionResult result;
    auto envelope = json::parse(R"({
      "status": "error",
      "error": {"kind": "RuntimeException", "type": "ValueError",
                "message": "ValueError: boom", "traceback": "Traceback ..."},
      "images": [], "figures": [], "variables": {"partial": [1, 2]}
    })");
    REQUIRE(ApplyEnvelope(envelope, result));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(result.error->message == "ValueError: boom");
    REQUIRE(result.error->exception_type == "ValueError");
    REQUIRE(result.variables == json{{"partial", {1, 2}}});
  }

  SECTION("Resource exhaustion discards artifacts") {
    ExecutionResult result;
    auto envelope = json::parse(R"({
      "status": "error",
      "error": {"kind": "ResourceExceeded", "type": "MemoryError", "message": "Memory limit exceeded"},
      "variables": {"x": 1}
    })");
    REQUIRE(ApplyEnvelope(envelope, result));
    REQUIRE(result.error_kind() == ErrorKind::kResourceExceeded);
    REQUIRE(result.variables.empty());
  }

  SECTION("Malformed envelopes") {
    ExecutionResult result;
    std::string error;
    REQUIRE_FALSE(ApplyEnvelope(json::array(), result, &error));
    REQUIRE_FALSE(ApplyEnvelope(json{{"status", "maybe"}}, result, &error));
    REQUIRE_FALSE(ApplyEnvelope(json{{"status", "error"}}, result, &error));
    REQUIRE_FALSE(ApplyEnvelope(json::parse(R"({"status": "error", "error": {"kind": "SyntaxError"}})"),
                                result, &error));
    REQUIRE(error == "Result envelope has an unknown error kind");
  }

  SECTION("Artifact policy per kind") {
    REQUIRE(KeepsArtifacts(ErrorKind::kNone));
    REQUIRE(KeepsArtifacts(ErrorKind::kRuntimeException));
    REQUIRE_FALSE(KeepsArtifacts(ErrorKind::kTimeout));
    REQUIRE_FALSE(KeepsArtifacts(ErrorKind::kResourceExceeded));
    REQUIRE_FALSE(KeepsArtifacts(ErrorKind::kCancelled));
  }
}

TEST_CASE("Result wire shape", "[capture]") {
  SECTION("Success") {
    ExecutionResult result;
    result.success = true;
    result.output = "4\n";
    result.execution_time = 0.25;
    result.variables = {{"result", 4}};
    result.timestamp = "2024-01-02T03:04:05.000006Z";

    json j = ToJson(result);
    REQUIRE(j["success"] == true);
    REQUIRE(j["output"] == "4\n");
    REQUIRE(j["error"].is_null());
    REQUIRE(j["execution_time"] == 0.25);
    REQUIRE(j["images"] == json::array());
    REQUIRE(j["figures"] == json::array());
    REQUIRE(j["variables"]["result"] == 4);
    REQUIRE(j.size() == 8);
  }

  SECTION("Validation error carries position and phase") {
    ExecutionError error;
    error.kind = ErrorKind::kForbiddenCallable;
    error.message = "Forbidden function: eval()";
    error.token = "eval";
    error.line = 1;
    error.column = 1;

    json j = ToJson(FailureResult(error));
    REQUIRE(j["success"] == false);
    REQUIRE(j["error"]["kind"] == "ForbiddenCallable");
    REQUIRE(j["error"]["phase"] == "validation");
    REQUIRE(j["error"]["token"] == "eval");
    REQUIRE(j["error"]["line"] == 1);
    REQUIRE_FALSE(j["error"].contains("traceback"));
  }

  SECTION("Parsing the wire shape back") {
    ExecutionError error;
    error.kind = ErrorKind::kRuntimeException;
    error.message = "ZeroDivisionError: division by zero";
    error.exception_type = "ZeroDivisionError";
    error.traceback = "Traceback (most recent call last): ...";
    ExecutionResult original = FailureResult(error, 0.5);
    original.output = "partial\n";
    original.variables = {{"x", 1}};

    ExecutionResult parsed;
    std::string parse_error;
    REQUIRE(ResultFromJson(ToJson(original), parsed, &parse_error));
    REQUIRE_FALSE(parsed.success);
    REQUIRE(parsed.error_kind() == ErrorKind::kRuntimeException);
    REQUIRE(parsed.error->exception_type == "ZeroDivisionError");
    REQUIRE(parsed.output == "partial\n");
    REQUIRE(parsed.variables == json{{"x", 1}});
    REQUIRE(parsed.timestamp == original.timestamp);
  }

  SECTION("Inconsistent or malformed wire data") {
    ExecutionResult parsed;
    std::string error;
    REQUIRE_FALSE(ResultFromJson(json{{"success", true}, {"error", {{"kind", "Timeout"}}}}, parsed, &error));
    REQUIRE(error == "Result success flag disagrees with its error");
    REQUIRE_FALSE(ResultFromJson(json{{"success", false}, {"error", {{"kind", "Bogus"}}}}, parsed, &error));
    REQUIRE(error == "Unknown error kind: Bogus");
    REQUIRE_FALSE(ResultFromJson(json{{"output", "x"}}, parsed, &error));
  }

  SECTION("Timestamps are UTC ISO-8601 with microseconds") {
    static const std::regex iso(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z$)");
    REQUIRE(std::regex_match(UtcTimestamp(), iso));
  }

  SECTION("Error kind phases") {
    REQUIRE(std::string(ErrorPhaseName(PhaseOf(ErrorKind::kSyntaxError))) == "validation");
    REQUIRE(std::string(ErrorPhaseName(PhaseOf(ErrorKind::kInvalidRequest))) == "request");
    REQUIRE(std::string(ErrorPhaseName(PhaseOf(ErrorKind::kTimeout))) == "runtime");
    ErrorKind kind;
    REQUIRE(ParseErrorKind("Cancelled", kind));
    REQUIRE(kind == ErrorKind::kCancelled);
    REQUIRE_FALSE(ParseErrorKind("", kind));
  }
}

TEST_CASE("Harness request", "[capture]") {
  ExecutionContext context;
  context.data_frame = {{"a", {1, 2, 3}}};
  context.values["threshold"] = 2;
  Policy policy = Policy::Default();

  json request = BuildHarnessRequest("print(df)", context, policy);
  REQUIRE(request["code"] == "print(df)");
  REQUIRE(request["df"]["a"].size() == 3);
  REQUIRE(request["values"]["threshold"] == 2);
  REQUIRE_FALSE(request.contains("database"));
  REQUIRE(request["result_fd"] == kResultFd);
  REQUIRE(request["forbidden_modules"].size() == policy.forbidden_modules.size());
  REQUIRE(HarnessSource().find("def _main():") != std::string::npos);
}
