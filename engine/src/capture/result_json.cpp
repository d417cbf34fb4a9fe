#include "capture/result_json.h"

#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace analysis_sandbox {

nlohmann::json ToJson(const ExecutionError& error) {
  nlohmann::json j;
  j["kind"] = ErrorKindName(error.kind);
  j["phase"] = ErrorPhaseName(PhaseOf(error.kind));
  j["message"] = error.message;
  if (!error.token.empty()) {
    j["token"] = error.token;
  }
  if (error.line > 0) {
    j["line"] = error.line;
    j["column"] = error.column;
  }
  if (!error.exception_type.empty()) {
    j["exception_type"] = error.exception_type;
  }
  if (!error.traceback.empty()) {
    j["traceback"] = error.traceback;
  }
  return j;
}

nlohmann::json ToJson(const ExecutionResult& result) {
  nlohmann::json j;
  j["success"] = result.success;
  j["output"] = result.output;
  j["error"] = result.error ? ToJson(*result.error) : nlohmann::json(nullptr);
  j["execution_time"] = result.execution_time;
  j["images"] = result.images;
  j["figures"] = result.figures;
  j["variables"] = result.variables.is_object() ? result.variables : nlohmann::json::object();
  j["timestamp"] = result.timestamp;
  return j;
}

bool ResultFromJson(const nlohmann::json& j, ExecutionResult& out, std::string* error_out) {
  try {
    if (!j.is_object()) {
      if (error_out) *error_out = "Result must be a JSON object";
      return false;
    }

    ExecutionResult result;
    result.success = j.at("success").get<bool>();
    result.output = j.value("output", "");
    result.execution_time = j.value("execution_time", 0.0);
    result.timestamp = j.value("timestamp", "");

    const auto& error = j.at("error");
    if (!error.is_null()) {
      ExecutionError parsed;
      const std::string kind = error.at("kind").get<std::string>();
      if (!ParseErrorKind(kind, parsed.kind)) {
        if (error_out) *error_out = "Unknown error kind: " + kind;
        return false;
      }
      parsed.message = error.value("message", "");
      parsed.token = error.value("token", "");
      parsed.line = error.value("line", 0);
      parsed.column = error.value("column", 0);
      parsed.exception_type = error.value("exception_type", "");
      parsed.traceback = error.value("traceback", "");
      result.error = std::move(parsed);
    }
    if (result.success == result.error.has_value()) {
      if (error_out) *error_out = "Result success flag disagrees with its error";
      return false;
    }

    if (j.contains("images")) {
      result.images = j["images"].get<std::vector<std::string>>();
    }
    if (j.contains("figures")) {
      result.figures = j["figures"].get<std::vector<nlohmann::json>>();
    }
    if (j.contains("variables")) {
      if (!j["variables"].is_object()) {
        if (error_out) *error_out = "Result variables must be an object";
        return false;
      }
      result.variables = j["variables"];
    }

    out = std::move(result);
    return true;
  } catch (const nlohmann::json::exception& e) {
    if (error_out) *error_out = std::string("Invalid result JSON: ") + e.what();
    return false;
  }
}

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          now.time_since_epoch()).count() % 1000000;
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", utc, micros);
}

ExecutionResult FailureResult(ExecutionError error, double execution_time) {
  ExecutionResult result;
  result.success = false;
  result.error = std::move(error);
  result.execution_time = execution_time;
  result.timestamp = UtcTimestamp();
  return result;
}

ExecutionResult FailureResult(ErrorKind kind, std::string message, double execution_time) {
  ExecutionError error;
  error.kind = kind;
  error.message = std::move(message);
  return FailureResult(std::move(error), execution_time);
}

}  // namespace analysis_sandbox
