#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sandbox/types.h"

namespace analysis_sandbox {

/**
 * Serialize a result to its wire shape:
 *   {success, output, error, execution_time, images, figures, variables, timestamp}
 * error is null or {kind, phase, message, token?, line?, column?,
 * exception_type?, traceback?}.
 */
nlohmann::json ToJson(const ExecutionResult& result);
nlohmann::json ToJson(const ExecutionError& error);

/**
 * Parse the wire shape back into a result.
 */
bool ResultFromJson(const nlohmann::json& j, ExecutionResult& out, std::string* error_out = nullptr);

/**
 * Current UTC time, ISO-8601 with microseconds ("2024-01-02T03:04:05.123456Z").
 */
std::string UtcTimestamp();

/**
 * A failed, timestamped result carrying only an error.
 */
ExecutionResult FailureResult(ErrorKind kind, std::string message, double execution_time = 0.0);
ExecutionResult FailureResult(ExecutionError error, double execution_time = 0.0);

}  // namespace analysis_sandbox
