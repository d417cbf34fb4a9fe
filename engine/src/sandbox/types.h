#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace analysis_sandbox {

/**
 * Error kinds, across all phases.
 */
enum class ErrorKind {
  kNone,
  // Validation
  kEmptyInput,
  kInputTooLarge,
  kUnsupportedLanguage,
  kSyntaxError,
  kForbiddenCallable,
  kForbiddenModule,
  kDangerousPattern,
  // Request
  kInvalidRequest,
  // Runtime
  kRuntimeException,
  kTimeout,
  kResourceExceeded,
  kCancelled,
  kInternalError,
};

enum class ErrorPhase {
  kNone,
  kValidation,
  kRequest,
  kRuntime,
};

// Wire name, e.g. "ForbiddenCallable"
const char* ErrorKindName(ErrorKind kind);
bool ParseErrorKind(const std::string& name, ErrorKind& out);

ErrorPhase PhaseOf(ErrorKind kind);
const char* ErrorPhaseName(ErrorPhase phase);

/**
 * Structured error attached to a failed result.
 * Position fields are 0 when unknown.
 */
struct ExecutionError {
  ErrorKind kind = ErrorKind::kInternalError;
  std::string message;
  std::string token;           // Violating name (validation errors)
  int line = 0;
  int column = 0;
  std::string exception_type;  // RuntimeException only
  std::string traceback;       // RuntimeException only
};

// No worker runs with less memory than this, whatever the ceilings say
constexpr int kMemoryFloorMb = 128;

/**
 * Administrative bounds on caller-supplied limits.
 */
struct LimitCeilings {
  int max_timeout_seconds = 300;
  int min_memory_mb = kMemoryFloorMb;
  int max_memory_mb = 2048;
};

/**
 * Per-run resource limits.
 */
struct ExecutionLimits {
  int timeout_seconds = 30;
  int max_memory_mb = 512;

  bool Validate(const LimitCeilings& ceilings, std::string* error_out = nullptr) const;
};

/**
 * Name bindings injected into a run.
 *
 * The data frame is columnar ({"col": [...]}) or records ([{"col": v}]).
 * Values are bound under their own names. The database, if set, is opened
 * read-only and bound to "db".
 */
struct ExecutionContext {
  nlohmann::json data_frame;
  std::map<std::string, nlohmann::json> values;
  std::string database_path;

  bool Validate(std::string* error_out = nullptr) const;

  // Names the run will see as bindings
  std::vector<std::string> BindingNames() const;
};

/**
 * The single envelope returned for every run.
 */
struct ExecutionResult {
  bool success = false;
  std::string output;
  std::optional<ExecutionError> error;
  double execution_time = 0.0;             // Seconds
  std::vector<std::string> images;         // Base64 PNG
  std::vector<nlohmann::json> figures;     // Chart specifications
  nlohmann::json variables = nlohmann::json::object();
  std::string timestamp;                   // UTC ISO-8601

  ErrorKind error_kind() const { return error ? error->kind : ErrorKind::kNone; }
};

}  // namespace analysis_sandbox
