#include "sandbox/types.h"

#include <algorithm>
#include <filesystem>
#include <regex>

#include <fmt/format.h>

namespace analysis_sandbox {

namespace {

struct KindInfo {
  ErrorKind kind;
  const char* name;
  ErrorPhase phase;
};

const KindInfo kKinds[] = {
    {ErrorKind::kNone, "", ErrorPhase::kNone},
    {ErrorKind::kEmptyInput, "EmptyInput", ErrorPhase::kValidation},
    {ErrorKind::kInputTooLarge, "InputTooLarge", ErrorPhase::kValidation},
    {ErrorKind::kUnsupportedLanguage, "UnsupportedLanguage", ErrorPhase::kValidation},
    {ErrorKind::kSyntaxError, "SyntaxError", ErrorPhase::kValidation},
    {ErrorKind::kForbiddenCallable, "ForbiddenCallable", ErrorPhase::kValidation},
    {ErrorKind::kForbiddenModule, "ForbiddenModule", ErrorPhase::kValidation},
    {ErrorKind::kDangerousPattern, "DangerousPattern", ErrorPhase::kValidation},
    {ErrorKind::kInvalidRequest, "InvalidRequest", ErrorPhase::kRequest},
    {ErrorKind::kRuntimeException, "RuntimeException", ErrorPhase::kRuntime},
    {ErrorKind::kTimeout, "Timeout", ErrorPhase::kRuntime},
    {ErrorKind::kResourceExceeded, "ResourceExceeded", ErrorPhase::kRuntime},
    {ErrorKind::kCancelled, "Cancelled", ErrorPhase::kRuntime},
    {ErrorKind::kInternalError, "InternalError", ErrorPhase::kRuntime},
};

bool IsBindingName(const std::string& name) {
  static const std::regex identifier("^[A-Za-z][A-Za-z0-9_]*$");
  return std::regex_match(name, identifier);
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  for (const auto& info : kKinds) {
    if (info.kind == kind) return info.name;
  }
  return "";
}

bool ParseErrorKind(const std::string& name, ErrorKind& out) {
  for (const auto& info : kKinds) {
    if (info.kind != ErrorKind::kNone && name == info.name) {
      out = info.kind;
      return true;
    }
  }
  return false;
}

ErrorPhase PhaseOf(ErrorKind kind) {
  for (const auto& info : kKinds) {
    if (info.kind == kind) return info.phase;
  }
  return ErrorPhase::kNone;
}

const char* ErrorPhaseName(ErrorPhase phase) {
  switch (phase) {
    case ErrorPhase::kValidation: return "validation";
    case ErrorPhase::kRequest: return "request";
    case ErrorPhase::kRuntime: return "runtime";
    case ErrorPhase::kNone: break;
  }
  return "";
}

bool ExecutionLimits::Validate(const LimitCeilings& ceilings, std::string* error_out) const {
  if (timeout_seconds <= 0) {
    if (error_out) *error_out = fmt::format("timeout_seconds must be positive, got {}", timeout_seconds);
    return false;
  }
  if (timeout_seconds > ceilings.max_timeout_seconds) {
    if (error_out) {
      *error_out = fmt::format("timeout_seconds {} exceeds the maximum of {}",
                               timeout_seconds, ceilings.max_timeout_seconds);
    }
    return false;
  }
  const int min_memory_mb = std::max(ceilings.min_memory_mb, kMemoryFloorMb);
  if (max_memory_mb < min_memory_mb) {
    if (error_out) {
      *error_out = fmt::format("max_memory_mb {} is below the minimum of {}",
                               max_memory_mb, min_memory_mb);
    }
    return false;
  }
  if (max_memory_mb > ceilings.max_memory_mb) {
    if (error_out) {
      *error_out = fmt::format("max_memory_mb {} exceeds the maximum of {}",
                               max_memory_mb, ceilings.max_memory_mb);
    }
    return false;
  }
  return true;
}

bool ExecutionContext::Validate(std::string* error_out) const {
  if (data_frame.is_null()) {
    if (error_out) *error_out = "ExecutionContext requires a data frame bound to 'df'";
    return false;
  }

  if (data_frame.is_object()) {
    // Columnar: every column is an array of the same length
    std::optional<size_t> rows;
    for (const auto& [name, column] : data_frame.items()) {
      if (!column.is_array()) {
        if (error_out) *error_out = fmt::format("Data frame column '{}' must be an array", name);
        return false;
      }
      if (rows && *rows != column.size()) {
        if (error_out) {
          *error_out = fmt::format("Data frame column '{}' has {} rows, expected {}",
                                   name, column.size(), *rows);
        }
        return false;
      }
      rows = column.size();
    }
  } else if (data_frame.is_array()) {
    for (const auto& record : data_frame) {
      if (!record.is_object()) {
        if (error_out) *error_out = "Data frame records must be JSON objects";
        return false;
      }
    }
  } else {
    if (error_out) *error_out = "Data frame must be a columnar object or an array of records";
    return false;
  }

  for (const auto& [name, value] : values) {
    if (!IsBindingName(name)) {
      if (error_out) *error_out = fmt::format("Invalid binding name: '{}'", name);
      return false;
    }
    if (name == "df" || name == "db") {
      if (error_out) *error_out = fmt::format("Binding name '{}' is reserved", name);
      return false;
    }
  }

  if (!database_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(database_path, ec)) {
      if (error_out) *error_out = "Database file not found: " + database_path;
      return false;
    }
  }
  return true;
}

std::vector<std::string> ExecutionContext::BindingNames() const {
  std::vector<std::string> names = {"df"};
  if (!database_path.empty()) {
    names.push_back("db");
  }
  for (const auto& [name, value] : values) {
    names.push_back(name);
  }
  return names;
}

}  // namespace analysis_sandbox
