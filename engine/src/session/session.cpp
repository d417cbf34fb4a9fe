#include "session/session.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>

#include <fmt/format.h>

#include "capture/result_json.h"
#include "logging/trace.h"
#include "validator/fences.h"

namespace analysis_sandbox {

namespace {

std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

double MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

bool IsSupportedLanguage(const std::string& language) {
  const std::string lang = Lowercase(Trim(language));
  return lang.empty() || lang == "python" || lang == "py" || lang == "python3";
}

std::vector<CodeUnit> CodeUnitsFromResponse(const std::string& id_prefix,
                                            const std::string& text,
                                            const std::string& analysis_type) {
  std::vector<CodeUnit> units;
  const auto blocks = ExtractCodeBlocks(text);
  for (size_t i = 0; i < blocks.size(); ++i) {
    CodeUnit unit;
    unit.id = fmt::format("{}-{}", id_prefix, i);
    unit.analysis_type = analysis_type;
    unit.code = blocks[i];
    units.push_back(std::move(unit));
  }
  return units;
}

SessionOrchestrator::SessionOrchestrator(const CodeValidator& validator, CodeRunner& runner,
                                         LimitCeilings ceilings)
    : validator_(validator), runner_(runner), ceilings_(ceilings) {}

ExecutionResult SessionOrchestrator::Reject(const TraceContext& ctx, ErrorKind kind,
                                            const std::string& reason,
                                            const std::string& token) const {
  Tracer::LogRejected(ctx, ErrorKindName(kind), reason, token);
  ExecutionError error;
  error.kind = kind;
  error.message = reason;
  error.token = token;
  return FailureResult(std::move(error));
}

ExecutionResult SessionOrchestrator::RunOne(const CodeUnit& unit,
                                            const ExecutionContext& context,
                                            const ExecutionLimits& limits,
                                            const CancellationToken* cancel,
                                            const std::string& session_id,
                                            const OutputCallback& on_output) const {
  const auto start = std::chrono::steady_clock::now();
  const TraceContext ctx{session_id, unit.id, unit.analysis_type};

  try {
    if (!IsSupportedLanguage(unit.language)) {
      return Reject(ctx, ErrorKind::kUnsupportedLanguage,
                    fmt::format("Unsupported language: '{}'", unit.language), unit.language);
    }

    std::string error;
    if (!limits.Validate(ceilings_, &error) || !context.Validate(&error)) {
      return Reject(ctx, ErrorKind::kInvalidRequest, error);
    }

    ValidationVerdict verdict = validator_.Validate(unit.code, ctx);
    if (!verdict.accepted) {
      Tracer::LogRejected(ctx, ErrorKindName(verdict.kind), verdict.reason, verdict.token);
      return FailureResult(verdict.ToError());
    }

    ExecutionResult result;
    if (cancel && cancel->IsCancelled()) {
      result = FailureResult(ErrorKind::kCancelled, "Execution cancelled before start");
    } else {
      Tracer::LogRunStart(ctx, verdict.sanitized_code.size());
      result = runner_.Execute(verdict.sanitized_code, context, limits, cancel, on_output);
    }

    Tracer::LogRunEnd(ctx, MillisSince(start), result.success, ErrorKindName(result.error_kind()),
                      result.error ? result.error->message : "");
    return result;
  } catch (const std::exception& e) {
    const std::string message = fmt::format("Internal error: {}", e.what());
    Tracer::LogError("internal_error", message, {{"unit_id", unit.id}});
    return FailureResult(ErrorKind::kInternalError, message, MillisSince(start) / 1000.0);
  }
}

std::vector<ExecutionResult> SessionOrchestrator::RunAll(const std::vector<CodeUnit>& units,
                                                         const ExecutionContext& context,
                                                         const ExecutionLimits& limits,
                                                         const CancellationToken* cancel,
                                                         const std::string& session_id,
                                                         const OutputCallback& on_output) const {
  std::vector<ExecutionResult> results;
  results.reserve(units.size());
  for (const auto& unit : units) {
    if (cancel && cancel->IsCancelled()) {
      results.push_back(FailureResult(ErrorKind::kCancelled, "Session cancelled before this unit ran"));
      continue;
    }
    results.push_back(RunOne(unit, context, limits, cancel, session_id, on_output));
  }
  return results;
}

std::future<ExecutionResult> SessionOrchestrator::RunOneAsync(
    CodeUnit unit, const ExecutionContext& context, ExecutionLimits limits,
    std::shared_ptr<CancellationToken> cancel, std::string session_id,
    OutputCallback on_output) const {
  return std::async(std::launch::async,
                    [this, unit = std::move(unit), &context, limits, cancel = std::move(cancel),
                     session_id = std::move(session_id), on_output = std::move(on_output)]() {
                      return RunOne(unit, context, limits, cancel.get(), session_id, on_output);
                    });
}

std::future<std::vector<ExecutionResult>> SessionOrchestrator::RunAllAsync(
    std::vector<CodeUnit> units, const ExecutionContext& context, ExecutionLimits limits,
    std::shared_ptr<CancellationToken> cancel, std::string session_id,
    OutputCallback on_output) const {
  return std::async(std::launch::async,
                    [this, units = std::move(units), &context, limits, cancel = std::move(cancel),
                     session_id = std::move(session_id), on_output = std::move(on_output)]() {
                      return RunAll(units, context, limits, cancel.get(), session_id, on_output);
                    });
}

ValidationVerdict SessionOrchestrator::ValidateOnly(const CodeUnit& unit,
                                                    const std::string& session_id) const {
  const TraceContext ctx{session_id, unit.id, unit.analysis_type};
  if (!IsSupportedLanguage(unit.language)) {
    return ValidationVerdict::Rejected(ErrorKind::kUnsupportedLanguage,
                                       fmt::format("Unsupported language: '{}'", unit.language),
                                       unit.language);
  }
  return validator_.Validate(unit.code, ctx);
}

}  // namespace analysis_sandbox
