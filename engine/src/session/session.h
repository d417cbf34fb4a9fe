#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/cancellation.h"
#include "sandbox/code_runner.h"
#include "sandbox/types.h"
#include "validator/validator.h"

namespace analysis_sandbox {

/**
 * One candidate piece of code plus its metadata.
 */
struct CodeUnit {
  std::string id;
  std::string language = "python";
  std::string analysis_type;  // Informational, logged only
  std::string code;           // Raw text, possibly fenced
};

/**
 * Whether a language tag names the supported language
 * ("python", "py", "python3", or empty; case-insensitive).
 */
bool IsSupportedLanguage(const std::string& language);

/**
 * Split a generated response into one unit per fenced block.
 * Ids are "<id_prefix>-0", "<id_prefix>-1", ...
 */
std::vector<CodeUnit> CodeUnitsFromResponse(const std::string& id_prefix,
                                            const std::string& text,
                                            const std::string& analysis_type = "");

/**
 * SessionOrchestrator - sequences validation and execution.
 *
 * RunOne and RunAll never throw. A rejected unit never reaches the runner.
 * The validator and runner must outlive the orchestrator.
 */
class SessionOrchestrator {
 public:
  SessionOrchestrator(const CodeValidator& validator, CodeRunner& runner,
                      LimitCeilings ceilings = {});

  ExecutionResult RunOne(const CodeUnit& unit,
                         const ExecutionContext& context,
                         const ExecutionLimits& limits,
                         const CancellationToken* cancel = nullptr,
                         const std::string& session_id = "",
                         const OutputCallback& on_output = nullptr) const;

  /**
   * Run units strictly in order, one result per unit. A failed unit does not
   * stop the sequence; once cancelled, the remaining units are not run.
   */
  std::vector<ExecutionResult> RunAll(const std::vector<CodeUnit>& units,
                                      const ExecutionContext& context,
                                      const ExecutionLimits& limits,
                                      const CancellationToken* cancel = nullptr,
                                      const std::string& session_id = "",
                                      const OutputCallback& on_output = nullptr) const;

  /**
   * Asynchronous variants. The context must stay alive until the future
   * resolves; on_output then runs on the worker thread.
   */
  std::future<ExecutionResult> RunOneAsync(CodeUnit unit,
                                           const ExecutionContext& context,
                                           ExecutionLimits limits,
                                           std::shared_ptr<CancellationToken> cancel = nullptr,
                                           std::string session_id = "",
                                           OutputCallback on_output = nullptr) const;

  std::future<std::vector<ExecutionResult>> RunAllAsync(
      std::vector<CodeUnit> units,
      const ExecutionContext& context,
      ExecutionLimits limits,
      std::shared_ptr<CancellationToken> cancel = nullptr,
      std::string session_id = "",
      OutputCallback on_output = nullptr) const;

  /**
   * Validate without running.
   */
  ValidationVerdict ValidateOnly(const CodeUnit& unit, const std::string& session_id = "") const;

  const LimitCeilings& ceilings() const { return ceilings_; }

 private:
  ExecutionResult Reject(const TraceContext& ctx, ErrorKind kind, const std::string& reason,
                         const std::string& token = "") const;

  const CodeValidator& validator_;
  CodeRunner& runner_;
  LimitCeilings ceilings_;
};

}  // namespace analysis_sandbox
