#pragma once

#include <string>
#include <vector>

#include "logging/trace.h"
#include "policy/policy.h"
#include "sandbox/types.h"
#include "syntax/ast.h"

namespace analysis_sandbox {

/**
 * Outcome of static validation.
 * Accepted verdicts carry the sanitized code; rejected ones carry the kind,
 * a reason, the violating token and its position.
 */
struct ValidationVerdict {
  bool accepted = false;
  std::string sanitized_code;

  ErrorKind kind = ErrorKind::kNone;
  std::string reason;
  std::string token;
  int line = 0;
  int column = 0;

  // Non-fatal findings (unknown imports, missing context reference)
  std::vector<std::string> warnings;

  static ValidationVerdict Accepted(std::string code);
  static ValidationVerdict Rejected(ErrorKind kind, std::string reason, std::string token = "",
                                    int line = 0, int column = 0);

  ExecutionError ToError() const;
};

/**
 * Code validator - rejects unsafe or malformed code before it can run.
 *
 * Gates, each short-circuiting: size, emptiness, pattern scan, parse,
 * tree walk. A final soft check warns when the context name is never
 * referenced. Validate is pure apart from logging.
 */
class CodeValidator {
 public:
  static constexpr size_t kDefaultMaxCodeBytes = 100000;

  // The policy must outlive the validator
  explicit CodeValidator(const Policy& policy, size_t max_code_bytes = kDefaultMaxCodeBytes);

  ValidationVerdict Validate(const std::string& code, const TraceContext& ctx = {}) const;

  /**
   * Top-level modules imported by the code, in first-seen order.
   * Empty if the code does not parse.
   */
  std::vector<std::string> CollectImports(const std::string& code) const;

  const Policy& policy() const { return policy_; }

 private:
  bool CheckPatterns(const std::string& code, ValidationVerdict& out) const;
  bool CheckTree(const SyntaxNode& tree, ValidationVerdict& out,
                 std::vector<std::string>& warnings, const TraceContext& ctx) const;
  void CheckContextReference(const SyntaxNode& tree, std::vector<std::string>& warnings,
                             const TraceContext& ctx) const;

  const Policy& policy_;
  size_t max_code_bytes_;
};

}  // namespace analysis_sandbox
