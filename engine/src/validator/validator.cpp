#include "validator/validator.h"

#include <algorithm>
#include <cctype>
#include <set>

#include <fmt/format.h>

#include "syntax/parser.h"
#include "validator/fences.h"

namespace analysis_sandbox {

namespace {

SourcePos OffsetToPos(const std::string& text, size_t offset) {
  SourcePos pos{1, 1};
  for (size_t i = 0; i < offset && i < text.size(); ++i) {
    if (text[i] == '\n') {
      pos.line++;
      pos.column = 1;
    } else {
      pos.column++;
    }
  }
  return pos;
}

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t WordEnd(const std::string& text, size_t from) {
  while (from < text.size() && IsWordChar(text[from])) from++;
  return from;
}

// Earliest greedy __word__ match whose name is not a safe dunder
bool FindUnsafeDunder(const std::string& code, const Policy& policy, size_t& at,
                      std::string& name) {
  size_t i = 0;
  while ((i = code.find("__", i)) != std::string::npos) {
    const size_t run_end = WordEnd(code, i);
    size_t end = std::string::npos;
    for (size_t e = run_end; e >= i + 5; --e) {
      if (code[e - 1] == '_' && code[e - 2] == '_') {
        end = e;
        break;
      }
    }
    if (end == std::string::npos) {
      i = run_end;
      continue;
    }
    std::string candidate = code.substr(i, end - i);
    if (!policy.IsSafeDunder(candidate)) {
      at = i;
      name = std::move(candidate);
      return true;
    }
    i = end;
  }
  return false;
}

// Earliest "mod." / "import mod" / "from mod" reference to a textual module
bool FindModuleReference(const std::string& code, const std::set<std::string>& modules,
                         size_t& at, std::string& name) {
  size_t i = 0;
  while (i < code.size()) {
    if (!IsWordChar(code[i])) {
      i++;
      continue;
    }
    const size_t end = WordEnd(code, i);
    const std::string word = code.substr(i, end - i);

    if (modules.count(word)) {
      size_t k = end;
      while (k < code.size() && std::isspace(static_cast<unsigned char>(code[k]))) k++;
      if (k < code.size() && code[k] == '.') {
        at = i;
        name = word;
        return true;
      }
    } else if (word == "import" || word == "from") {
      size_t k = end;
      while (k < code.size() && std::isspace(static_cast<unsigned char>(code[k]))) k++;
      if (k > end && k < code.size() && IsWordChar(code[k])) {
        const std::string next = code.substr(k, WordEnd(code, k) - k);
        if (modules.count(next)) {
          at = i;
          name = next;
          return true;
        }
      }
    }
    i = end;
  }
  return false;
}

nlohmann::json WarningFields(const TraceContext& ctx) {
  nlohmann::json fields = nlohmann::json::object();
  if (!ctx.session_id.empty()) {
    fields["session_id"] = ctx.session_id;
  }
  if (!ctx.unit_id.empty()) {
    fields["unit_id"] = ctx.unit_id;
  }
  return fields;
}

}  // namespace

ValidationVerdict ValidationVerdict::Accepted(std::string code) {
  ValidationVerdict v;
  v.accepted = true;
  v.sanitized_code = std::move(code);
  return v;
}

ValidationVerdict ValidationVerdict::Rejected(ErrorKind kind, std::string reason, std::string token,
                                              int line, int column) {
  ValidationVerdict v;
  v.accepted = false;
  v.kind = kind;
  v.reason = std::move(reason);
  v.token = std::move(token);
  v.line = line;
  v.column = column;
  return v;
}

ExecutionError ValidationVerdict::ToError() const {
  ExecutionError error;
  error.kind = kind;
  error.message = reason;
  error.token = token;
  error.line = line;
  error.column = column;
  return error;
}

CodeValidator::CodeValidator(const Policy& policy, size_t max_code_bytes)
    : policy_(policy), max_code_bytes_(max_code_bytes) {}

ValidationVerdict CodeValidator::Validate(const std::string& code, const TraceContext& ctx) const {
  // Gate 0: size, then fences and surrounding whitespace
  if (code.size() > max_code_bytes_) {
    return ValidationVerdict::Rejected(
        ErrorKind::kInputTooLarge,
        fmt::format("Code exceeds maximum size of {} bytes", max_code_bytes_));
  }
  std::string sanitized = Sanitize(code);

  // Gate 1: empty
  if (sanitized.empty()) {
    return ValidationVerdict::Rejected(ErrorKind::kEmptyInput, "Code is empty");
  }

  // Gate 2: textual patterns
  ValidationVerdict verdict;
  if (!CheckPatterns(sanitized, verdict)) {
    return verdict;
  }

  // Gate 3: parse
  SyntaxNode tree;
  SyntaxErrorInfo syntax_error;
  if (!ParseModule(sanitized, tree, &syntax_error)) {
    return ValidationVerdict::Rejected(
        ErrorKind::kSyntaxError, fmt::format("Syntax error: {}", syntax_error.ToString()), "",
        syntax_error.line, syntax_error.column);
  }

  // Gate 4: tree walk
  std::vector<std::string> warnings;
  if (!CheckTree(tree, verdict, warnings, ctx)) {
    return verdict;
  }

  // Soft check: context reference
  CheckContextReference(tree, warnings, ctx);

  ValidationVerdict accepted = ValidationVerdict::Accepted(std::move(sanitized));
  accepted.warnings = std::move(warnings);
  return accepted;
}

bool CodeValidator::CheckPatterns(const std::string& code, ValidationVerdict& out) const {
  size_t dunder_at = std::string::npos;
  std::string dunder;
  FindUnsafeDunder(code, policy_, dunder_at, dunder);

  size_t module_at = std::string::npos;
  std::string module;
  FindModuleReference(code, policy_.textual_modules, module_at, module);

  if (dunder_at == std::string::npos && module_at == std::string::npos) {
    return true;
  }
  if (dunder_at < module_at) {
    SourcePos pos = OffsetToPos(code, dunder_at);
    out = ValidationVerdict::Rejected(ErrorKind::kDangerousPattern,
                                      "Forbidden dunder method detected: " + dunder, dunder,
                                      pos.line, pos.column);
  } else {
    SourcePos pos = OffsetToPos(code, module_at);
    out = ValidationVerdict::Rejected(ErrorKind::kForbiddenModule,
                                      "Forbidden module reference: " + module, module,
                                      pos.line, pos.column);
  }
  return false;
}

bool CodeValidator::CheckTree(const SyntaxNode& tree, ValidationVerdict& out,
                              std::vector<std::string>& warnings, const TraceContext& ctx) const {
  auto check_module = [&](const std::string& dotted, SourcePos pos) {
    const std::string top = TopLevelModule(dotted);
    if (policy_.IsForbiddenModule(top)) {
      out = ValidationVerdict::Rejected(ErrorKind::kForbiddenModule,
                                        "Forbidden module import: " + top, top, pos.line,
                                        pos.column);
      return false;
    }
    if (!policy_.IsAllowedModule(top)) {
      std::string message = "Unrecognized module import: " + top;
      nlohmann::json fields = WarningFields(ctx);
      fields["module"] = top;
      Tracer::LogWarning("unknown_import", message, std::move(fields));
      warnings.push_back(std::move(message));
    }
    return true;
  };

  bool ok = Walk(tree, [&](const SyntaxNode& node) -> bool {
    if (auto* call = std::get_if<std::unique_ptr<CallNode>>(&node)) {
      if (auto* name = std::get_if<NameNode>(&(*call)->func)) {
        if (policy_.IsForbiddenCallable(name->id)) {
          out = ValidationVerdict::Rejected(ErrorKind::kForbiddenCallable,
                                            fmt::format("Forbidden function: {}()", name->id),
                                            name->id, name->pos.line, name->pos.column);
          return false;
        }
      }
    } else if (auto* imp = std::get_if<std::unique_ptr<ImportNode>>(&node)) {
      for (const auto& alias : (*imp)->names) {
        if (!check_module(alias.name, (*imp)->pos)) return false;
      }
    } else if (auto* from = std::get_if<std::unique_ptr<ImportFromNode>>(&node)) {
      if (!(*from)->module.empty()) {
        if (!check_module((*from)->module, (*from)->pos)) return false;
      }
    } else if (auto* attr = std::get_if<std::unique_ptr<AttributeNode>>(&node)) {
      if (policy_.IsForbiddenCallable((*attr)->attr)) {
        out = ValidationVerdict::Rejected(ErrorKind::kForbiddenCallable,
                                          "Forbidden attribute access: ." + (*attr)->attr,
                                          (*attr)->attr, (*attr)->pos.line, (*attr)->pos.column);
        return false;
      }
    }
    return true;
  });
  return ok;
}

void CodeValidator::CheckContextReference(const SyntaxNode& tree,
                                          std::vector<std::string>& warnings,
                                          const TraceContext& ctx) const {
  if (policy_.context_name.empty()) {
    return;
  }
  bool found = false;
  Walk(tree, [&](const SyntaxNode& node) {
    auto* name = std::get_if<NameNode>(&node);
    if (name && name->id == policy_.context_name) {
      found = true;
      return false;
    }
    return true;
  });

  if (!found) {
    std::string message = fmt::format("Code doesn't reference '{}' variable", policy_.context_name);
    Tracer::LogWarning("context_not_referenced", message, WarningFields(ctx));
    warnings.push_back(std::move(message));
  }
}

std::vector<std::string> CodeValidator::CollectImports(const std::string& code) const {
  std::vector<std::string> modules;
  SyntaxNode tree;
  if (!ParseModule(Sanitize(code), tree)) {
    return modules;
  }

  auto add = [&modules](const std::string& dotted) {
    std::string top = TopLevelModule(dotted);
    if (std::find(modules.begin(), modules.end(), top) == modules.end()) {
      modules.push_back(std::move(top));
    }
  };
  Walk(tree, [&](const SyntaxNode& node) {
    if (auto* imp = std::get_if<std::unique_ptr<ImportNode>>(&node)) {
      for (const auto& alias : (*imp)->names) add(alias.name);
    } else if (auto* from = std::get_if<std::unique_ptr<ImportFromNode>>(&node)) {
      if (!(*from)->module.empty()) add((*from)->module);
    }
    return true;
  });
  return modules;
}

}  // namespace analysis_sandbox
